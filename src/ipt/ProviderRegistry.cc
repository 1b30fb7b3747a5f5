/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the image_porter
	distribution for more details.
*/

//
// Created by nestal on 10/12/2021.
//

#include "ProviderRegistry.hh"
#include "Catalog.hh"

#include "crypto/CredentialVault.hh"
#include "util/BoundedCall.hh"
#include "util/Error.hh"
#include "util/Log.hh"

#include <boost/algorithm/string/trim.hpp>

namespace ipt {
namespace {

const std::size_t max_name_length = 255;

bool is_valid_name(const std::string& name)
{
	return !name.empty() && name.size() <= max_name_length;
}

} // end of local namespace

ProviderRegistry::ProviderRegistry(
	Catalog& catalog,
	const CredentialVault& vault,
	ClientFactory& factory,
	BoundedCall& remote,
	ProviderDeletePolicy policy
) :
	m_catalog{catalog}, m_vault{vault}, m_factory{factory}, m_remote{remote}, m_policy{policy}
{
}

void ProviderRegistry::validate(const StorageProvider& provider, const Credentials* cred, std::error_code& ec) const
{
	if (!is_valid_name(provider.name))
	{
		ec = Error::invalid_name;
		return;
	}

	if (!provider.config.is_object())
	{
		ec = Error::missing_config;
		return;
	}

	auto& required = required_settings(provider.type);
	if (auto key = missing_config(provider.config, required.config))
	{
		Log(LOG_INFO, "%1% provider \"%2%\" has no \"%3%\" in its configuration", to_string(provider.type), provider.name, *key);
		ec = Error::missing_config;
		return;
	}

	// credentials are optional, but if they are given they must be complete
	if (cred && !cred->empty())
	{
		if (auto key = missing_credentials(*cred, required.credentials))
		{
			Log(LOG_INFO, "%1% provider \"%2%\" has no \"%3%\" in its credentials", to_string(provider.type), provider.name, *key);
			ec = Error::missing_credentials;
			return;
		}
	}

	if (provider.is_default && !provider.is_active)
		ec = Error::provider_inactive;
}

StorageProvider ProviderRegistry::load(const UserID& user, const ObjectID& id, std::error_code& ec)
{
	auto provider = m_catalog.find_provider(user, id, ec);
	if (!ec && !provider)
		ec = Error::provider_not_found;
	return ec ? StorageProvider{} : std::move(*provider);
}

StorageProvider ProviderRegistry::create(const UserID& user, const ProviderSpec& spec, std::error_code& ec)
{
	auto type = parse_provider_type(spec.type);
	if (!type)
	{
		ec = Error::invalid_provider_type;
		return {};
	}

	StorageProvider provider;
	provider.id         = ObjectID::randomize();
	provider.owner      = user;
	provider.name       = boost::algorithm::trim_copy(spec.name);
	provider.type       = *type;
	provider.config     = spec.config;
	provider.is_default = spec.is_default;
	provider.is_active  = spec.is_active;
	provider.created    = provider.updated = Timestamp::now();

	validate(provider, spec.credentials ? &*spec.credentials : nullptr, ec);
	if (ec)
		return {};

	if (spec.credentials && !spec.credentials->empty())
	{
		provider.encrypted_credentials = m_vault.encrypt(*spec.credentials, ec);
		if (ec)
			return {};
	}

	m_catalog.add_provider(provider, ec);
	if (ec)
		return {};

	Log(LOG_INFO, "user %1% created %2% provider %3% \"%4%\"", user, to_string(provider.type), provider.id, provider.name);
	return provider;
}

StorageProvider ProviderRegistry::update(const UserID& user, const ObjectID& id, const ProviderUpdate& update, std::error_code& ec)
{
	auto provider = load(user, id, ec);
	if (ec)
		return {};

	auto type_changed = false;
	if (update.type)
	{
		auto type = parse_provider_type(*update.type);
		if (!type)
		{
			ec = Error::invalid_provider_type;
			return {};
		}
		type_changed = (*type != provider.type);
		provider.type = *type;
	}

	if (update.name)
		provider.name = boost::algorithm::trim_copy(*update.name);
	if (update.config)
		provider.config = *update.config;
	if (update.is_active)
		provider.is_active = *update.is_active;

	// the loaded is_default may be stale: write it only when asked to, or when
	// an inactive provider must lose it
	auto flag = DefaultFlag::keep;
	if (update.is_default)
	{
		provider.is_default = *update.is_default;
		flag = DefaultFlag::replace;
	}
	else if (!provider.is_active)
	{
		provider.is_default = false;
		flag = DefaultFlag::replace;
	}

	// the stored credentials must also fit the new type
	Credentials existing;
	const Credentials* cred = update.credentials ? &*update.credentials : nullptr;
	if (!cred && type_changed && provider.has_credentials())
	{
		existing = m_vault.decrypt(buffer_view(provider.encrypted_credentials), ec);
		if (ec)
			return {};
		cred = &existing;
	}

	validate(provider, cred, ec);
	if (ec)
		return {};

	if (update.credentials)
	{
		provider.encrypted_credentials.clear();
		if (!update.credentials->empty())
		{
			provider.encrypted_credentials = m_vault.encrypt(*update.credentials, ec);
			if (ec)
				return {};
		}
	}

	provider.updated = Timestamp::now();
	auto stored = m_catalog.update_provider(provider, flag, ec);
	if (ec)
		return {};

	Log(LOG_INFO, "user %1% updated provider %2%", user, provider.id);
	return stored;
}

StorageProvider ProviderRegistry::set_default(const UserID& user, const ObjectID& id, std::error_code& ec)
{
	auto provider = m_catalog.set_default(user, id, ec);
	if (!ec)
		Log(LOG_INFO, "user %1% changed default provider to %2%", user, id);
	return provider;
}

StorageProvider ProviderRegistry::set_active(const UserID& user, const ObjectID& id, bool active, std::error_code& ec)
{
	ProviderUpdate change;
	change.is_active = active;
	return update(user, id, change, ec);
}

ConnectionTest ProviderRegistry::test_connection(const UserID& user, const ObjectID& id, std::error_code& ec)
{
	auto provider = load(user, id, ec);
	if (ec)
		return {};

	std::shared_ptr<StorageBackend> backend = this->backend(provider);

	std::error_code call_ec;
	auto result = m_remote.run([backend](std::error_code&)
	{
		return backend->test_connection();
	}, call_ec);

	if (call_ec)
	{
		Log(LOG_WARNING, "connection test of provider %1% failed: %2%", id, call_ec.message());
		result = {false, "Connection to \"" + provider.name + "\" failed: " + call_ec.message()};
	}
	return result;
}

std::size_t ProviderRegistry::remove(const UserID& user, const ObjectID& id, std::error_code& ec)
{
	auto detached = m_catalog.remove_provider(user, id, m_policy, ec);
	if (ec)
		return 0;

	if (detached > 0)
		Log(LOG_NOTICE, "user %1% removed provider %2% and detached %3% images from it", user, id, detached);
	else
		Log(LOG_INFO, "user %1% removed provider %2%", user, id);
	return detached;
}

std::optional<StorageProvider> ProviderRegistry::find(const UserID& user, const ObjectID& id, std::error_code& ec)
{
	return m_catalog.find_provider(user, id, ec);
}

std::vector<StorageProvider> ProviderRegistry::list(const UserID& user, std::error_code& ec)
{
	return m_catalog.list_providers(user, ec);
}

std::unique_ptr<StorageBackend> ProviderRegistry::resolve(const UserID& user, const std::optional<ObjectID>& id, std::error_code& ec)
{
	auto provider = id ? m_catalog.find_provider(user, *id, ec) : m_catalog.find_default(user, ec);
	if (ec)
		return {};

	if (!provider || !provider->is_active)
	{
		ec = id ? Error::provider_not_found : Error::no_usable_provider;
		return {};
	}
	return backend(*provider);
}

std::unique_ptr<StorageBackend> ProviderRegistry::backend(const StorageProvider& provider) const
{
	return make_backend(provider, m_vault, m_factory);
}

} // end of namespace ipt
