/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the image_porter
	distribution for more details.
*/

//
// Created by nestal on 10/12/2021.
//

#pragma once

#include "StorageBackend.hh"
#include "StorageProvider.hh"

#include "crypto/Credentials.hh"
#include "util/Configuration.hh"

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace ipt {

class BoundedCall;
class Catalog;
class CredentialVault;

/// Fields of a new provider.
struct ProviderSpec
{
	std::string                 name;
	std::string                 type;   ///< "object-store" or "s3", etc.
	nlohmann::json              config = nlohmann::json::object();
	std::optional<Credentials>  credentials;
	bool                        is_default{false};
	bool                        is_active{true};
};

/// Fields to change in a provider. Empty credentials remove the credentials
/// of the provider.
struct ProviderUpdate
{
	std::optional<std::string>      name;
	std::optional<std::string>      type;
	std::optional<nlohmann::json>   config;
	std::optional<Credentials>      credentials;
	std::optional<bool>             is_default;
	std::optional<bool>             is_active;
};

/// Manages the storage providers of the users.
///
/// Credentials are encrypted before they reach the Catalog and are never
/// returned. All operations take the user who makes the request: providers
/// of other users are reported as Error::provider_not_found.
class ProviderRegistry
{
public:
	ProviderRegistry(
		Catalog& catalog,
		const CredentialVault& vault,
		ClientFactory& factory,
		BoundedCall& remote,
		ProviderDeletePolicy policy = ProviderDeletePolicy::block
	);

	StorageProvider create(const UserID& user, const ProviderSpec& spec, std::error_code& ec);
	StorageProvider update(const UserID& user, const ObjectID& id, const ProviderUpdate& update, std::error_code& ec);

	/// Atomic with respect to other set_default() calls of the same user.
	StorageProvider set_default(const UserID& user, const ObjectID& id, std::error_code& ec);

	/// Deactivating the default provider leaves the user without a default.
	StorageProvider set_active(const UserID& user, const ObjectID& id, bool active, std::error_code& ec);

	/// Checks the remote storage of the provider. Nothing is written to the
	/// Catalog. Failure to connect is reported in the result, not in \a ec.
	ConnectionTest test_connection(const UserID& user, const ObjectID& id, std::error_code& ec);

	/// \return number of images detached from the provider
	std::size_t remove(const UserID& user, const ObjectID& id, std::error_code& ec);

	std::optional<StorageProvider> find(const UserID& user, const ObjectID& id, std::error_code& ec);
	std::vector<StorageProvider> list(const UserID& user, std::error_code& ec);

	/// Chooses the backend of an upload: the provider \a id if it is given,
	/// otherwise the default provider. Inactive providers are never chosen.
	/// \param ec   Error::provider_not_found or Error::no_usable_provider
	std::unique_ptr<StorageBackend> resolve(const UserID& user, const std::optional<ObjectID>& id, std::error_code& ec);

	/// Backend of a provider regardless of whether it is active, e.g. to
	/// remove the images stored in it.
	[[nodiscard]] std::unique_ptr<StorageBackend> backend(const StorageProvider& provider) const;

	[[nodiscard]] ProviderDeletePolicy delete_policy() const {return m_policy;}

private:
	void validate(const StorageProvider& provider, const Credentials* cred, std::error_code& ec) const;
	StorageProvider load(const UserID& user, const ObjectID& id, std::error_code& ec);

private:
	Catalog&                m_catalog;
	const CredentialVault&  m_vault;
	ClientFactory&          m_factory;
	BoundedCall&            m_remote;
	ProviderDeletePolicy    m_policy;
};

} // end of namespace ipt
