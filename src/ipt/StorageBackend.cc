/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the image_porter
	distribution for more details.
*/

//
// Created by nestal on 8/12/2021.
//

#include "StorageBackend.hh"

#include "crypto/CredentialVault.hh"
#include "crypto/Random.hh"
#include "util/Error.hh"
#include "util/Log.hh"

#include <algorithm>
#include <ctime>

namespace ipt {

void to_json(nlohmann::json& dest, const ConnectionTest& src)
{
	dest = nlohmann::json{
		{"status",  src.success ? "success" : "error"},
		{"message", src.message}
	};
}

StorageBackend::StorageBackend(const StorageProvider& provider, const CredentialVault& vault, ClientFactory& factory) :
	m_provider{provider}, m_vault{vault}, m_factory{factory}
{
}

Credentials StorageBackend::credentials(std::error_code& ec) const
{
	if (!m_provider.has_credentials())
	{
		Log(LOG_NOTICE, "provider %1% has no credentials", m_provider.id);
		ec = Error::provider_credentials;
		return {};
	}

	auto cred = m_vault.decrypt(buffer_view(m_provider.encrypted_credentials), ec);
	if (ec)
	{
		// the reason (e.g. key rotated) is logged, but callers only see that
		// the provider cannot be used with its credentials
		Log(LOG_WARNING, "cannot decrypt credentials of provider %1%: %2%", m_provider.id, ec.message());
		ec = Error::provider_credentials;
		return {};
	}

	if (auto missing = missing_credentials(cred, required_settings(m_provider.type).credentials))
	{
		Log(LOG_WARNING, "credentials of provider %1% has no \"%2%\"", m_provider.id, *missing);
		ec = Error::provider_credentials;
		return {};
	}
	return cred;
}

std::unique_ptr<RemoteClient> StorageBackend::open(std::error_code& ec) const
{
	auto cred = credentials(ec);
	if (ec)
		return {};

	auto client = connect(cred, m_factory, ec);
	if (!ec && !client)
		ec = Error::provider_connection_failed;

	if (ec)
	{
		Log(LOG_WARNING, "cannot connect to provider %1% (%2%): %3%", m_provider.id, to_string(m_provider.type), ec.message());
		return {};
	}
	return client;
}

std::string StorageBackend::upload(BufferView data, const std::string& path, const std::string& content_type, std::error_code& ec)
{
	if (!is_valid_path(path))
	{
		ec = Error::invalid_path;
		return {};
	}

	auto client = open(ec);
	if (ec)
		return {};

	client->put(path, data, content_type, ec);
	if (ec)
	{
		Log(LOG_WARNING, "cannot upload %1% to provider %2%: %3%", path, m_provider.id, ec.message());
		return {};
	}

	Log(LOG_INFO, "uploaded %1% bytes to %2% in provider %3%", data.size(), path, m_provider.id);
	return path;
}

RemoveResult StorageBackend::remove(const std::string& path, std::error_code& ec)
{
	if (!is_valid_path(path))
	{
		ec = Error::invalid_path;
		return RemoveResult::not_found;
	}

	auto client = open(ec);
	if (ec)
		return RemoveResult::not_found;

	auto removed = client->remove(path, ec);
	if (ec)
	{
		Log(LOG_WARNING, "cannot remove %1% from provider %2%: %3%", path, m_provider.id, ec.message());
		return RemoveResult::not_found;
	}
	return removed ? RemoveResult::removed : RemoveResult::not_found;
}

bool StorageBackend::exists(const std::string& path, std::error_code& ec)
{
	if (!is_valid_path(path))
	{
		ec = Error::invalid_path;
		return false;
	}

	auto client = open(ec);
	return client ? client->exists(path, ec) : false;
}

ConnectionTest StorageBackend::test_connection()
{
	std::error_code ec;
	exists(std::string{sentinel}, ec);
	if (ec)
		return {false, "Connection to \"" + m_provider.name + "\" failed: " + ec.message()};
	else
		return {true, "Connection to \"" + m_provider.name + "\" succeeded"};
}

std::string StorageBackend::public_url(const std::string& path, std::error_code& ec) const
{
	auto cred = credentials(ec);
	return ec ? std::string{} : url(path, cred);
}

std::string StorageBackend::sanitize(std::string_view component)
{
	std::string result;
	result.reserve(component.size());
	for (unsigned char c : component)
		result.push_back(c < 0x20 || c == 0x7f || c == '/' || c == '\\' ? '_' : static_cast<char>(c));

	if (result.empty() || result == "." || result == "..")
		result = "_";
	return result;
}

bool StorageBackend::is_valid_path(std::string_view path)
{
	if (path.empty() || path.front() == '/' || path.back() == '/')
		return false;

	while (!path.empty())
	{
		auto seg = path.substr(0, path.find('/'));
		if (seg.empty() || seg == "." || seg == "..")
			return false;
		for (unsigned char c : seg)
			if (c < 0x20 || c == 0x7f || c == '\\')
				return false;

		path.remove_prefix(std::min(seg.size() + 1, path.size()));
	}
	return true;
}

std::string StorageBackend::generate_path(const UserID& user, std::string_view filename, Timestamp now)
{
	// only the last component of the filename sent by the client
	if (auto slash = filename.find_last_of("/\\"); slash != filename.npos)
		filename.remove_prefix(slash + 1);

	auto time = std::chrono::system_clock::to_time_t(
		std::chrono::time_point_cast<std::chrono::system_clock::duration>(now)
	);
	std::tm utc{};
	::gmtime_r(&time, &utc);

	char year_month[16]{}, stamp[32]{};
	std::strftime(year_month, sizeof(year_month), "%Y/%m", &utc);
	std::strftime(stamp, sizeof(stamp), "%Y%m%d_%H%M%S", &utc);

	return sanitize(user.username()) + "/" + year_month + "/" +
		stamp + "_" + insecure_random_hex(4) + "_" + sanitize(filename);
}

} // end of namespace ipt
