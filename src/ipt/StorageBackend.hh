/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the image_porter
	distribution for more details.
*/

//
// Created by nestal on 8/12/2021.
//

#pragma once

#include "RemoteClient.hh"
#include "StorageProvider.hh"

#include "util/BufferView.hh"
#include "util/Timestamp.hh"

#include <nlohmann/json.hpp>

#include <memory>
#include <string>
#include <string_view>
#include <system_error>

namespace ipt {

class CredentialVault;

enum class RemoveResult {removed, not_found};

struct ConnectionTest
{
	bool        success{false};
	std::string message;
};

/// {"status": "success"|"error", "message": "..."}
void to_json(nlohmann::json& dest, const ConnectionTest& src);

/// Uploads and removes objects in the remote storage of a provider.
///
/// The credentials of the provider are decrypted for each call and dropped
/// before the call returns. A backend object keeps a copy of the provider,
/// so it can outlive the call that created it (e.g. a timed-out upload that
/// finishes in the background).
class StorageBackend
{
public:
	/// The key looked up by test_connection(). It is never written.
	static constexpr std::string_view sentinel = ".image_porter-connection-test";

public:
	StorageBackend(const StorageProvider& provider, const CredentialVault& vault, ClientFactory& factory);
	virtual ~StorageBackend() = default;

	StorageBackend(const StorageBackend&) = delete;
	StorageBackend& operator=(const StorageBackend&) = delete;

	/// Stores \a data at \a path. An existing object at the same path is overwritten.
	/// \return the path of the object in the remote storage
	std::string upload(BufferView data, const std::string& path, const std::string& content_type, std::error_code& ec);

	/// RemoveResult::not_found is not an error.
	RemoveResult remove(const std::string& path, std::error_code& ec);

	bool exists(const std::string& path, std::error_code& ec);

	/// Checks whether the remote storage can be reached with the credentials
	/// without changing anything.
	ConnectionTest test_connection();

	/// URL of an object for clients that can access the storage directly.
	std::string public_url(const std::string& path, std::error_code& ec) const;

	[[nodiscard]] const StorageProvider& provider() const {return m_provider;}

	/// `{user}/{YYYY}/{MM}/{YYYYMMDD_HHMMSS}_{8 random hex}_{filename}` in UTC
	static std::string generate_path(const UserID& user, std::string_view filename, Timestamp now);

	/// Makes \a component usable as a single path segment.
	static std::string sanitize(std::string_view component);

	/// Relative paths without "." or ".." segments and control characters.
	static bool is_valid_path(std::string_view path);

protected:
	virtual std::unique_ptr<RemoteClient> connect(const Credentials& cred, ClientFactory& factory, std::error_code& ec) const = 0;
	virtual std::string url(const std::string& path, const Credentials& cred) const = 0;

private:
	Credentials credentials(std::error_code& ec) const;
	std::unique_ptr<RemoteClient> open(std::error_code& ec) const;

private:
	StorageProvider         m_provider;
	const CredentialVault&  m_vault;
	ClientFactory&          m_factory;
};

/// Creates the backend for the type of \a provider.
std::unique_ptr<StorageBackend> make_backend(
	const StorageProvider& provider,
	const CredentialVault& vault,
	ClientFactory& factory
);

} // end of namespace ipt
