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

#include "util/BufferView.hh"

#include <memory>
#include <string>
#include <system_error>

namespace ipt {

// Parameters to connect to each type of remote storage. They are filled
// from the provider configuration and its decrypted credentials right before
// connecting, and go out of scope right after the call.

struct S3Params
{
	std::string bucket;
	std::string region;
	std::string endpoint;       ///< empty for AWS
	std::string access_key_id;
	std::string secret_access_key;
};

struct AzureParams
{
	std::string account_name;
	std::string account_key;
	std::string container;
};

struct GCSParams
{
	std::string bucket;
	std::string project_id;
	std::string credentials_json;   ///< service account key file content
};

struct SFTPParams
{
	std::string host;
	int         port{22};
	std::string username;
	std::string password;
	std::string private_key;
	std::string remote_path;        ///< directory on the server that contains the images
};

/// A connection to a remote storage. Keys are relative paths separated by slashes.
///
/// Implementations report network failures with Error::provider_connection_failed
/// and rejected credentials with Error::provider_credentials.
class RemoteClient
{
public:
	virtual ~RemoteClient() = default;

	/// Stores \a data in \a key, replacing any existing object.
	virtual void put(const std::string& key, BufferView data, const std::string& content_type, std::error_code& ec) = 0;

	/// \return false if \a key does not exist
	virtual bool remove(const std::string& key, std::error_code& ec) = 0;

	virtual bool exists(const std::string& key, std::error_code& ec) = 0;
};

/// Creates connections to remote storage. This is where the protocol client
/// libraries of the remote storage plug in.
class ClientFactory
{
public:
	virtual ~ClientFactory() = default;

	virtual std::unique_ptr<RemoteClient> connect(const S3Params& params, std::error_code& ec) = 0;
	virtual std::unique_ptr<RemoteClient> connect(const AzureParams& params, std::error_code& ec) = 0;
	virtual std::unique_ptr<RemoteClient> connect(const GCSParams& params, std::error_code& ec) = 0;
	virtual std::unique_ptr<RemoteClient> connect(const SFTPParams& params, std::error_code& ec) = 0;
};

} // end of namespace ipt
