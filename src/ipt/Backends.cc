/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the image_porter
	distribution for more details.
*/

//
// Created by nestal on 9/12/2021.
//

#include "StorageBackend.hh"

#include "util/Log.hh"

#include <boost/algorithm/string/trim.hpp>

#include <charconv>

namespace ipt {
namespace {

std::string trim_slash(std::string s)
{
	boost::algorithm::trim_if(s, [](char c){return c == '/';});
	return s;
}

class ObjectStoreBackend : public StorageBackend
{
public:
	using StorageBackend::StorageBackend;

protected:
	std::unique_ptr<RemoteClient> connect(const Credentials& cred, ClientFactory& factory, std::error_code& ec) const override
	{
		S3Params params{
			provider().config_value("bucket"),
			provider().config_value("region"),
			provider().config_value("endpoint_url"),
			cred.value("access_key_id"),
			cred.value("secret_access_key")
		};
		return factory.connect(params, ec);
	}

	std::string url(const std::string& path, const Credentials&) const override
	{
		auto bucket   = provider().config_value("bucket");
		auto endpoint = trim_slash(provider().config_value("endpoint_url"));

		// S3 compatible storage other than AWS uses path-style URLs
		return endpoint.empty() ?
			"https://" + bucket + ".s3." + provider().config_value("region") + ".amazonaws.com/" + path :
			endpoint + "/" + bucket + "/" + path;
	}
};

class BlobStoreBackend : public StorageBackend
{
public:
	using StorageBackend::StorageBackend;

protected:
	std::unique_ptr<RemoteClient> connect(const Credentials& cred, ClientFactory& factory, std::error_code& ec) const override
	{
		AzureParams params{
			cred.value("account_name"),
			cred.value("account_key"),
			provider().config_value("container")
		};
		return factory.connect(params, ec);
	}

	std::string url(const std::string& path, const Credentials& cred) const override
	{
		return "https://" + cred.value("account_name") + ".blob.core.windows.net/" +
			provider().config_value("container") + "/" + path;
	}
};

class CloudBucketBackend : public StorageBackend
{
public:
	using StorageBackend::StorageBackend;

protected:
	std::unique_ptr<RemoteClient> connect(const Credentials& cred, ClientFactory& factory, std::error_code& ec) const override
	{
		GCSParams params{
			provider().config_value("bucket"),
			provider().config_value("project_id"),
			cred.value("credentials_json")
		};
		return factory.connect(params, ec);
	}

	std::string url(const std::string& path, const Credentials&) const override
	{
		return "https://storage.googleapis.com/" + provider().config_value("bucket") + "/" + path;
	}
};

class FileTransferBackend : public StorageBackend
{
public:
	using StorageBackend::StorageBackend;

protected:
	std::unique_ptr<RemoteClient> connect(const Credentials& cred, ClientFactory& factory, std::error_code& ec) const override
	{
		SFTPParams params;
		params.host         = cred.value("host");
		params.username     = cred.value("username");
		params.password     = cred.value("password");
		params.private_key  = cred.value("private_key");
		params.remote_path  = provider().config_value("remote_path");

		auto port = provider().config_value("port");
		if (!port.empty())
		{
			auto [end, err] = std::from_chars(port.data(), port.data() + port.size(), params.port);
			if (err != std::errc{} || end != port.data() + port.size() || params.port <= 0 || params.port > 65535)
			{
				Log(LOG_WARNING, "invalid port \"%1%\" for provider %2%, using 22", port, provider().id);
				params.port = 22;
			}
		}
		return factory.connect(params, ec);
	}

	std::string url(const std::string& path, const Credentials& cred) const override
	{
		auto remote = trim_slash(provider().config_value("remote_path"));
		return "sftp://" + cred.value("host") + "/" + (remote.empty() ? path : remote + "/" + path);
	}
};

} // end of local namespace

std::unique_ptr<StorageBackend> make_backend(
	const StorageProvider& provider,
	const CredentialVault& vault,
	ClientFactory& factory
)
{
	switch (provider.type)
	{
		case ProviderType::object_store:    return std::make_unique<ObjectStoreBackend>(provider, vault, factory);
		case ProviderType::blob_store:      return std::make_unique<BlobStoreBackend>(provider, vault, factory);
		case ProviderType::cloud_bucket:    return std::make_unique<CloudBucketBackend>(provider, vault, factory);
		case ProviderType::file_transfer:   return std::make_unique<FileTransferBackend>(provider, vault, factory);
	}
	return {};
}

} // end of namespace ipt
