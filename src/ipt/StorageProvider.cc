/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the image_porter
	distribution for more details.
*/

//
// Created by nestal on 5/12/2021.
//

#include "StorageProvider.hh"

namespace ipt {

std::optional<ProviderType> parse_provider_type(std::string_view name)
{
	if (name == "object-store" || name == "s3")
		return ProviderType::object_store;
	else if (name == "blob-store" || name == "azure")
		return ProviderType::blob_store;
	else if (name == "cloud-bucket" || name == "gcs")
		return ProviderType::cloud_bucket;
	else if (name == "file-transfer" || name == "sftp")
		return ProviderType::file_transfer;
	else
		return std::nullopt;
}

const char* to_string(ProviderType type)
{
	switch (type)
	{
		case ProviderType::object_store:    return "object-store";
		case ProviderType::blob_store:      return "blob-store";
		case ProviderType::cloud_bucket:    return "cloud-bucket";
		case ProviderType::file_transfer:   return "file-transfer";
	}
	return "unknown";
}

const char* wire_name(ProviderType type)
{
	switch (type)
	{
		case ProviderType::object_store:    return "s3";
		case ProviderType::blob_store:      return "azure";
		case ProviderType::cloud_bucket:    return "gcs";
		case ProviderType::file_transfer:   return "sftp";
	}
	return "unknown";
}

const RequiredSettings& required_settings(ProviderType type)
{
	static const RequiredSettings object_store{{"bucket", "region"}, {"access_key_id", "secret_access_key"}};
	static const RequiredSettings blob_store{{"container"}, {"account_name", "account_key"}};
	static const RequiredSettings cloud_bucket{{"bucket"}, {"credentials_json"}};
	static const RequiredSettings file_transfer{{"remote_path"}, {"host", "username"}};

	switch (type)
	{
		case ProviderType::blob_store:      return blob_store;
		case ProviderType::cloud_bucket:    return cloud_bucket;
		case ProviderType::file_transfer:   return file_transfer;
		default:                            return object_store;
	}
}

std::string StorageProvider::config_value(const std::string& key) const
{
	if (auto it = config.find(key); it != config.end() && !it->is_null())
		return it->is_string() ? it->get<std::string>() : it->dump();
	else
		return {};
}

void to_json(nlohmann::json& dest, const StorageProvider& src)
{
	auto result = nlohmann::json::object();
	result.emplace("id",                src.id);
	result.emplace("owner",             src.owner);
	result.emplace("name",              src.name);
	result.emplace("provider_type",     wire_name(src.type));
	result.emplace("config",            src.config);
	result.emplace("has_credentials",   src.has_credentials());
	result.emplace("is_default",        src.is_default);
	result.emplace("is_active",         src.is_active);
	result.emplace("created",           src.created);
	result.emplace("updated",           src.updated);
	dest = std::move(result);
}

std::optional<std::string> missing_config(const nlohmann::json& config, const std::vector<std::string>& required)
{
	for (auto&& key : required)
	{
		auto it = config.find(key);
		if (it == config.end() || it->is_null() || (it->is_string() && it->get_ref<const std::string&>().empty()))
			return key;
	}
	return std::nullopt;
}

std::optional<std::string> missing_credentials(const Credentials& cred, const std::vector<std::string>& required)
{
	for (auto&& key : required)
	{
		if (cred.value(key).empty())
			return key;
	}
	return std::nullopt;
}

} // end of namespace ipt
