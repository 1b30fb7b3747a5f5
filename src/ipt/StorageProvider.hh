/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the image_porter
	distribution for more details.
*/

//
// Created by nestal on 5/12/2021.
//

#pragma once

#include "ObjectID.hh"
#include "UserID.hh"

#include "crypto/Credentials.hh"
#include "util/Timestamp.hh"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ipt {

/// The closed set of remote storage systems.
enum class ProviderType
{
	object_store,   ///< S3 compatible object storage
	blob_store,     ///< Azure blob storage
	cloud_bucket,   ///< Google cloud storage
	file_transfer   ///< SFTP server
};

/// Accepts both "object-store" and its wire name "s3", etc.
std::optional<ProviderType> parse_provider_type(std::string_view name);
const char* to_string(ProviderType type);
const char* wire_name(ProviderType type);

/// Keys that must be present in the configuration and credentials of a type.
struct RequiredSettings
{
	std::vector<std::string> config;
	std::vector<std::string> credentials;
};
const RequiredSettings& required_settings(ProviderType type);

/// A remote storage destination of a user.
///
/// The credentials are kept encrypted by the CredentialVault. Only the backend
/// decrypts them, and only for the duration of a call to the remote system.
struct StorageProvider
{
	ObjectID        id;
	UserID          owner;
	std::string     name;
	ProviderType    type{ProviderType::object_store};
	nlohmann::json  config = nlohmann::json::object();

	/// Empty if no credentials are attached.
	std::vector<unsigned char> encrypted_credentials;

	bool            is_default{false};
	bool            is_active{true};
	Timestamp       created;
	Timestamp       updated;

	[[nodiscard]] bool has_credentials() const {return !encrypted_credentials.empty();}

	/// String value of a configuration key, or empty if absent. Numbers are
	/// converted to strings.
	[[nodiscard]] std::string config_value(const std::string& key) const;
};

/// The JSON representation never contains the credentials, not even encrypted.
void to_json(nlohmann::json& dest, const StorageProvider& src);

/// \return the first key in \a required that is missing or empty in \a config
std::optional<std::string> missing_config(const nlohmann::json& config, const std::vector<std::string>& required);
std::optional<std::string> missing_credentials(const Credentials& cred, const std::vector<std::string>& required);

} // end of namespace ipt
