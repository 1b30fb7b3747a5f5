/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the image_porter
    distribution for more details.
*/

//
// Created by nestal on 1/20/18.
//

#include "Error.hh"

#include <string>

namespace ipt {
namespace {

ErrorClass class_of(Error err)
{
	switch (err)
	{
		case Error::ok:
			return ErrorClass::none;

		case Error::invalid_provider_type:
		case Error::invalid_name:
		case Error::duplicate_name:
		case Error::missing_config:
		case Error::missing_credentials:
		case Error::provider_inactive:
		case Error::empty_file:
		case Error::file_too_large:
		case Error::unsupported_content_type:
		case Error::invalid_filename:
		case Error::invalid_tag:
		case Error::invalid_path:
		case Error::invalid_metadata:
			return ErrorClass::validation;

		case Error::object_not_exist:
		case Error::provider_not_found:
		case Error::no_usable_provider:
			return ErrorClass::not_found;

		case Error::default_contention:
		case Error::provider_in_use:
			return ErrorClass::conflict;

		case Error::encryption_failed:
			return ErrorClass::encryption;

		case Error::key_mismatch:
		case Error::corrupt_credentials:
			return ErrorClass::decryption;

		case Error::provider_connection_failed:
		case Error::provider_timeout:
		case Error::provider_credentials:
			return ErrorClass::provider_connection;

		case Error::unsupported_format:
			return ErrorClass::unsupported_format;

		default:
			return ErrorClass::internal;
	}
}

} // end of local namespace

const std::error_category& ipt_error_category()
{
	struct Cat : std::error_category
	{
		Cat() = default;
		const char *name() const noexcept override { return "ipt"; }

		std::string message(int ev) const override
		{
			switch (static_cast<Error>(ev))
			{
				case Error::ok: return "no error";
				case Error::invalid_provider_type: return "invalid storage provider type";
				case Error::invalid_name: return "invalid storage provider name";
				case Error::duplicate_name: return "storage provider name already in use";
				case Error::missing_config: return "missing required storage provider configuration";
				case Error::missing_credentials: return "missing required storage provider credentials";
				case Error::provider_inactive: return "storage provider is inactive";
				case Error::empty_file: return "uploaded file is empty";
				case Error::file_too_large: return "uploaded file exceeds the size limit";
				case Error::unsupported_content_type: return "content type is not an allowed image type";
				case Error::invalid_filename: return "invalid filename";
				case Error::invalid_tag: return "invalid tag";
				case Error::invalid_path: return "invalid storage path";
				case Error::invalid_metadata: return "metadata must be an object";
				case Error::object_not_exist: return "object not exist";
				case Error::provider_not_found: return "storage provider not found";
				case Error::no_usable_provider: return "no active storage provider configured";
				case Error::default_contention: return "default storage provider changed concurrently";
				case Error::provider_in_use: return "storage provider is still referenced by images";
				case Error::encryption_failed: return "cannot encrypt credentials";
				case Error::key_mismatch: return "credentials were encrypted with another key";
				case Error::corrupt_credentials: return "encrypted credentials are corrupted";
				case Error::provider_connection_failed: return "cannot connect to storage provider";
				case Error::provider_timeout: return "storage provider did not respond in time";
				case Error::provider_credentials: return "storage provider credentials are not usable";
				case Error::unsupported_format: return "unsupported image format";
				case Error::database_error: return "database error";
				default: return "unknown error " + std::to_string(ev);
			}
		}

		std::error_condition default_error_condition(int ev) const noexcept override
		{
			return make_error_condition(class_of(static_cast<Error>(ev)));
		}
	};
	static const Cat cat;
	return cat;
}

const std::error_category& ipt_error_class_category()
{
	struct Cat : std::error_category
	{
		Cat() = default;
		const char *name() const noexcept override { return "ipt.class"; }

		std::string message(int ev) const override
		{
			return to_string(static_cast<ErrorClass>(ev));
		}
	};
	static const Cat cat;
	return cat;
}

std::error_code make_error_code(Error err)
{
	return std::error_code(static_cast<int>(err), ipt_error_category());
}

std::error_condition make_error_condition(ErrorClass cls)
{
	return std::error_condition(static_cast<int>(cls), ipt_error_class_category());
}

ErrorClass classify(std::error_code ec)
{
	if (!ec)
		return ErrorClass::none;

	// errors from the system or third party libraries are unexpected
	if (ec.category() != ipt_error_category())
		return ErrorClass::internal;

	return class_of(static_cast<Error>(ec.value()));
}

const char* to_string(ErrorClass cls)
{
	switch (cls)
	{
		case ErrorClass::none: return "none";
		case ErrorClass::validation: return "ValidationError";
		case ErrorClass::not_found: return "NotFoundError";
		case ErrorClass::conflict: return "ConflictError";
		case ErrorClass::encryption: return "EncryptionError";
		case ErrorClass::decryption: return "DecryptionError";
		case ErrorClass::provider_connection: return "ProviderConnectionError";
		case ErrorClass::unsupported_format: return "UnsupportedFormatError";
		default: return "InternalError";
	}
}

} // end of namespace ipt
