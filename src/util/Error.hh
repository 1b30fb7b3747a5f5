/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the image_porter
    distribution for more details.
*/

//
// Created by nestal on 1/20/18.
//

#pragma once

#include <system_error>

namespace ipt {

/// Error codes reported by the operations of the core.
/// Each of them belongs to exactly one ErrorClass, which is what the API layer
/// translates into transport-level responses.
enum class Error
{
	ok,

	// validation
	invalid_provider_type,
	invalid_name,
	duplicate_name,
	missing_config,
	missing_credentials,
	provider_inactive,
	empty_file,
	file_too_large,
	unsupported_content_type,
	invalid_filename,
	invalid_tag,
	invalid_path,
	invalid_metadata,

	// not found
	object_not_exist,
	provider_not_found,
	no_usable_provider,

	// conflict
	default_contention,
	provider_in_use,

	// vault
	encryption_failed,
	key_mismatch,
	corrupt_credentials,

	// remote storage
	provider_connection_failed,
	provider_timeout,
	provider_credentials,

	unsupported_format,

	database_error,
	unknown_error
};

/// The error taxonomy exposed to the API layer. Compare an error code
/// against these to find out how the caller should react, e.g.
/// \code
/// if (ec == ErrorClass::not_found) ...
/// \endcode
enum class ErrorClass
{
	none,
	validation,
	not_found,
	conflict,
	encryption,
	decryption,
	provider_connection,
	unsupported_format,
	internal
};

const std::error_category& ipt_error_category();
const std::error_category& ipt_error_class_category();

std::error_code make_error_code(Error err);
std::error_condition make_error_condition(ErrorClass cls);

ErrorClass classify(std::error_code ec);
const char* to_string(ErrorClass cls);

} // end of namespace ipt

namespace std
{
	template <> struct is_error_code_enum<ipt::Error> : true_type {};
	template <> struct is_error_condition_enum<ipt::ErrorClass> : true_type {};
}
