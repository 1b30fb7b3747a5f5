/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the image_porter
	distribution for more details.
*/

//
// Created by nestal on 2/12/2021.
//

#include <catch2/catch.hpp>

#include "util/Error.hh"

using namespace ipt;

TEST_CASE("errors map to their classes", "[normal]")
{
	std::error_code ec = Error::duplicate_name;
	REQUIRE(ec == ErrorClass::validation);
	REQUIRE(ec != ErrorClass::conflict);
	REQUIRE(classify(ec) == ErrorClass::validation);
	REQUIRE(std::string{ec.category().name()} == "ipt");

	REQUIRE(std::error_code{Error::provider_not_found} == ErrorClass::not_found);
	REQUIRE(std::error_code{Error::no_usable_provider} == ErrorClass::not_found);
	REQUIRE(std::error_code{Error::default_contention} == ErrorClass::conflict);
	REQUIRE(std::error_code{Error::provider_in_use} == ErrorClass::conflict);
	REQUIRE(std::error_code{Error::encryption_failed} == ErrorClass::encryption);
	REQUIRE(std::error_code{Error::key_mismatch} == ErrorClass::decryption);
	REQUIRE(std::error_code{Error::corrupt_credentials} == ErrorClass::decryption);
	REQUIRE(std::error_code{Error::provider_timeout} == ErrorClass::provider_connection);
	REQUIRE(std::error_code{Error::provider_credentials} == ErrorClass::provider_connection);
	REQUIRE(std::error_code{Error::unsupported_format} == ErrorClass::unsupported_format);
	REQUIRE(std::error_code{Error::database_error} == ErrorClass::internal);
}

TEST_CASE("foreign errors are internal", "[normal]")
{
	REQUIRE(classify(std::error_code{}) == ErrorClass::none);
	REQUIRE(classify(std::make_error_code(std::errc::no_such_file_or_directory)) == ErrorClass::internal);
}

TEST_CASE("error class names", "[normal]")
{
	REQUIRE(std::string{to_string(ErrorClass::not_found)} == "NotFoundError");
	REQUIRE(std::string{to_string(ErrorClass::provider_connection)} == "ProviderConnectionError");
	REQUIRE(make_error_condition(ErrorClass::conflict).message() == "ConflictError");
	REQUIRE(std::error_code{Error::provider_inactive}.message() == "storage provider is inactive");
}
