/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the image_porter
	distribution for more details.
*/

//
// Created by nestal on 3/12/2021.
//

#include <catch2/catch.hpp>

#include "crypto/VaultKey.hh"
#include "util/Error.hh"

#include <boost/exception/get_error_info.hpp>

using namespace ipt;

TEST_CASE("key from hex", "[normal]")
{
	const std::string hex = "000102030405060708090a0b0c0d0e0f101112131415161718191a1b1c1d1e1f";
	VaultKey subject{hex};

	REQUIRE(subject.size() == VaultKey::key_size);
	REQUIRE(subject.data()[0] == 0x00);
	REQUIRE(subject.data()[31] == 0x1f);
	REQUIRE(subject.hex() == hex);

	SECTION("upper case is fine")
	{
		VaultKey upper{"000102030405060708090A0B0C0D0E0F101112131415161718191A1B1C1D1E1F"};
		REQUIRE(upper.fingerprint() == subject.fingerprint());
	}
	SECTION("move")
	{
		auto fp = subject.fingerprint();
		VaultKey moved{std::move(subject)};
		REQUIRE(moved.fingerprint() == fp);
		REQUIRE(moved.hex() == hex);

		VaultKey other = VaultKey::generate();
		other = std::move(moved);
		REQUIRE(other.hex() == hex);
	}
}

TEST_CASE("generated keys are different", "[normal]")
{
	auto k1 = VaultKey::generate();
	auto k2 = VaultKey::generate();
	REQUIRE(k1.size() == VaultKey::key_size);
	REQUIRE(k1.hex().size() == 64);
	REQUIRE(k1.hex() != k2.hex());
	REQUIRE(k1.fingerprint() != k2.fingerprint());

	// round trip through the hex form, like the command line tool does
	VaultKey k3{k1.hex()};
	REQUIRE(k3.fingerprint() == k1.fingerprint());
}

TEST_CASE("malformed keys", "[error]")
{
	auto malformed = GENERATE(
		std::string{},
		std::string{"0011"},
		std::string{"000102030405060708090a0b0c0d0e0f101112131415161718191a1b1c1d1e"},
		std::string{"000102030405060708090a0b0c0d0e0f101112131415161718191a1b1c1d1e1f00"},
		std::string{"zz0102030405060708090a0b0c0d0e0f101112131415161718191a1b1c1d1e1f"}
	);

	try
	{
		VaultKey subject{malformed};
		FAIL("malformed key accepted");
	}
	catch (VaultKey::Error& e)
	{
		auto ec = boost::get_error_info<ErrorCode>(e);
		REQUIRE(ec);
		REQUIRE(classify(*ec) == ErrorClass::encryption);

		// never echo the key back
		if (!malformed.empty())
			REQUIRE(std::string{e.what()}.find(malformed) == std::string::npos);
	}
}
