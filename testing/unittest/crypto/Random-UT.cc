/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the image_porter
	distribution for more details.
*/

//
// Created by nestal on 3/3/18.
//

#include <catch2/catch.hpp>

#include "crypto/Random.hh"

#include <algorithm>
#include <cctype>
#include <set>

using namespace ipt;

TEST_CASE("Test random number", "[normal]")
{
	auto rand = secure_random_array<std::uint64_t, 2>();
	REQUIRE_NOTHROW(rand[0] > 0 && rand[1] > 0);
	REQUIRE_NOTHROW(rand = insecure_random_array<std::uint64_t, 2>());
	REQUIRE_NOTHROW(rand[0] > 0 && rand[1] > 0);
}

TEST_CASE("insecure_random() generates random numbers", "[normal]")
{
	// Very easy....
	REQUIRE(insecure_random<std::uint64_t>() != insecure_random<std::uint64_t>());
	REQUIRE(insecure_random<std::uint64_t>() != insecure_random<std::uint64_t>());
	REQUIRE(insecure_random<std::uint64_t>() != insecure_random<std::uint64_t>());
}

TEST_CASE("random hex strings", "[normal]")
{
	auto hex = insecure_random_hex(4);
	REQUIRE(hex.size() == 8);
	REQUIRE(std::all_of(hex.begin(), hex.end(), [](char c){return std::isxdigit(c) && !std::isupper(c);}));

	std::set<std::string> seen;
	for (int i = 0; i < 100; i++)
		seen.insert(insecure_random_hex(8));
	REQUIRE(seen.size() == 100);
}
