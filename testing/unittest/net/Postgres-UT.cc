/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the image_porter
	distribution for more details.
*/

//
// Created by nestal on 25/8/2020.
//

#include <catch2/catch.hpp>

#include "ipt/ObjectID.hh"
#include "net/Postgres.hh"

#include <optional>

using namespace ipt;
using namespace ipt::postgres;

TEST_CASE("postgres query params", "[normal]")
{
	const char a1[] = "1234";

	auto id = ObjectID::randomize();
	Query p{"query", a1, id};
	p.get([&a1, &id](auto&& query, std::size_t size, const char* const* values, const int* sizes, const int* formats)
	{
		REQUIRE(query == "query");
		REQUIRE(size == 2);

		REQUIRE(sizes[0] == 4);
		REQUIRE(sizes[1] == id.size());

		REQUIRE(formats[0] == 0);
		REQUIRE(formats[1] == 1);

		REQUIRE(values[0] == std::string(a1));
		return 0;
	});
}

TEST_CASE("postgres null and scalar params", "[normal]")
{
	std::optional<std::size_t> none;
	std::optional<double> ratio = 12.5;
	std::string text{"image/png"};

	Query p{"query", none, ratio, true, 42, text, Null{}};
	p.get([](auto&&, std::size_t size, const char* const* values, const int* sizes, const int* formats)
	{
		REQUIRE(size == 6);

		REQUIRE(values[0] == nullptr);
		REQUIRE(std::stod(values[1]) == 12.5);
		REQUIRE(std::string{values[2], static_cast<std::size_t>(sizes[2])} == "t");
		REQUIRE(std::string{values[3], static_cast<std::size_t>(sizes[3])} == "42");
		REQUIRE(std::string{values[4], static_cast<std::size_t>(sizes[4])} == "image/png");
		REQUIRE(values[5] == nullptr);

		for (std::size_t i = 0; i < size; i++)
			REQUIRE(formats[i] == 0);
		return 0;
	});
}
