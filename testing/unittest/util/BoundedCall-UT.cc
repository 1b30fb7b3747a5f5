/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the image_porter
	distribution for more details.
*/

//
// Created by nestal on 14/11/2021.
//

#include <catch2/catch.hpp>

#include "util/BoundedCall.hh"

#include <atomic>
#include <future>
#include <stdexcept>
#include <thread>

using namespace ipt;
using namespace std::chrono_literals;

TEST_CASE("call finishes in time", "[normal]")
{
	BoundedCall subject{2, 1s};

	std::error_code ec;
	auto result = subject.run([](std::error_code&){return 42;}, ec);
	REQUIRE(!ec);
	REQUIRE(result == 42);

	auto failed = subject.run([](std::error_code& ec)
	{
		ec = Error::provider_connection_failed;
		return std::string{"partial"};
	}, ec);
	REQUIRE(ec == Error::provider_connection_failed);
	REQUIRE(failed == "partial");
}

TEST_CASE("exceptions become connection errors", "[error]")
{
	BoundedCall subject{1, 1s};

	std::error_code ec;
	auto result = subject.run([](std::error_code&) -> int
	{
		throw std::runtime_error{"network down"};
	}, ec);
	REQUIRE(ec == Error::provider_connection_failed);
	REQUIRE(result == 0);
}

TEST_CASE("timed out call is abandoned", "[error]")
{
	std::promise<std::pair<int, std::error_code>> abandoned;
	auto fut = abandoned.get_future();

	{
		BoundedCall subject{1, 50ms};

		std::error_code ec;
		auto result = subject.run(
			[](std::error_code&)
			{
				std::this_thread::sleep_for(300ms);
				return 7;
			},
			ec,
			[&abandoned](int&& value, std::error_code ec)
			{
				abandoned.set_value({value, ec});
			}
		);
		REQUIRE(ec == Error::provider_timeout);
		REQUIRE(ec == ErrorClass::provider_connection);
		REQUIRE(result == 0);

		// the destructor waits for the abandoned call
	}

	REQUIRE(fut.wait_for(0s) == std::future_status::ready);
	auto [value, ec] = fut.get();
	REQUIRE(value == 7);
	REQUIRE(!ec);
}
