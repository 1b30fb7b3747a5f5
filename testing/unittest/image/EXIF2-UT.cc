/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the image_porter
	distribution for more details.
*/

//
// Created by nestal on 2/1/2020.
//

#include <catch2/catch.hpp>

#include "image/EXIF2.hh"

#include "TestImages.hh"

#include <vector>

using namespace ipt;

TEST_CASE("read orientation and make from JPEG", "[normal]")
{
	auto orientation = GENERATE(1, 3, 6, 8);
	auto jpeg = with_orientation(noisy_jpeg(64, 32), orientation);

	EXIF2 subject{buffer_view(jpeg)};
	REQUIRE(subject);
	REQUIRE(subject.orientation() == orientation);
	REQUIRE(subject.get(EXIF_TAG_MAKE) == "TestCam");

	auto fields = subject.fields();
	REQUIRE(fields["Make"] == "TestCam");
	REQUIRE_FALSE(fields.contains("Model"));
}

TEST_CASE("JPEG without EXIF", "[normal]")
{
	auto jpeg = noisy_jpeg(64, 32);

	EXIF2 subject{buffer_view(jpeg)};
	REQUIRE_FALSE(subject.orientation().has_value());
	REQUIRE(subject.fields().empty());
}

TEST_CASE("EXIF of garbage", "[error]")
{
	std::vector<unsigned char> garbage(100, 0x42);
	EXIF2 subject{buffer_view(garbage)};
	REQUIRE_FALSE(subject.orientation().has_value());

	EXIF2 empty{BufferView{}};
	REQUIRE_FALSE(empty);
	REQUIRE(empty.fields().empty());
}
