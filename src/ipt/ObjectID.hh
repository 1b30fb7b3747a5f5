/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the image_porter
    distribution for more details.
*/

//
// Created by nestal on 12 Feb 2018.
//

#pragma once

#include <boost/functional/hash.hpp>
#include <nlohmann/json.hpp>

#include <array>
#include <cstring>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

namespace ipt {

/// 128-bit random identifier of providers and images.
struct ObjectID : std::array<unsigned char, 16>
{
	using array::array;
	ObjectID() = default;
	explicit ObjectID(const std::array<unsigned char, 16>& array);

	static std::optional<ObjectID> from_hex(std::string_view hex);
	static bool is_hex(std::string_view hex);
	static ObjectID randomize();

	[[nodiscard]] std::string hex() const;
};
static_assert(std::is_standard_layout<ObjectID>::value);

void from_json(const nlohmann::json& src, ObjectID& dest);
void to_json(nlohmann::json& dest, const ObjectID& src);

std::ostream& operator<<(std::ostream& os, const ObjectID& id);

} // end of namespace

// inject hash<> to std namespace for unordered_map
namespace std
{
	template<> struct hash<ipt::ObjectID>
	{
		std::size_t operator()(const ipt::ObjectID& s) const noexcept
		{
			std::uint64_t halves[2]{};
			static_assert(sizeof(halves) == std::tuple_size_v<ipt::ObjectID>);
			std::memcpy(halves, s.data(), s.size());

			std::size_t seed = 0;
			for (auto&& i : halves)
				boost::hash_combine(seed, i);
			return seed;
		}
	};
}
