/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the image_porter
    distribution for more details.
*/

//
// Created by nestal on 1/15/18.
//

#include "ObjectID.hh"

#include "crypto/Random.hh"
#include "util/Escape.hh"

#include <ostream>

namespace ipt {

ObjectID::ObjectID(const std::array<unsigned char, 16>& array)
{
	std::copy(array.begin(), array.end(), begin());
}

std::optional<ObjectID> ObjectID::from_hex(std::string_view hex)
{
	if (auto opt_array = hex_to_array<16>(hex); opt_array.has_value())
		return ObjectID{*opt_array};
	else
		return std::nullopt;
}

bool ObjectID::is_hex(std::string_view hex)
{
	return hex.size() == 32 && hex.find_first_not_of("0123456789ABCDEFabcdef") == hex.npos;
}

ObjectID ObjectID::randomize()
{
	return ObjectID{insecure_random_array<unsigned char, 16>()};
}

std::string ObjectID::hex() const
{
	return to_hex(static_cast<const std::array<unsigned char, 16>&>(*this));
}

std::ostream& operator<<(std::ostream& os, const ObjectID& id)
{
	return os << id.hex();
}

void from_json(const nlohmann::json& src, ObjectID& dest)
{
	if (auto opt = ObjectID::from_hex(src.get<std::string>()); opt.has_value())
		dest = *opt;
	else
		throw std::invalid_argument("invalid object ID: " + src.dump());
}

void to_json(nlohmann::json& dest, const ObjectID& src)
{
	dest = src.hex();
}

} // end of namespace
