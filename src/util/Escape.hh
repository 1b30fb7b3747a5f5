/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the image_porter
    distribution for more details.
*/

#pragma once

#include "BufferView.hh"

#include <boost/algorithm/hex.hpp>

#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace ipt {

template <std::size_t N>
std::string to_hex(const std::array<unsigned char, N>& arr)
{
	std::string result(arr.size()*2, '\0');
	boost::algorithm::hex_lower(arr.begin(), arr.end(), result.begin());
	return result;
}

std::string to_hex(BufferView buf);

template <std::size_t N>
std::optional<std::array<unsigned char, N>> hex_to_array(std::string_view hex)
{
	try
	{
		std::array<unsigned char, N> result;
		if (hex.size() == result.size()*2)
		{
			boost::algorithm::unhex(hex.begin(), hex.end(), result.begin());
			return result;
		}
	}
	catch (boost::algorithm::hex_decode_error&)
	{
	}
	return std::nullopt;
}

} // end of namespace
