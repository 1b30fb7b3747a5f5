/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the image_porter
    distribution for more details.
*/

//
// Created by nestal on 1/27/18.
//

#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <type_traits>

namespace ipt {

/// For key material and nonces.
void secure_random(void* buf, std::size_t size);

/// For identifiers and path suffixes, which only need to be unpredictable enough to avoid collisions.
void insecure_random(void* buf, std::size_t size);

template <typename T>
requires std::is_standard_layout_v<T>
T secure_random()
{
	T t;
	secure_random(&t, sizeof(t));
	return t;
}

template <typename T>
requires std::is_standard_layout_v<T>
T insecure_random()
{
	T t;
	insecure_random(&t, sizeof(t));
	return t;
}

/// Random bytes in lower case hex, e.g. for the suffix of storage paths.
std::string insecure_random_hex(std::size_t bytes);

template <typename T, std::size_t size> std::array<T,size> secure_random_array()
{
	return secure_random<std::array<T,size>>();
}
template <typename T, std::size_t size> std::array<T,size> insecure_random_array()
{
	return insecure_random<std::array<T,size>>();
}

} // end of namespace ipt
