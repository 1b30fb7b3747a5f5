/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the image_porter
    distribution for more details.
*/

//
// Created by nestal on 3/2/18.
//

#pragma once

#include <string_view>
#include <vector>

namespace ipt {

using BufferView = std::basic_string_view<unsigned char>;

inline BufferView buffer_view(const std::vector<unsigned char>& vec)
{
	return {vec.data(), vec.size()};
}

} // end of namespace ipt
