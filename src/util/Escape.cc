/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the image_porter
    distribution for more details.
*/

#include "Escape.hh"

namespace ipt {

std::string to_hex(BufferView buf)
{
	std::string result(buf.size()*2, '\0');
	boost::algorithm::hex_lower(buf.begin(), buf.end(), result.begin());
	return result;
}

} // end of namespace
