/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the image_porter
	distribution for more details.
*/

//
// Created by nestal on 6/3/18.
//

#include "UserID.hh"

#include <algorithm>
#include <ostream>

namespace ipt {

UserID::UserID(std::string_view user) : m_user{user}
{
}

bool UserID::is_valid() const
{
	return !m_user.empty() && m_user.size() <= 150 && m_user != "." && m_user != ".." &&
		std::none_of(m_user.begin(), m_user.end(), [](unsigned char c)
		{
			return c < 0x20 || c == 0x7f || c == '/' || c == '\\';
		});
}

void to_json(nlohmann::json& dest, const UserID& src)
{
	dest = src.username();
}

std::ostream& operator<<(std::ostream& os, const UserID& user)
{
	return os << user.username();
}

} // end of namespace ipt
