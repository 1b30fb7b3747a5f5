/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the image_porter
	distribution for more details.
*/

//
// Created by nestal on 6/3/18.
//

#pragma once

#include <nlohmann/json.hpp>

#include <iosfwd>
#include <string>
#include <string_view>

namespace ipt {

/// The authenticated user who owns providers and images. Authentication is
/// done before any operation of the core is called.
class UserID
{
public:
	UserID() = default;
	explicit UserID(std::string_view user);

	[[nodiscard]] const std::string& username() const {return m_user;}

	/// A valid user name is not empty and can be used as a path component,
	/// i.e. no slash, no control characters, and not "." or "..".
	[[nodiscard]] bool is_valid() const;

	bool operator==(const UserID& rhs) const {return m_user == rhs.m_user;}
	bool operator!=(const UserID& rhs) const {return m_user != rhs.m_user;}

private:
	std::string     m_user;
};

void to_json(nlohmann::json& dest, const UserID& src);
std::ostream& operator<<(std::ostream& os, const UserID& user);

} // end of namespace ipt
