/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the image_porter
    distribution for more details.
*/

//
// Created by nestal on 3/12/2021.
//

#pragma once

#include <nlohmann/json.hpp>

#include <initializer_list>
#include <map>
#include <string>
#include <utility>

namespace ipt {

/// Plain text credentials of a storage provider, e.g. access key ID and secret.
/// The values are wiped when the object is destroyed. Copies are wiped
/// independently, so pass them by reference whenever possible.
class Credentials
{
public:
	using Map = std::map<std::string, std::string>;

public:
	Credentials() = default;
	Credentials(std::initializer_list<Map::value_type> values);
	Credentials(const Credentials&) = default;
	Credentials& operator=(const Credentials& other);
	~Credentials();

	[[nodiscard]] bool contains(const std::string& key) const;

	/// Empty string if \a key does not exist.
	[[nodiscard]] const std::string& value(const std::string& key) const;
	void set(const std::string& key, std::string value);

	[[nodiscard]] bool empty() const {return m_values.empty();}
	[[nodiscard]] std::size_t size() const {return m_values.size();}
	[[nodiscard]] Map::const_iterator begin() const {return m_values.begin();}
	[[nodiscard]] Map::const_iterator end() const {return m_values.end();}

	bool operator==(const Credentials& rhs) const {return m_values == rhs.m_values;}
	bool operator!=(const Credentials& rhs) const {return m_values != rhs.m_values;}

	void clear();

	friend void to_json(nlohmann::json& dest, const Credentials& src);
	friend void from_json(const nlohmann::json& src, Credentials& dest);

private:
	Map m_values;
};

} // end of namespace ipt
