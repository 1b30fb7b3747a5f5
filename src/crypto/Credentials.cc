/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the image_porter
    distribution for more details.
*/

//
// Created by nestal on 3/12/2021.
//

#include "Credentials.hh"

#include <openssl/crypto.h>

namespace ipt {
namespace {

void wipe(std::string& str)
{
	if (!str.empty())
		::OPENSSL_cleanse(str.data(), str.size());
	str.clear();
}

} // end of local namespace

Credentials::Credentials(std::initializer_list<Map::value_type> values) : m_values{values}
{
}

Credentials& Credentials::operator=(const Credentials& other)
{
	if (this != &other)
	{
		clear();
		m_values = other.m_values;
	}
	return *this;
}

Credentials::~Credentials()
{
	clear();
}

bool Credentials::contains(const std::string& key) const
{
	return m_values.find(key) != m_values.end();
}

const std::string& Credentials::value(const std::string& key) const
{
	static const std::string empty;
	auto it = m_values.find(key);
	return it != m_values.end() ? it->second : empty;
}

void Credentials::set(const std::string& key, std::string value)
{
	auto [it, inserted] = m_values.try_emplace(key);
	if (!inserted)
		wipe(it->second);

	it->second = value;
	wipe(value);
}

void Credentials::clear()
{
	for (auto&& [key, value] : m_values)
		wipe(value);
	m_values.clear();
}

void to_json(nlohmann::json& dest, const Credentials& src)
{
	auto result = nlohmann::json::object();
	for (auto&& [key, value] : src.m_values)
		result.emplace(key, value);
	dest = std::move(result);
}

void from_json(const nlohmann::json& src, Credentials& dest)
{
	// throws nlohmann::json::type_error if src is not an object
	auto& object = src.get_ref<const nlohmann::json::object_t&>();

	dest.clear();
	for (auto&& [key, value] : object)
		dest.set(key, value.is_string() ? value.get<std::string>() : value.dump());
}

} // end of namespace ipt
