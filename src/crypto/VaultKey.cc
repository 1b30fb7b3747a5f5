/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the image_porter
    distribution for more details.
*/

//
// Created by nestal on 1/27/18.
//

#include "VaultKey.hh"

#include "EVPWrapper.hh"
#include "Random.hh"

#include "util/Error.hh"
#include "util/Escape.hh"

#include <boost/algorithm/hex.hpp>
#include <boost/throw_exception.hpp>

#include <openssl/crypto.h>

#include <algorithm>
#include <system_error>

#include <sys/mman.h>

namespace ipt {

VaultKey::VaultKey(std::string_view hex)
{
	if (hex.size() != key_size*2)
		BOOST_THROW_EXCEPTION(Error()
			<< ErrorCode{make_error_code(ipt::Error::encryption_failed)}
			<< Message{"encryption key must be " + std::to_string(key_size*2) + " hex digits"}
		);

	lock();
	try
	{
		// decode directly into the locked buffer
		boost::algorithm::unhex(hex.begin(), hex.end(), m_key.begin());
	}
	catch (boost::algorithm::hex_decode_error&)
	{
		clear();
		BOOST_THROW_EXCEPTION(Error()
			<< ErrorCode{make_error_code(ipt::Error::encryption_failed)}
			<< Message{"encryption key is not a hex string"}
		);
	}

	auto digest = sha256({m_key.data(), m_key.size()});
	std::copy_n(digest.begin(), m_fingerprint.size(), m_fingerprint.begin());
	::OPENSSL_cleanse(digest.data(), digest.size());
}

VaultKey::~VaultKey()
{
	clear();
}

VaultKey& VaultKey::operator=(VaultKey&& other) noexcept
{
	if (this != &other)
	{
		clear();
		m_key.swap(other.m_key);
		m_fingerprint = other.m_fingerprint;
	}
	return *this;
}

VaultKey VaultKey::generate()
{
	VaultKey key;
	key.lock();
	secure_random(key.m_key.data(), key.m_key.size());

	auto digest = sha256({key.m_key.data(), key.m_key.size()});
	std::copy_n(digest.begin(), key.m_fingerprint.size(), key.m_fingerprint.begin());
	return key;
}

void VaultKey::lock()
{
	m_key.resize(key_size);
	if (::mlock(m_key.data(), m_key.size()) != 0)
	{
		auto err = errno;
		m_key.clear();
		BOOST_THROW_EXCEPTION(Error()
			<< ErrorCode{std::error_code(err, std::generic_category())}
			<< Message{"cannot lock memory for encryption key"}
		);
	}
}

void VaultKey::clear()
{
	if (!m_key.empty())
	{
		::OPENSSL_cleanse(m_key.data(), m_key.size());
		::munlock(m_key.data(), m_key.size());
		m_key.clear();
	}
}

const unsigned char* VaultKey::data() const
{
	return m_key.data();
}

std::string VaultKey::hex() const
{
	return to_hex(BufferView{m_key.data(), m_key.size()});
}

} // end of namespace ipt
