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

#include "util/Exception.hh"

#include <boost/exception/info.hpp>

#include <array>
#include <string>
#include <string_view>
#include <vector>

namespace ipt {

/// The process-wide key of the CredentialVault.
/// It is constructed once at startup and passed to the vault explicitly. The key
/// material is kept in locked memory (never swapped out) and wiped on destruction.
class VaultKey
{
public:
	struct Error : virtual Exception {};
	using Message = ipt::Message;

	static constexpr std::size_t key_size = 32;
	using Fingerprint = std::array<unsigned char, 4>;

public:
	/// \throw VaultKey::Error if \a hex is not exactly 64 hex digits.
	explicit VaultKey(std::string_view hex);
	~VaultKey();

	VaultKey(VaultKey&& other) noexcept = default;
	VaultKey(const VaultKey&) = delete;
	VaultKey& operator=(VaultKey&& other) noexcept;
	VaultKey& operator=(const VaultKey&) = delete;

	static VaultKey generate();

	[[nodiscard]] const unsigned char* data() const;
	[[nodiscard]] std::size_t size() const {return m_key.size();}

	/// First 4 bytes of the SHA-256 of the key. Identifies the key in a ciphertext
	/// without disclosing it.
	[[nodiscard]] const Fingerprint& fingerprint() const {return m_fingerprint;}

	/// Only used by the command line tool to print a newly generated key.
	[[nodiscard]] std::string hex() const;

private:
	VaultKey() = default;
	void lock();
	void clear();

private:
	std::vector<unsigned char>  m_key;
	Fingerprint                 m_fingerprint{};
};

} // end of namespace ipt
