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

#include "Credentials.hh"
#include "VaultKey.hh"

#include "util/BufferView.hh"

#include <system_error>
#include <vector>

namespace ipt {

/// Encrypts and decrypts credentials of storage providers with AES-256-GCM.
///
/// The ciphertext is laid out as:
/// \code
/// | version (1) | key fingerprint (4) | nonce (12) | ciphertext (n) | tag (16) |
/// \endcode
/// The first 17 bytes are authenticated as additional data. The key fingerprint
/// tells a blob encrypted by another key (i.e. after key rotation) apart from a
/// corrupted one.
class CredentialVault
{
public:
	static constexpr unsigned char version = 0x01;
	static constexpr std::size_t nonce_size = 12;
	static constexpr std::size_t tag_size = 16;
	static constexpr std::size_t header_size = 1 + std::tuple_size_v<VaultKey::Fingerprint> + nonce_size;

public:
	explicit CredentialVault(VaultKey key);

	/// Serializes \a plain as JSON with sorted keys and encrypts it.
	/// \param ec   Error::encryption_failed if OpenSSL fails.
	std::vector<unsigned char> encrypt(const Credentials& plain, std::error_code& ec) const;

	/// \param ec   Error::key_mismatch if \a blob was encrypted by another key.
	///             Error::corrupt_credentials if \a blob fails authentication or
	///             does not contain a JSON object of credentials.
	Credentials decrypt(BufferView blob, std::error_code& ec) const;

	[[nodiscard]] const VaultKey& key() const {return m_key;}

private:
	VaultKey    m_key;
};

} // end of namespace ipt
