/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the image_porter
    distribution for more details.
*/

//
// Created by nestal on 3/12/2021.
//

#include "CredentialVault.hh"

#include "EVPWrapper.hh"
#include "Random.hh"

#include "util/Error.hh"
#include "util/Log.hh"

#include <openssl/crypto.h>
#include <openssl/evp.h>

#include <algorithm>
#include <cstring>

namespace ipt {

CredentialVault::CredentialVault(VaultKey key) : m_key{std::move(key)}
{
}

std::vector<unsigned char> CredentialVault::encrypt(const Credentials& plain, std::error_code& ec) const
{
	// std::map keeps the keys sorted, so is the JSON object
	auto text = nlohmann::json(plain).dump();

	std::vector<unsigned char> blob(header_size + text.size() + tag_size);
	blob[0] = version;
	std::copy(m_key.fingerprint().begin(), m_key.fingerprint().end(), blob.begin() + 1);

	auto nonce = &blob[1 + m_key.fingerprint().size()];
	secure_random(nonce, nonce_size);

	auto ctx = NewCipherCTX();
	int out_len = 0, final_len = 0;
	auto ok =
		::EVP_EncryptInit_ex(ctx.get(), ::EVP_aes_256_gcm(), nullptr, nullptr, nullptr) == 1 &&
		::EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, nonce_size, nullptr) == 1 &&
		::EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, m_key.data(), nonce) == 1 &&
		::EVP_EncryptUpdate(ctx.get(), nullptr, &out_len, blob.data(), header_size) == 1 &&
		::EVP_EncryptUpdate(
			ctx.get(), &blob[header_size], &out_len,
			reinterpret_cast<const unsigned char*>(text.data()), static_cast<int>(text.size())
		) == 1 &&
		::EVP_EncryptFinal_ex(ctx.get(), &blob[header_size + out_len], &final_len) == 1 &&
		::EVP_CIPHER_CTX_ctrl(
			ctx.get(), EVP_CTRL_GCM_GET_TAG, tag_size, &blob[header_size + out_len + final_len]
		) == 1;

	::OPENSSL_cleanse(text.data(), text.size());

	if (!ok)
	{
		Log(LOG_ERR, "cannot encrypt credentials: OpenSSL EVP failure");
		ec = Error::encryption_failed;
		return {};
	}

	ec.clear();
	return blob;
}

Credentials CredentialVault::decrypt(BufferView blob, std::error_code& ec) const
{
	if (blob.size() < header_size + tag_size || blob[0] != version)
	{
		ec = Error::corrupt_credentials;
		return {};
	}

	auto& fp = m_key.fingerprint();
	if (!std::equal(fp.begin(), fp.end(), blob.begin() + 1))
	{
		ec = Error::key_mismatch;
		return {};
	}

	auto nonce  = &blob[1 + fp.size()];
	auto cipher = blob.substr(header_size, blob.size() - header_size - tag_size);

	// OpenSSL wants a non-const tag
	std::array<unsigned char, tag_size> tag{};
	std::copy(blob.end() - tag_size, blob.end(), tag.begin());

	std::vector<unsigned char> text(cipher.size() + 1);

	auto ctx = NewCipherCTX();
	int out_len = 0, final_len = 0;
	auto ok =
		::EVP_DecryptInit_ex(ctx.get(), ::EVP_aes_256_gcm(), nullptr, nullptr, nullptr) == 1 &&
		::EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, nonce_size, nullptr) == 1 &&
		::EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, m_key.data(), nonce) == 1 &&
		::EVP_DecryptUpdate(ctx.get(), nullptr, &out_len, blob.data(), header_size) == 1 &&
		::EVP_DecryptUpdate(ctx.get(), text.data(), &out_len, cipher.data(), static_cast<int>(cipher.size())) == 1 &&
		::EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, tag_size, tag.data()) == 1 &&
		::EVP_DecryptFinal_ex(ctx.get(), text.data() + out_len, &final_len) > 0;

	Credentials result;
	if (ok)
	{
		auto json = nlohmann::json::parse(text.begin(), text.begin() + out_len + final_len, nullptr, false);
		if (json.is_object())
		{
			try
			{
				result = json.get<Credentials>();
			}
			catch (nlohmann::json::exception&)
			{
				ok = false;
			}
		}
		else
			ok = false;
	}
	::OPENSSL_cleanse(text.data(), text.size());

	if (!ok)
	{
		ec = Error::corrupt_credentials;
		return {};
	}

	ec.clear();
	return result;
}

} // end of namespace ipt
