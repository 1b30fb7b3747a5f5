/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the image_porter
    distribution for more details.
*/

//
// Created by nestal on 1/28/18.
//

#include "EVPWrapper.hh"

#include <stdexcept>

namespace ipt {

void HashCTXRelease::operator()(EVP_MD_CTX *ctx) const
{
	::EVP_MD_CTX_free(ctx);
}

HashCTX NewHashCTX()
{
	HashCTX ctx{::EVP_MD_CTX_new(), HashCTXRelease{}};
	if (!ctx)
		throw std::bad_alloc();
	return ctx;
}

void CipherCTXRelease::operator()(EVP_CIPHER_CTX *ctx) const
{
	// also clears the key schedule
	::EVP_CIPHER_CTX_free(ctx);
}

CipherCTX NewCipherCTX()
{
	CipherCTX ctx{::EVP_CIPHER_CTX_new(), CipherCTXRelease{}};
	if (!ctx)
		throw std::bad_alloc();
	return ctx;
}

SHA256Digest sha256(BufferView data)
{
	auto ctx = NewHashCTX();

	SHA256Digest result{};
	unsigned size = result.size();
	if (::EVP_DigestInit_ex(ctx.get(), ::EVP_sha256(), nullptr) != 1 ||
		::EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
		::EVP_DigestFinal_ex(ctx.get(), result.data(), &size) != 1)
		throw std::runtime_error("EVP SHA-256 digest failed");

	return result;
}

} // end of namespace ipt
