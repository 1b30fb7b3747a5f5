/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the image_porter
    distribution for more details.
*/

//
// Created by nestal on 1/28/18.
//

#pragma once

#include "util/BufferView.hh"

#include <openssl/evp.h>

#include <array>
#include <memory>

namespace ipt {

struct HashCTXRelease
{
	void operator()(EVP_MD_CTX *ctx) const;
};
using HashCTX = std::unique_ptr<EVP_MD_CTX, HashCTXRelease>;

HashCTX NewHashCTX();

struct CipherCTXRelease
{
	void operator()(EVP_CIPHER_CTX *ctx) const;
};
using CipherCTX = std::unique_ptr<EVP_CIPHER_CTX, CipherCTXRelease>;

CipherCTX NewCipherCTX();

using SHA256Digest = std::array<unsigned char, 32>;
SHA256Digest sha256(BufferView data);

} // end of namespace ipt
