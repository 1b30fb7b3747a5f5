/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the image_porter
    distribution for more details.
*/

//
// Created by nestal on 1/20/18.
//

#pragma once

#include "BufferView.hh"

#include <magic.h>

#include <mutex>
#include <string>

namespace ipt {

/// Wrapper around libmagic to sniff the MIME type of uploaded content.
/// The content type supplied by the client is not trusted.
class Magic
{
public:
	Magic();
	Magic(const Magic&) = delete;
	Magic(Magic&&) = delete;
	~Magic();

	Magic& operator=(const Magic&) = delete;
	Magic& operator=(Magic&&) = delete;

	std::string mime(BufferView buf) const;

	static const Magic& instance();

private:
	::magic_t m_cookie;

	// magic_t is not thread-safe
	mutable std::mutex m_mutex;
};

} // end of namespace
