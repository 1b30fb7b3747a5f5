/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the image_porter
    distribution for more details.
*/

//
// Created by nestal on 1/20/18.
//

#include "Magic.hh"
#include "Log.hh"

namespace ipt {

Magic::Magic() : m_cookie{::magic_open(MAGIC_MIME_TYPE)}
{
	if (m_cookie && ::magic_load(m_cookie, nullptr) != 0)
		Log(LOG_WARNING, "cannot load magic database: %1%", ::magic_error(m_cookie));
}

Magic::~Magic()
{
	if (m_cookie)
		::magic_close(m_cookie);
}

std::string Magic::mime(BufferView buf) const
{
	std::lock_guard lock{m_mutex};
	if (!m_cookie)
		return "application/octet-stream";

	auto result = ::magic_buffer(m_cookie, buf.data(), buf.size());
	return result ? std::string{result} : std::string{"application/octet-stream"};
}

const Magic& Magic::instance()
{
	static const Magic magic;
	return magic;
}

} // end of namespace
