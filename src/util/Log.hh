/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the image_porter
    distribution for more details.
*/

//
// Created by nestal on 1/7/18.
//

#pragma once

#include <boost/format.hpp>

#include <syslog.h>
#include <string>

namespace ipt {

namespace detail {
void DetailLog(int priority, std::string&& line);
}

/// Open the system log with the program name. If \a mirror_stderr is true, all
/// messages will also be printed to stderr (for the command line tool).
/// Messages with priority lower than \a max_priority are discarded.
void OpenLog(const char *ident, bool mirror_stderr, int max_priority = LOG_INFO);

/// Log a message using boost::format syntax, i.e. "%1% %2%".
/// Never pass credentials or key material as arguments.
template <typename... Args>
void Log(int priority, const std::string& fmt, Args... args)
{
	boost::format bfmt{fmt};
	bfmt.exceptions(boost::io::no_error_bits);

	return detail::DetailLog(priority, (bfmt % ... % std::forward<Args>(args)).str());
}

} // end of namespace
