/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the image_porter
    distribution for more details.
*/

//
// Created by nestal on 1/8/18.
//

#include "Log.hh"

#ifdef SYSTEMD_FOUND
#include <systemd/sd-journal.h>
#endif

#include <atomic>
#include <iostream>

namespace ipt {
namespace {

std::atomic<bool>   mirror_to_stderr{false};
std::atomic<int>    log_threshold{LOG_DEBUG};

} // end of local namespace

void OpenLog(const char *ident, bool mirror_stderr, int max_priority)
{
	mirror_to_stderr = mirror_stderr;
	log_threshold    = max_priority;

	::openlog(ident, LOG_PID, LOG_USER);
	::setlogmask(LOG_UPTO(max_priority));
}

namespace detail {

void DetailLog(int priority, std::string &&line)
{
	if (priority > log_threshold)
		return;

	if (mirror_to_stderr)
		std::clog << line << std::endl;

	// preprocessor is bad
#ifdef SYSTEMD_FOUND
	::sd_journal_print
#else
	syslog
#endif
	(priority, "%s", line.c_str());
}

} // end of namespace detail
} // end of namespace
