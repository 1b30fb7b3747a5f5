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

#include <boost/exception/exception.hpp>
#include <boost/exception/error_info.hpp>

#include <string>
#include <system_error>

namespace ipt {

/// Base class of the exceptions thrown for fatal conditions, e.g. a broken
/// configuration at startup. Operational errors are reported by std::error_code.
struct Exception : virtual boost::exception, virtual std::exception
{
	const char* what() const noexcept override ;
};

// error_info tags shared by all exceptions
using ErrorCode = boost::error_info<struct tag_error_code, std::error_code>;
using Message   = boost::error_info<struct tag_message,    std::string>;

} // end of namespace
