/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the image_porter
	distribution for more details.
*/

//
// Created by nestal on 2/28/18.
//

#include "JPEG.hh"

#include "util/Error.hh"
#include "util/Log.hh"

#include <turbojpeg.h>

#include <memory>

namespace ipt {
namespace {

struct TJDestroy
{
	void operator()(void *handle) const {::tjDestroy(handle);}
};
using TJHandle = std::unique_ptr<void, TJDestroy>;

// output buffer allocated by tjCompress2()
struct TJFree
{
	void operator()(unsigned char *buf) const {::tjFree(buf);}
};
using TurboBuffer = std::unique_ptr<unsigned char, TJFree>;

} // end of local namespace

std::vector<unsigned char> compress_jpeg(const cv::Mat& image, int quality, std::error_code& ec)
{
	if (image.empty() || image.depth() != CV_8U || (image.channels() != 1 && image.channels() != 3))
	{
		Log(LOG_WARNING, "cannot compress %1% channel image (depth %2%) to JPEG", image.channels(), image.depth());
		ec = Error::unknown_error;
		return {};
	}

	TJHandle handle{::tjInitCompress()};
	if (!handle)
	{
		Log(LOG_ERR, "tjInitCompress() failed: %1%", ::tjGetErrorStr());
		ec = Error::unknown_error;
		return {};
	}

	auto gray = image.channels() == 1;

	unsigned char *out{};
	unsigned long out_size{};
	auto result = ::tjCompress2(
		handle.get(),
		image.data, image.cols, static_cast<int>(image.step), image.rows,
		gray ? TJPF_GRAY : TJPF_BGR,
		&out, &out_size,
		gray ? TJSAMP_GRAY : TJSAMP_420,
		quality,
		TJFLAG_ACCURATEDCT
	);
	TurboBuffer buf{out};

	if (result != 0)
	{
		Log(LOG_WARNING, "tjCompress2() failed: %1%", ::tjGetErrorStr());
		ec = Error::unknown_error;
		return {};
	}

	ec.clear();
	return {buf.get(), buf.get() + out_size};
}

} // end of namespace ipt
