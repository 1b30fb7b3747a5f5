/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the image_porter
	distribution for more details.
*/

//
// Created by nestal on 2/28/18.
//

#pragma once

#include <opencv2/core.hpp>

#include <system_error>
#include <vector>

namespace ipt {

/// Compresses an 8-bit BGR or grayscale image to JPEG with libjpeg-turbo.
/// Color images use 4:2:0 chroma subsampling. The output carries no EXIF.
std::vector<unsigned char> compress_jpeg(const cv::Mat& image, int quality, std::error_code& ec);

} // end of namespace ipt
