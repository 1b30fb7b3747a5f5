/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the image_porter
	distribution for more details.
*/

//
// Created by nestal on 6/25/18.
//

#pragma once

#include <opencv2/core/mat.hpp>

#include <string>
#include <vector>

namespace ipt {

/// A colorful image with noise, so that it does not compress too well.
cv::Mat noisy_image(int width, int height, int type = CV_8UC3);

std::vector<unsigned char> encode(const cv::Mat& image, const std::string& ext, const std::vector<int>& params = {});

/// JPEG at high quality, like those from a camera.
std::vector<unsigned char> noisy_jpeg(int width, int height);

/// PNG with an alpha channel. The left half is transparent.
std::vector<unsigned char> transparent_png(int width, int height);

/// Inserts an EXIF segment with the orientation tag and the Make "TestCam"
/// into a JPEG.
std::vector<unsigned char> with_orientation(const std::vector<unsigned char>& jpeg, int orientation);

} // end of namespace ipt
