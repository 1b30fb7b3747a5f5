/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the image_porter
	distribution for more details.
*/

//
// Created by nestal on 6/25/18.
//

#include "TestImages.hh"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <random>
#include <stdexcept>

namespace ipt {

cv::Mat noisy_image(int width, int height, int type)
{
	thread_local std::mt19937_64 mt{std::random_device{}()};

	// smooth gradients, like a photo
	cv::Mat image{height, width, CV_8UC3};
	for (int y = 0; y < height; ++y)
		for (int x = 0; x < width; ++x)
			image.at<cv::Vec3b>(y, x) = cv::Vec3b(
				static_cast<uchar>(x * 255 / width),
				static_cast<uchar>(y * 255 / height),
				static_cast<uchar>((x + y) * 255 / (width + height))
			);

	std::uniform_int_distribution<> dis{16, 64};
	cv::Mat noise{image.size(), CV_8UC3};
	randn(noise, 0, dis(mt));
	image += noise;

	cv::Mat result;
	switch (CV_MAT_CN(type))
	{
		case 1:  cv::cvtColor(image, result, cv::COLOR_BGR2GRAY); break;
		case 4:  cv::cvtColor(image, result, cv::COLOR_BGR2BGRA); break;
		default: result = image; break;
	}
	if (CV_MAT_DEPTH(type) == CV_16U)
		result.convertTo(result, CV_16U, 257);
	return result;
}

std::vector<unsigned char> encode(const cv::Mat& image, const std::string& ext, const std::vector<int>& params)
{
	std::vector<unsigned char> out;
	if (!cv::imencode(ext, image, out, params))
		throw std::runtime_error("cannot encode test image to " + ext);
	return out;
}

std::vector<unsigned char> noisy_jpeg(int width, int height)
{
	return encode(noisy_image(width, height), ".jpg", {cv::IMWRITE_JPEG_QUALITY, 95});
}

std::vector<unsigned char> transparent_png(int width, int height)
{
	auto image = noisy_image(width, height, CV_8UC4);
	for (int y = 0; y < height; ++y)
		for (int x = 0; x < width / 2; ++x)
			image.at<cv::Vec4b>(y, x)[3] = 0;

	return encode(image, ".png");
}

std::vector<unsigned char> with_orientation(const std::vector<unsigned char>& jpeg, int orientation)
{
	if (jpeg.size() < 2 || jpeg[0] != 0xFF || jpeg[1] != 0xD8)
		throw std::invalid_argument("not a JPEG");

	const unsigned char tiff[] = {
		// little endian TIFF header, IFD0 at offset 8
		'I', 'I', 0x2A, 0x00, 0x08, 0x00, 0x00, 0x00,

		// 2 entries
		0x02, 0x00,

		// Make, ASCII, 8 characters at offset 38
		0x0F, 0x01, 0x02, 0x00, 0x08, 0x00, 0x00, 0x00, 0x26, 0x00, 0x00, 0x00,

		// Orientation, SHORT, 1 value
		0x12, 0x01, 0x03, 0x00, 0x01, 0x00, 0x00, 0x00,
		static_cast<unsigned char>(orientation), 0x00, 0x00, 0x00,

		// no next IFD
		0x00, 0x00, 0x00, 0x00,

		'T', 'e', 's', 't', 'C', 'a', 'm', 0x00
	};
	const unsigned char exif_header[] = {'E', 'x', 'i', 'f', 0x00, 0x00};

	auto length = 2 + sizeof(exif_header) + sizeof(tiff);

	std::vector<unsigned char> result{0xFF, 0xD8, 0xFF, 0xE1};
	result.push_back(static_cast<unsigned char>(length >> 8));
	result.push_back(static_cast<unsigned char>(length & 0xFF));
	result.insert(result.end(), std::begin(exif_header), std::end(exif_header));
	result.insert(result.end(), std::begin(tiff), std::end(tiff));
	result.insert(result.end(), jpeg.begin() + 2, jpeg.end());
	return result;
}

} // end of namespace ipt
