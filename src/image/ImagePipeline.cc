/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the image_porter
	distribution for more details.
*/

//
// Created by nestal on 4/12/2021.
//

#include "ImagePipeline.hh"

#include "EXIF2.hh"
#include "JPEG.hh"

#include "util/Error.hh"
#include "util/Log.hh"
#include "util/Magic.hh"

#include <boost/algorithm/string/case_conv.hpp>

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <cmath>

namespace ipt {

ColorMode color_mode(const cv::Mat& image)
{
	switch (image.channels())
	{
		case 1:  return ColorMode::L;
		case 2:  return ColorMode::LA;
		case 4:  return ColorMode::RGBA;
		default: return ColorMode::RGB;
	}
}

const char* to_string(ColorMode mode)
{
	switch (mode)
	{
		case ColorMode::L:      return "L";
		case ColorMode::LA:     return "LA";
		case ColorMode::RGBA:   return "RGBA";
		default:                return "RGB";
	}
}

nlohmann::json ProcessedImage::metadata() const
{
	auto meta = nlohmann::json::object();
	meta.emplace("format",      format);
	meta.emplace("mime",        mime);
	meta.emplace("color_mode",  to_string(color));
	meta.emplace("orientation", orientation);
	if (optimized)
		meta.emplace("auto_rotated", orientation != 1);
	if (exif.is_object() && !exif.empty())
		meta.emplace("exif", exif);
	return meta;
}

ImagePipeline::ImagePipeline(const OptimizeSetting& setting) : m_setting{setting}
{
}

ProcessedImage ImagePipeline::process(BufferView input, bool optimize, std::error_code& ec) const
{
	ProcessedImage result;
	result.mime = Magic::instance().mime(input);
	result.format = format_name(result.mime);

	auto image = decode(input, ec);
	if (ec)
		return {};

	if (result.format == "JPEG")
	{
		EXIF2 exif{input};
		result.orientation = exif.orientation().value_or(1);
		result.exif = exif.fields();
	}

	try
	{
		if (optimize)
		{
			auto target = target_format(result.format);

			auto out = normalize_color(apply_orientation(image, result.orientation), target != "JPEG");
			out = resize(out);
			result.data = recompress(out, target, ec);
			if (ec)
				return {};

			result.optimized = true;
			image = std::move(out);
		}
		else
			result.data.assign(input.begin(), input.end());
	}
	catch (cv::Exception& e)
	{
		Log(LOG_WARNING, "cannot optimize %1% image: %2%", result.format, e.what());
		ec = Error::unknown_error;
		return {};
	}

	result.size.assign(image.cols, image.rows);
	result.color = color_mode(image);
	ec.clear();
	return result;
}

cv::Mat ImagePipeline::decode(BufferView input, std::error_code& ec)
{
	if (input.empty())
	{
		ec = Error::unsupported_format;
		return {};
	}

	// trust libmagic before feeding random bytes to the decoders
	auto mime = Magic::instance().mime(input);
	if (mime.substr(0, 6) != "image/")
	{
		Log(LOG_INFO, "rejecting upload with content %1%", mime);
		ec = Error::unsupported_format;
		return {};
	}

	cv::Mat image;
	try
	{
		// IMREAD_UNCHANGED keeps the alpha channel and the bit depth, and ignores
		// the EXIF orientation
		image = cv::imdecode(
			cv::Mat{1, static_cast<int>(input.size()), CV_8U, const_cast<unsigned char*>(input.data())},
			cv::IMREAD_UNCHANGED
		);
	}
	catch (cv::Exception& e)
	{
		Log(LOG_INFO, "cannot decode %1% image: %2%", mime, e.what());
	}

	if (image.empty())
	{
		ec = Error::unsupported_format;
		return {};
	}

	ec.clear();
	return image;
}

cv::Mat ImagePipeline::apply_orientation(const cv::Mat& image, int orientation)
{
	// http://sylvana.net/jpegcrop/exif_orientation.html
	//	  1        2       3      4         5            6           7          8
	//
	//	FFFFFF  FFFFFF      FF  FF      FFFFFFFFFF  FF                  FF  FFFFFFFFFF
	//	FF          FF      FF  FF      FF  FF      FF  FF          FF  FF      FF  FF
	//	FFFF      FFFF    FFFF  FFFF    FF          FFFFFFFFFF  FFFFFFFFFF          FF
	//	FF          FF      FF  FF
	//	FF          FF  FFFFFF  FFFFFF
	cv::Mat out;
	switch (orientation)
	{
		case 2: cv::flip(image, out, 1); break;
		case 3: cv::rotate(image, out, cv::ROTATE_180); break;
		case 4: cv::flip(image, out, 0); break;
		case 5: cv::transpose(image, out); break;
		case 6: cv::rotate(image, out, cv::ROTATE_90_CLOCKWISE); break;
		case 7:
			cv::transpose(image, out);
			cv::flip(out, out, -1);
			break;
		case 8: cv::rotate(image, out, cv::ROTATE_90_COUNTERCLOCKWISE); break;
		default: out = image; break;
	}
	return out;
}

cv::Mat ImagePipeline::normalize_color(const cv::Mat& image, bool keep_alpha)
{
	cv::Mat out;
	if (image.depth() == CV_16U)
		image.convertTo(out, CV_8U, 1.0/257);
	else if (image.depth() != CV_8U)
		image.convertTo(out, CV_8U);
	else
		out = image;

	auto channels = out.channels();
	if (keep_alpha || (channels != 2 && channels != 4))
		return out;

	// flatten onto an opaque white background
	std::vector<cv::Mat> planes;
	cv::split(out, planes);

	cv::Mat alpha;
	planes.back().convertTo(alpha, CV_32F, 1.0/255);
	cv::Mat background = (1.0 - alpha) * 255.0;
	planes.pop_back();

	for (auto& plane : planes)
	{
		cv::Mat color;
		plane.convertTo(color, CV_32F);
		color = color.mul(alpha) + background;
		color.convertTo(plane, CV_8U);
	}

	cv::Mat flat;
	cv::merge(planes, flat);
	return flat;
}

cv::Mat ImagePipeline::resize(const cv::Mat& image) const
{
	auto max = m_setting.max_dimension;
	if (image.cols <= max && image.rows <= max)
		return image;

	// the longer side becomes the maximum
	Size2D size;
	if (image.cols >= image.rows)
		size.assign(max, std::max(1, static_cast<int>(std::lround(static_cast<double>(image.rows) * max / image.cols))));
	else
		size.assign(std::max(1, static_cast<int>(std::lround(static_cast<double>(image.cols) * max / image.rows))), max);

	cv::Mat out;
	cv::resize(image, out, cv::Size{size.width(), size.height()}, 0, 0, cv::INTER_AREA);
	return out;
}

std::vector<unsigned char> ImagePipeline::recompress(const cv::Mat& image, std::string_view format, std::error_code& ec) const
{
	if (format == "JPEG")
		return compress_jpeg(image, m_setting.quality, ec);

	std::vector<unsigned char> out;
	auto ok = format == "WEBP" ?
		cv::imencode(".webp", image, out, {cv::IMWRITE_WEBP_QUALITY, m_setting.quality}) :
		cv::imencode(".png",  image, out, {cv::IMWRITE_PNG_COMPRESSION, m_setting.png_compression});

	if (!ok)
	{
		Log(LOG_WARNING, "cannot encode image to %1%", format);
		ec = Error::unknown_error;
		return {};
	}

	ec.clear();
	return out;
}

std::string ImagePipeline::format_name(std::string_view mime)
{
	auto slash = mime.find('/');
	auto sub = std::string{slash == mime.npos ? mime : mime.substr(slash + 1)};

	// e.g. image/x-ms-bmp
	if (sub.substr(0, 2) == "x-")
		sub.erase(0, 2);
	if (sub == "jpg" || sub == "pjpeg")
		sub = "jpeg";
	else if (sub == "ms-bmp")
		sub = "bmp";

	return boost::algorithm::to_upper_copy(sub);
}

std::string_view ImagePipeline::target_format(std::string_view format)
{
	if (format == "JPEG")
		return "JPEG";
	else if (format == "WEBP")
		return "WEBP";
	else
		return "PNG";
}

} // end of namespace ipt
