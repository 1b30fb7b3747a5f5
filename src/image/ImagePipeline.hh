/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the image_porter
	distribution for more details.
*/

//
// Created by nestal on 4/12/2021.
//

#pragma once

#include "util/BufferView.hh"
#include "util/Configuration.hh"
#include "util/Size2D.hh"

#include <nlohmann/json.hpp>
#include <opencv2/core.hpp>

#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace ipt {

enum class ColorMode {L, LA, RGB, RGBA};

ColorMode color_mode(const cv::Mat& image);
const char* to_string(ColorMode mode);

/// Output of ImagePipeline::process().
struct ProcessedImage
{
	std::vector<unsigned char>  data;       ///< bytes to be stored, the original ones if not optimized
	bool                        optimized{false};

	Size2D          size;                   ///< pixel dimensions of the stored image
	std::string     format;                 ///< format of the uploaded image, e.g. "JPEG"
	std::string     mime;                   ///< detected MIME type of the uploaded image
	ColorMode       color{ColorMode::RGB};  ///< color mode of the stored image
	int             orientation{1};         ///< EXIF orientation of the uploaded image
	nlohmann::json  exif;                   ///< selected EXIF fields of the uploaded image

	[[nodiscard]] nlohmann::json metadata() const;
};

/// Turns an uploaded image into a normalized and size-reduced one.
///
/// The stages run in order: decode, apply EXIF orientation, normalize color
/// mode, resize, recompress and extract metadata. JPEG and WebP stay in their
/// formats and are re-encoded with the configured quality. All other formats
/// are re-encoded losslessly as PNG. The output never carries EXIF tags, so it
/// will not be rotated twice.
///
/// The pipeline has no state other than its settings. It can be used by
/// multiple threads at the same time.
class ImagePipeline
{
public:
	explicit ImagePipeline(const OptimizeSetting& setting = {});

	/// \param optimize If false, the original bytes are returned unchanged but
	///                 the metadata are still extracted.
	/// \param ec       Error::unsupported_format if \a input is not an image that
	///                 can be decoded.
	ProcessedImage process(BufferView input, bool optimize, std::error_code& ec) const;

	[[nodiscard]] const OptimizeSetting& setting() const {return m_setting;}

	// stages of the pipeline
	static cv::Mat decode(BufferView input, std::error_code& ec);
	static cv::Mat apply_orientation(const cv::Mat& image, int orientation);
	static cv::Mat normalize_color(const cv::Mat& image, bool keep_alpha);
	cv::Mat resize(const cv::Mat& image) const;
	std::vector<unsigned char> recompress(const cv::Mat& image, std::string_view format, std::error_code& ec) const;

	/// Format name of a MIME type, e.g. "PNG" for "image/png".
	static std::string format_name(std::string_view mime);

	/// Format of the optimized output for an uploaded format.
	static std::string_view target_format(std::string_view format);

private:
	OptimizeSetting m_setting;
};

} // end of namespace ipt
