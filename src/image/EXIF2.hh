/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the image_porter
	distribution for more details.
*/

//
// Created by nestal on 1/Mar/18.
//

#pragma once

#include "util/BufferView.hh"

// libexif to read EXIF2 tags
#include <libexif/exif-data.h>

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <string>

namespace ipt {

/// Read-only access to the EXIF2 tags of a JPEG image.
class EXIF2
{
public:
	explicit EXIF2(BufferView jpeg);
	EXIF2(EXIF2&&) = default;
	EXIF2(const EXIF2&) = delete;
	~EXIF2();

	EXIF2& operator=(EXIF2&&) = default;
	EXIF2& operator=(const EXIF2&) = delete;

	[[nodiscard]] explicit operator bool() const noexcept {return m_data != nullptr;}

	/// Value of the orientation tag (1 to 8), or std::nullopt if the tag is absent
	/// or out of range.
	[[nodiscard]] std::optional<int> orientation() const;

	/// Text representation of a tag, e.g. "Canon" for EXIF_TAG_MAKE.
	[[nodiscard]] std::optional<std::string> get(::ExifTag tag) const;

	/// Make, Model, DateTime and DateTimeOriginal, whichever are present.
	[[nodiscard]] nlohmann::json fields() const;

private:
	// Use unique_ptr to ensure the ExifData will be freed.
	struct Unref
	{
		void operator()(::ExifData*) const;
	};
	std::unique_ptr<::ExifData, Unref>  m_data;
};

} // end of namespace
