/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the image_porter
	distribution for more details.
*/

//
// Created by nestal on 1/Mar/18.
//

#include "EXIF2.hh"

#include <boost/algorithm/string/trim.hpp>

namespace ipt {
namespace {

struct SelectedTag
{
	::ExifTag   tag;
	const char  *name;
};

const SelectedTag selected_tags[] = {
	{EXIF_TAG_MAKE,                 "Make"},
	{EXIF_TAG_MODEL,                "Model"},
	{EXIF_TAG_DATE_TIME,            "DateTime"},
	{EXIF_TAG_DATE_TIME_ORIGINAL,   "DateTimeOriginal"},
};

} // end of local namespace

EXIF2::EXIF2(BufferView jpeg) :
	m_data{jpeg.empty() ? nullptr : ::exif_data_new_from_data(jpeg.data(), static_cast<unsigned>(jpeg.size()))}
{
}

EXIF2::~EXIF2() = default;

std::optional<int> EXIF2::orientation() const
{
	if (!m_data)
		return std::nullopt;

	auto entry = exif_data_get_entry(m_data.get(), EXIF_TAG_ORIENTATION);
	if (!entry || entry->format != EXIF_FORMAT_SHORT || entry->components < 1)
		return std::nullopt;

	auto value = ::exif_get_short(entry->data, ::exif_data_get_byte_order(m_data.get()));
	return value >= 1 && value <= 8 ? std::optional<int>{value} : std::nullopt;
}

std::optional<std::string> EXIF2::get(::ExifTag tag) const
{
	if (!m_data)
		return std::nullopt;

	if (auto entry = exif_data_get_entry(m_data.get(), tag); entry)
	{
		char buf[1024] = {};
		::exif_entry_get_value(entry, buf, sizeof(buf));

		// cameras like to pad the strings with spaces
		std::string value{buf};
		boost::algorithm::trim(value);
		if (!value.empty())
			return value;
	}
	return std::nullopt;
}

nlohmann::json EXIF2::fields() const
{
	auto result = nlohmann::json::object();
	for (auto&& selected : selected_tags)
	{
		if (auto value = get(selected.tag))
			result.emplace(selected.name, *value);
	}
	return result;
}

void EXIF2::Unref::operator()(::ExifData *data) const
{
	if (data)
		::exif_data_unref(data);
}

} // end of namespace
