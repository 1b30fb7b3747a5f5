/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the image_porter
	distribution for more details.
*/

//
// Created by nestal on 5/12/2021.
//

#include "ImageRecord.hh"

#include <cmath>

namespace ipt {

double optimization_percentage(std::size_t file_size, std::size_t optimized_size)
{
	if (file_size == 0)
		return 0.0;

	return (static_cast<double>(file_size) - static_cast<double>(optimized_size)) / static_cast<double>(file_size) * 100.0;
}

double to_mb(double bytes)
{
	return std::round(bytes / 1024.0 / 1024.0 * 100.0) / 100.0;
}

void to_json(nlohmann::json& dest, const ImageRecord& src)
{
	auto result = nlohmann::json::object();
	result.emplace("id",                src.id);
	result.emplace("owner",             src.owner);
	result.emplace("storage_provider",  src.provider ? nlohmann::json(*src.provider) : nlohmann::json());
	result.emplace("original_filename", src.filename);
	result.emplace("file_size",         src.file_size);
	result.emplace("size_mb",           to_mb(static_cast<double>(src.file_size)));
	result.emplace("content_type",      src.content_type);
	result.emplace("storage_path",      src.storage_path);
	result.emplace("width",             src.width);
	result.emplace("height",            src.height);
	result.emplace("is_optimized",      src.is_optimized);
	if (src.optimized_size)
	{
		result.emplace("optimized_size",    *src.optimized_size);
		result.emplace("optimized_size_mb", to_mb(static_cast<double>(*src.optimized_size)));
	}
	else
	{
		result.emplace("optimized_size",    nullptr);
		result.emplace("optimized_size_mb", nullptr);
	}
	result.emplace("optimization_percentage",
		src.optimization_percentage ? nlohmann::json(std::round(*src.optimization_percentage * 100.0) / 100.0) : nlohmann::json()
	);
	result.emplace("tags",      src.tags);
	result.emplace("metadata",  src.metadata);
	result.emplace("created",   src.created);
	result.emplace("updated",   src.updated);
	dest = std::move(result);
}

void to_json(nlohmann::json& dest, const ImageStats& src)
{
	dest = {
		{"total_images",        src.total_images},
		{"total_size",          src.total_size},
		{"total_size_mb",       to_mb(static_cast<double>(src.total_size))},
		{"optimized_images",    src.optimized_images},
		{"total_saved",         src.total_saved},
		{"total_saved_mb",      to_mb(static_cast<double>(src.total_saved))}
	};
}

} // end of namespace ipt
