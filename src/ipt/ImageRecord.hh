/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the image_porter
	distribution for more details.
*/

//
// Created by nestal on 5/12/2021.
//

#pragma once

#include "ObjectID.hh"
#include "UserID.hh"

#include "util/Timestamp.hh"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ipt {

// An image stored in a remote storage provider. It is created only after the
// image is uploaded successfully. After that, only tags and metadata can be
// changed.
struct ImageRecord
{
	ObjectID        id;
	UserID          owner;

	/// The provider where the image is stored. Empty if the provider is removed
	/// with ProviderDeletePolicy::detach.
	std::optional<ObjectID> provider;

	std::string     filename;
	std::size_t     file_size{};
	std::string     content_type;

	/// Relative to the root of the provider, e.g. "alice/2021/12/20211205_083000_1a2b3c4d_cat.jpg"
	std::string     storage_path;

	int             width{};
	int             height{};

	bool            is_optimized{false};
	std::optional<std::size_t>  optimized_size;

	/// Stored when the image is created, never recomputed. Negative if the
	/// optimized image is larger than the uploaded one.
	std::optional<double>       optimization_percentage;

	std::vector<std::string>    tags;
	nlohmann::json              metadata = nlohmann::json::object();

	Timestamp       created;
	Timestamp       updated;
};

/// (file_size - optimized_size) / file_size * 100
double optimization_percentage(std::size_t file_size, std::size_t optimized_size);

/// The JSON representation includes "size_mb" and "optimized_size_mb" for display.
void to_json(nlohmann::json& dest, const ImageRecord& src);

struct ImageQuery
{
	std::size_t             offset{0};
	std::size_t             limit{100};
	std::optional<ObjectID> provider;
};

struct ImageUpdate
{
	std::optional<std::vector<std::string>> tags;
	std::optional<nlohmann::json>           metadata;
};

struct ImageStats
{
	std::size_t total_images{};
	std::size_t total_size{};       ///< sum of file_size in bytes
	std::size_t optimized_images{};
	std::int64_t total_saved{};     ///< sum of (file_size - optimized_size) of optimized images
};

void to_json(nlohmann::json& dest, const ImageStats& src);

/// Megabytes rounded to two decimal places.
double to_mb(double bytes);

} // end of namespace ipt
