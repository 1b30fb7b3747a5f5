/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the image_porter
	distribution for more details.
*/

//
// Created by nestal on 11/12/2021.
//

#pragma once

#include "ImageRecord.hh"
#include "ObjectID.hh"
#include "UserID.hh"

#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace ipt {

class BoundedCall;
class Catalog;
class ImagePipeline;
class ProviderRegistry;

struct UploadRequest
{
	UserID                      user;
	std::string                 filename;
	std::string                 content_type;   ///< as declared by the client
	std::vector<unsigned char>  data;
	std::optional<ObjectID>     provider;       ///< the default provider if empty
	std::vector<std::string>    tags;
	bool                        optimize{true};
};

/// Limits of the uploads accepted by UploadOrchestrator.
struct UploadPolicy
{
	std::size_t                 size_limit{50 * 1024 * 1024};
	std::vector<std::string>    content_types{
		"image/jpeg", "image/jpg", "image/png", "image/gif", "image/webp"
	};
};

/// Stores uploaded images in the storage providers and keeps the image records
/// in the Catalog consistent with them.
///
/// An image record is written only after its image is stored. When one of the
/// two writes fails, the other one is undone. If undoing fails too, the
/// inconsistency is logged with LOG_CRIT.
class UploadOrchestrator
{
public:
	static constexpr std::size_t max_tag_length = 50;

public:
	UploadOrchestrator(
		ProviderRegistry& registry,
		Catalog& catalog,
		const ImagePipeline& pipeline,
		BoundedCall& remote,
		UploadPolicy policy = {}
	);

	ImageRecord upload(const UploadRequest& request, std::error_code& ec);

	/// Removes the image from its provider, then its record. The record is kept
	/// if the image cannot be removed from the provider.
	void remove(const UserID& user, const ObjectID& id, std::error_code& ec);

	std::optional<ImageRecord> find(const UserID& user, const ObjectID& id, std::error_code& ec);
	std::vector<ImageRecord> list(const UserID& user, const ImageQuery& query, std::error_code& ec);
	ImageRecord update(const UserID& user, const ObjectID& id, const ImageUpdate& update, std::error_code& ec);
	ImageStats stats(const UserID& user, std::error_code& ec);
	std::string public_url(const UserID& user, const ObjectID& id, std::error_code& ec);

	[[nodiscard]] const UploadPolicy& policy() const {return m_policy;}

	static bool is_valid_tag(const std::string& tag);

private:
	void validate(const UploadRequest& request, std::error_code& ec) const;
	ImageRecord load(const UserID& user, const ObjectID& id, std::error_code& ec);

private:
	ProviderRegistry&       m_registry;
	Catalog&                m_catalog;
	const ImagePipeline&    m_pipeline;
	BoundedCall&            m_remote;
	UploadPolicy            m_policy;
};

} // end of namespace ipt
