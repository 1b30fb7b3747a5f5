/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the image_porter
	distribution for more details.
*/

//
// Created by nestal on 11/12/2021.
//

#include "UploadOrchestrator.hh"

#include "Catalog.hh"
#include "ProviderRegistry.hh"

#include "image/ImagePipeline.hh"
#include "util/BoundedCall.hh"
#include "util/Error.hh"
#include "util/Log.hh"

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>

#include <algorithm>

namespace ipt {
namespace {

// MIME type of the optimized image
std::string stored_content_type(const ProcessedImage& image, const std::string& declared)
{
	if (!image.optimized)
		return declared;

	auto target = ImagePipeline::target_format(image.format);
	if (target == "JPEG")
		return "image/jpeg";
	else if (target == "WEBP")
		return "image/webp";
	else
		return "image/png";
}

} // end of local namespace

UploadOrchestrator::UploadOrchestrator(
	ProviderRegistry& registry,
	Catalog& catalog,
	const ImagePipeline& pipeline,
	BoundedCall& remote,
	UploadPolicy policy
) :
	m_registry{registry}, m_catalog{catalog}, m_pipeline{pipeline}, m_remote{remote}, m_policy{std::move(policy)}
{
}

bool UploadOrchestrator::is_valid_tag(const std::string& tag)
{
	return !tag.empty() && tag.size() <= max_tag_length;
}

void UploadOrchestrator::validate(const UploadRequest& request, std::error_code& ec) const
{
	if (request.data.empty())
		ec = Error::empty_file;

	else if (request.data.size() > m_policy.size_limit)
		ec = Error::file_too_large;

	else if (std::find(
		m_policy.content_types.begin(), m_policy.content_types.end(),
		boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(request.content_type))
	) == m_policy.content_types.end())
		ec = Error::unsupported_content_type;

	else if (boost::algorithm::trim_copy(request.filename).empty())
		ec = Error::invalid_filename;

	else if (!std::all_of(request.tags.begin(), request.tags.end(), &UploadOrchestrator::is_valid_tag))
		ec = Error::invalid_tag;
}

ImageRecord UploadOrchestrator::upload(const UploadRequest& request, std::error_code& ec)
{
	validate(request, ec);
	if (ec)
	{
		Log(LOG_INFO, "rejected upload of \"%1%\" from %2%: %3%", request.filename, request.user, ec.message());
		return {};
	}

	std::shared_ptr<StorageBackend> backend = m_registry.resolve(request.user, request.provider, ec);
	if (ec)
		return {};

	auto image = m_pipeline.process(buffer_view(request.data), request.optimize, ec);
	if (ec)
		return {};

	// the data must be alive until the upload finishes, even if we stop waiting for it
	auto data = std::make_shared<const std::vector<unsigned char>>(std::move(image.data));
	auto desired_path = StorageBackend::generate_path(request.user, request.filename, Timestamp::now());
	auto content_type = stored_content_type(image, request.content_type);

	auto path = m_remote.run(
		[backend, data, desired_path, content_type](std::error_code& ec)
		{
			return backend->upload(buffer_view(*data), desired_path, content_type, ec);
		},
		ec,
		[backend](std::string&& path, std::error_code ec)
		{
			// the client has been told that the upload failed
			if (ec)
				return;

			std::error_code rm_ec;
			backend->remove(path, rm_ec);
			if (rm_ec)
				Log(
					LOG_CRIT, "orphaned image %1% in provider %2% after a timed out upload: %3%",
					path, backend->provider().id, rm_ec.message()
				);
			else
				Log(LOG_NOTICE, "removed %1% from provider %2% after a timed out upload", path, backend->provider().id);
		}
	);
	if (ec)
	{
		Log(LOG_WARNING, "cannot upload \"%1%\" to provider %2%: %3%", request.filename, backend->provider().id, ec.message());
		return {};
	}

	ImageRecord record;
	record.id           = ObjectID::randomize();
	record.owner        = request.user;
	record.provider     = backend->provider().id;
	record.filename     = request.filename;
	record.file_size    = request.data.size();
	record.content_type = request.content_type;
	record.storage_path = path;
	record.width        = image.size.width();
	record.height       = image.size.height();
	record.is_optimized = image.optimized;
	if (image.optimized)
	{
		record.optimized_size = data->size();
		record.optimization_percentage = optimization_percentage(record.file_size, data->size());
	}
	record.tags         = request.tags;
	record.metadata     = image.metadata();
	record.created      = record.updated = Timestamp::now();

	m_catalog.add_image(record, ec);
	if (ec)
	{
		Log(LOG_WARNING, "cannot save image record of %1% in provider %2%: %3%", path, backend->provider().id, ec.message());

		// undo the upload
		std::error_code rm_ec;
		m_remote.run([backend, path](std::error_code& ec)
		{
			return backend->remove(path, ec);
		}, rm_ec);

		if (rm_ec)
			Log(
				LOG_CRIT, "orphaned image %1% in provider %2%: cannot save record (%3%) nor remove image (%4%)",
				path, backend->provider().id, ec.message(), rm_ec.message()
			);
		return {};
	}

	Log(
		LOG_INFO, "user %1% uploaded %2% (%3% bytes, stored %4% bytes) to %5%",
		request.user, path, record.file_size, data->size(), backend->provider().id
	);
	return record;
}

ImageRecord UploadOrchestrator::load(const UserID& user, const ObjectID& id, std::error_code& ec)
{
	auto image = m_catalog.find_image(user, id, ec);
	if (!ec && !image)
		ec = Error::object_not_exist;
	return ec ? ImageRecord{} : std::move(*image);
}

void UploadOrchestrator::remove(const UserID& user, const ObjectID& id, std::error_code& ec)
{
	auto image = load(user, id, ec);
	if (ec)
		return;

	std::optional<StorageProvider> provider;
	if (image.provider)
	{
		provider = m_catalog.find_provider(user, *image.provider, ec);
		if (ec)
			return;
	}

	// images of removed providers only have their records
	if (provider)
	{
		std::shared_ptr<StorageBackend> backend = m_registry.backend(*provider);

		auto& catalog = m_catalog;
		auto result = m_remote.run(
			[backend, path=image.storage_path](std::error_code& ec)
			{
				return backend->remove(path, ec);
			},
			ec,
			[&catalog, user, id](RemoveResult&&, std::error_code ec)
			{
				// the image is gone after all, so is its record
				if (ec)
					return;

				std::error_code db_ec;
				catalog.remove_image(user, id, db_ec);
				if (db_ec)
					Log(LOG_CRIT, "stale image record %1% after a timed out removal: %2%", id, db_ec.message());
			}
		);
		if (ec)
		{
			Log(LOG_WARNING, "cannot remove %1% from provider %2%: %3%", image.storage_path, provider->id, ec.message());
			return;
		}
		if (result == RemoveResult::not_found)
			Log(LOG_NOTICE, "image %1% was already removed from provider %2%", image.storage_path, provider->id);
	}

	if (!m_catalog.remove_image(user, id, ec) && ec)
	{
		Log(
			LOG_CRIT, "stale image record %1%: image %2% was removed from its provider but not its record (%3%)",
			id, image.storage_path, ec.message()
		);
		return;
	}

	Log(LOG_INFO, "user %1% removed image %2%", user, id);
}

std::optional<ImageRecord> UploadOrchestrator::find(const UserID& user, const ObjectID& id, std::error_code& ec)
{
	return m_catalog.find_image(user, id, ec);
}

std::vector<ImageRecord> UploadOrchestrator::list(const UserID& user, const ImageQuery& query, std::error_code& ec)
{
	return m_catalog.list_images(user, query, ec);
}

ImageRecord UploadOrchestrator::update(const UserID& user, const ObjectID& id, const ImageUpdate& update, std::error_code& ec)
{
	if (update.tags && !std::all_of(update.tags->begin(), update.tags->end(), &UploadOrchestrator::is_valid_tag))
	{
		ec = Error::invalid_tag;
		return {};
	}
	if (update.metadata && !update.metadata->is_object())
	{
		ec = Error::invalid_metadata;
		return {};
	}

	auto image = load(user, id, ec);
	if (ec)
		return {};

	if (update.tags)
		image.tags = *update.tags;
	if (update.metadata)
		image.metadata = *update.metadata;
	image.updated = Timestamp::now();

	m_catalog.update_image(image, ec);
	return ec ? ImageRecord{} : image;
}

ImageStats UploadOrchestrator::stats(const UserID& user, std::error_code& ec)
{
	return m_catalog.image_stats(user, ec);
}

std::string UploadOrchestrator::public_url(const UserID& user, const ObjectID& id, std::error_code& ec)
{
	auto image = load(user, id, ec);
	if (ec)
		return {};

	if (!image.provider)
	{
		ec = Error::provider_not_found;
		return {};
	}

	auto provider = m_catalog.find_provider(user, *image.provider, ec);
	if (ec)
		return {};
	if (!provider)
	{
		ec = Error::provider_not_found;
		return {};
	}

	return m_registry.backend(*provider)->public_url(image.storage_path, ec);
}

} // end of namespace ipt
