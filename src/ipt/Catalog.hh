/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the image_porter
	distribution for more details.
*/

//
// Created by nestal on 6/12/2021.
//

#pragma once

#include "ImageRecord.hh"
#include "StorageProvider.hh"

#include "util/Configuration.hh"

#include <optional>
#include <system_error>
#include <vector>

namespace ipt {

/// Whether Catalog::update_provider() writes the `is_default` flag.
enum class DefaultFlag
{
	keep,
	replace
};

/// Durable storage of providers and image records.
///
/// All operations are scoped to a user: a provider or image of another user
/// is treated as if it does not exist.
///
/// The operations that change the default provider of a user serialize with
/// each other, so that at most one provider of each user is the default at any
/// time. Implementations must run each of them atomically.
///
/// Errors are reported by \a ec. Absent records are not errors for the find
/// functions: they return std::nullopt.
class Catalog
{
public:
	virtual ~Catalog() = default;

	/// Inserts a new provider. If it is the default, the previous default of
	/// the owner is cleared in the same atomic step.
	/// \param ec   Error::duplicate_name if the owner has another provider with
	///             the same name.
	virtual void add_provider(const StorageProvider& provider, std::error_code& ec) = 0;

	/// Replaces the fields of an existing provider. The stored `is_default` flag
	/// is only written with DefaultFlag::replace, otherwise a concurrent
	/// set_default() is preserved. Same atomicity as add_provider().
	/// \return the provider as stored
	/// \param ec   Error::provider_not_found, Error::duplicate_name
	virtual StorageProvider update_provider(const StorageProvider& provider, DefaultFlag flag, std::error_code& ec) = 0;

	/// Makes a provider the default of its owner and clears the previous one.
	/// \param ec   Error::provider_not_found, or Error::provider_inactive if the
	///             provider is inactive at the time it is locked.
	virtual StorageProvider set_default(const UserID& owner, const ObjectID& id, std::error_code& ec) = 0;

	/// Removes a provider after checking the images stored in it.
	/// \return the number of images detached from the provider
	/// \param ec   Error::provider_in_use if the policy is ProviderDeletePolicy::block
	///             and some images are stored in the provider.
	virtual std::size_t remove_provider(
		const UserID& owner, const ObjectID& id, ProviderDeletePolicy policy, std::error_code& ec
	) = 0;

	virtual std::optional<StorageProvider> find_provider(const UserID& owner, const ObjectID& id, std::error_code& ec) = 0;

	/// The default provider of the user, if any.
	virtual std::optional<StorageProvider> find_default(const UserID& owner, std::error_code& ec) = 0;

	/// The default provider comes first, then the newest.
	virtual std::vector<StorageProvider> list_providers(const UserID& owner, std::error_code& ec) = 0;

	/// \param ec   Error::provider_not_found if the provider of the image is removed
	///             in the meantime.
	virtual void add_image(const ImageRecord& image, std::error_code& ec) = 0;

	/// Only the tags, metadata and the update time are written.
	/// \param ec   Error::object_not_exist
	virtual void update_image(const ImageRecord& image, std::error_code& ec) = 0;

	/// \return false if the image does not exist
	virtual bool remove_image(const UserID& owner, const ObjectID& id, std::error_code& ec) = 0;

	virtual std::optional<ImageRecord> find_image(const UserID& owner, const ObjectID& id, std::error_code& ec) = 0;

	/// Newest first.
	virtual std::vector<ImageRecord> list_images(const UserID& owner, const ImageQuery& query, std::error_code& ec) = 0;

	virtual ImageStats image_stats(const UserID& owner, std::error_code& ec) = 0;
};

} // end of namespace ipt
