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

#include "Catalog.hh"

#include <mutex>

namespace ipt {

/// Catalog in process memory. All operations hold one mutex, which makes
/// them atomic with respect to each other. Nothing survives the process, so it
/// is only useful for testing and trying out the command line tool.
class MemoryCatalog : public Catalog
{
public:
	MemoryCatalog() = default;

	void add_provider(const StorageProvider& provider, std::error_code& ec) override;
	StorageProvider update_provider(const StorageProvider& provider, DefaultFlag flag, std::error_code& ec) override;
	StorageProvider set_default(const UserID& owner, const ObjectID& id, std::error_code& ec) override;
	std::size_t remove_provider(const UserID& owner, const ObjectID& id, ProviderDeletePolicy policy, std::error_code& ec) override;
	std::optional<StorageProvider> find_provider(const UserID& owner, const ObjectID& id, std::error_code& ec) override;
	std::optional<StorageProvider> find_default(const UserID& owner, std::error_code& ec) override;
	std::vector<StorageProvider> list_providers(const UserID& owner, std::error_code& ec) override;

	void add_image(const ImageRecord& image, std::error_code& ec) override;
	void update_image(const ImageRecord& image, std::error_code& ec) override;
	bool remove_image(const UserID& owner, const ObjectID& id, std::error_code& ec) override;
	std::optional<ImageRecord> find_image(const UserID& owner, const ObjectID& id, std::error_code& ec) override;
	std::vector<ImageRecord> list_images(const UserID& owner, const ImageQuery& query, std::error_code& ec) override;
	ImageStats image_stats(const UserID& owner, std::error_code& ec) override;

private:
	std::vector<StorageProvider>::iterator provider(const UserID& owner, const ObjectID& id);
	std::vector<ImageRecord>::iterator image(const UserID& owner, const ObjectID& id);
	bool name_taken(const StorageProvider& provider) const;
	void clear_default(const UserID& owner);

private:
	std::mutex                      m_mutex;
	std::vector<StorageProvider>    m_providers;
	std::vector<ImageRecord>        m_images;
};

} // end of namespace ipt
