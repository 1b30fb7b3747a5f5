/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the image_porter
	distribution for more details.
*/

//
// Created by nestal on 7/12/2021.
//

#pragma once

#include "Catalog.hh"

#include "net/Postgres.hh"

#include <mutex>
#include <string>

namespace ipt {

/// Catalog in a PostgreSQL database.
///
/// Changing the default provider locks all provider rows of the user with
/// `SELECT ... FOR UPDATE` in a transaction, which serializes concurrent callers
/// even across processes. A partial unique index on `(owner) WHERE is_default`
/// guarantees the invariant in case anything slips through. Such a violation is
/// reported as Error::default_contention.
class PostgresCatalog : public Catalog
{
public:
	/// Connects to the database and creates the tables if they do not exist.
	/// \throw std::runtime_error if the connection or the schema fails.
	explicit PostgresCatalog(const std::string& connection_string);

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

	/// Drops all tables. Only for tests.
	void drop_all(std::error_code& ec);

private:
	void create_schema();

	// must be called with m_mutex locked and inside a transaction
	void lock_providers(const UserID& owner, std::error_code& ec);
	void clear_default(const UserID& owner, const ObjectID& except, std::error_code& ec);

private:
	// libpq connections are not thread-safe
	std::mutex          m_mutex;
	postgres::Session   m_db;
};

} // end of namespace ipt
