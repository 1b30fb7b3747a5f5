/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the image_porter
	distribution for more details.
*/

//
// Created by nestal on 7/12/2021.
//

#include "PostgresCatalog.hh"

#include "util/Error.hh"
#include "util/Log.hh"

#include <stdexcept>

namespace ipt {
namespace {

const char* schema[] = {
	R"(CREATE TABLE IF NOT EXISTS storage_providers (
		id                      bytea PRIMARY KEY,
		owner                   text NOT NULL,
		name                    text NOT NULL,
		provider_type           text NOT NULL,
		config                  jsonb NOT NULL,
		encrypted_credentials   bytea,
		is_default              boolean NOT NULL DEFAULT false,
		is_active               boolean NOT NULL DEFAULT true,
		created                 bigint NOT NULL,
		updated                 bigint NOT NULL,
		CONSTRAINT storage_providers_unique_name UNIQUE (owner, name)
	))",
	R"(CREATE UNIQUE INDEX IF NOT EXISTS storage_providers_one_default
		ON storage_providers (owner) WHERE is_default)",
	R"(CREATE TABLE IF NOT EXISTS images (
		id                      bytea PRIMARY KEY,
		owner                   text NOT NULL,
		provider                bytea REFERENCES storage_providers (id),
		filename                text NOT NULL,
		file_size               bigint NOT NULL,
		content_type            text NOT NULL,
		storage_path            text NOT NULL,
		width                   integer NOT NULL,
		height                  integer NOT NULL,
		is_optimized            boolean NOT NULL,
		optimized_size          bigint,
		optimization_percentage double precision,
		tags                    jsonb NOT NULL,
		metadata                jsonb NOT NULL,
		created                 bigint NOT NULL,
		updated                 bigint NOT NULL,
		CONSTRAINT images_unique_path UNIQUE (provider, storage_path)
	))",
	R"(CREATE INDEX IF NOT EXISTS images_by_owner ON images (owner, created DESC))"
};

const std::string provider_columns =
	"id, owner, name, provider_type, config, encrypted_credentials, is_default, is_active, created, updated";

const std::string image_columns =
	"id, owner, provider, filename, file_size, content_type, storage_path, width, height, "
	"is_optimized, optimized_size, optimization_percentage, tags, metadata, created, updated";

ObjectID read_id(const postgres::Result& result, int row, int col)
{
	auto raw = result.bytea(row, col);
	ObjectID id{};
	if (raw.size() == id.size())
		std::copy(raw.begin(), raw.end(), id.begin());
	return id;
}

Timestamp read_time(const postgres::Result& result, int row, int col)
{
	return Timestamp{Timestamp::duration{result.integer(row, col)}};
}

StorageProvider read_provider(const postgres::Result& result, int row)
{
	StorageProvider p;
	p.id        = read_id(result, row, 0);
	p.owner     = UserID{result.text(row, 1)};
	p.name      = result.text(row, 2);
	p.type      = parse_provider_type(result.text(row, 3)).value_or(ProviderType::object_store);
	p.config    = nlohmann::json::parse(result.text(row, 4));
	p.encrypted_credentials = result.bytea(row, 5);
	p.is_default = result.boolean(row, 6);
	p.is_active  = result.boolean(row, 7);
	p.created   = read_time(result, row, 8);
	p.updated   = read_time(result, row, 9);
	return p;
}

ImageRecord read_image(const postgres::Result& result, int row)
{
	ImageRecord i;
	i.id        = read_id(result, row, 0);
	i.owner     = UserID{result.text(row, 1)};
	if (!result.is_null(row, 2))
		i.provider = read_id(result, row, 2);
	i.filename      = result.text(row, 3);
	i.file_size     = static_cast<std::size_t>(result.integer(row, 4));
	i.content_type  = result.text(row, 5);
	i.storage_path  = result.text(row, 6);
	i.width         = static_cast<int>(result.integer(row, 7));
	i.height        = static_cast<int>(result.integer(row, 8));
	i.is_optimized  = result.boolean(row, 9);
	if (!result.is_null(row, 10))
		i.optimized_size = static_cast<std::size_t>(result.integer(row, 10));
	if (!result.is_null(row, 11))
		i.optimization_percentage = result.real(row, 11);
	i.tags      = nlohmann::json::parse(result.text(row, 12)).get<std::vector<std::string>>();
	i.metadata  = nlohmann::json::parse(result.text(row, 13));
	i.created   = read_time(result, row, 14);
	i.updated   = read_time(result, row, 15);
	return i;
}

} // end of local namespace

PostgresCatalog::PostgresCatalog(const std::string& connection_string) : m_db{connection_string}
{
	create_schema();
}

void PostgresCatalog::create_schema()
{
	std::unique_lock lock{m_mutex};
	for (auto&& statement : schema)
	{
		std::error_code ec;
		m_db.query(statement, ec);
		if (ec)
			throw std::runtime_error("cannot create database schema: " + std::string{m_db.last_error()});
	}
}

void PostgresCatalog::drop_all(std::error_code& ec)
{
	std::unique_lock lock{m_mutex};
	m_db.query("DROP TABLE IF EXISTS images, storage_providers", ec);
	if (!ec)
	{
		lock.unlock();
		create_schema();
	}
}

void PostgresCatalog::lock_providers(const UserID& owner, std::error_code& ec)
{
	m_db.query("SELECT id FROM storage_providers WHERE owner = $1 FOR UPDATE", ec, owner.username());
}

void PostgresCatalog::clear_default(const UserID& owner, const ObjectID& except, std::error_code& ec)
{
	m_db.query(
		"UPDATE storage_providers SET is_default = false, updated = $3 "
		"WHERE owner = $1 AND is_default AND id <> $2",
		ec, owner.username(), except, Timestamp::now().time_since_epoch().count()
	);
}

void PostgresCatalog::add_provider(const StorageProvider& provider, std::error_code& ec)
{
	std::unique_lock lock{m_mutex};
	postgres::Transaction tx{m_db, ec};
	if (ec)
		return;

	if (provider.is_default)
	{
		lock_providers(provider.owner, ec);
		if (!ec)
			clear_default(provider.owner, provider.id, ec);
		if (ec)
			return;
	}

	auto result = m_db.query(
		"INSERT INTO storage_providers (" + provider_columns + ") "
		"VALUES ($1, $2, $3, $4, $5::jsonb, $6, $7, $8, $9, $10)",
		ec,
		provider.id, provider.owner.username(), provider.name, to_string(provider.type),
		provider.config.dump(),
		provider.has_credentials() ? std::optional{provider.encrypted_credentials} : std::nullopt,
		provider.is_default, provider.is_active,
		provider.created.time_since_epoch().count(), provider.updated.time_since_epoch().count()
	);
	if (ec)
	{
		if (result.unique_violation())
			ec = result.constraint() == "storage_providers_unique_name" ? Error::duplicate_name : Error::default_contention;
		return;
	}

	tx.commit(ec);
}

StorageProvider PostgresCatalog::update_provider(const StorageProvider& provider, DefaultFlag flag, std::error_code& ec)
{
	std::unique_lock lock{m_mutex};
	postgres::Transaction tx{m_db, ec};
	if (ec)
		return {};

	// writing is_default serializes with set_default() on the same rows
	auto replace_default = (flag == DefaultFlag::replace);
	if (replace_default)
	{
		lock_providers(provider.owner, ec);
		if (!ec && provider.is_default)
			clear_default(provider.owner, provider.id, ec);
		if (ec)
			return {};
	}

	auto result = m_db.query(
		"UPDATE storage_providers SET name = $3, provider_type = $4, config = $5::jsonb, "
		"encrypted_credentials = $6, is_default = CASE WHEN $10::boolean THEN $7::boolean ELSE is_default END, "
		"is_active = $8, updated = $9 "
		"WHERE owner = $1 AND id = $2 RETURNING " + provider_columns,
		ec,
		provider.owner.username(), provider.id, provider.name, to_string(provider.type),
		provider.config.dump(),
		provider.has_credentials() ? std::optional{provider.encrypted_credentials} : std::nullopt,
		provider.is_default, provider.is_active,
		provider.updated.time_since_epoch().count(),
		replace_default
	);
	if (ec)
	{
		if (result.unique_violation())
			ec = result.constraint() == "storage_providers_unique_name" ? Error::duplicate_name : Error::default_contention;
		return {};
	}
	if (result.tuples() == 0)
	{
		ec = Error::provider_not_found;
		return {};
	}

	tx.commit(ec);
	return ec ? StorageProvider{} : read_provider(result, 0);
}

StorageProvider PostgresCatalog::set_default(const UserID& owner, const ObjectID& id, std::error_code& ec)
{
	std::unique_lock lock{m_mutex};
	postgres::Transaction tx{m_db, ec};
	if (ec)
		return {};

	// lock all providers of the user: concurrent callers wait here
	lock_providers(owner, ec);
	if (ec)
		return {};

	auto locked = m_db.query(
		"SELECT is_active FROM storage_providers WHERE owner = $1 AND id = $2",
		ec, owner.username(), id
	);
	if (ec)
		return {};

	if (locked.tuples() == 0)
	{
		ec = Error::provider_not_found;
		return {};
	}
	if (!locked.boolean(0, 0))
	{
		ec = Error::provider_inactive;
		return {};
	}

	clear_default(owner, id, ec);
	if (ec)
		return {};

	auto result = m_db.query(
		"UPDATE storage_providers SET is_default = true, updated = $3 "
		"WHERE owner = $1 AND id = $2 RETURNING " + provider_columns,
		ec, owner.username(), id, Timestamp::now().time_since_epoch().count()
	);
	if (ec)
	{
		if (result.unique_violation())
			ec = Error::default_contention;
		return {};
	}

	tx.commit(ec);
	return ec ? StorageProvider{} : read_provider(result, 0);
}

std::size_t PostgresCatalog::remove_provider(const UserID& owner, const ObjectID& id, ProviderDeletePolicy policy, std::error_code& ec)
{
	std::unique_lock lock{m_mutex};
	postgres::Transaction tx{m_db, ec};
	if (ec)
		return 0;

	auto locked = m_db.query(
		"SELECT id FROM storage_providers WHERE owner = $1 AND id = $2 FOR UPDATE",
		ec, owner.username(), id
	);
	if (ec)
		return 0;
	if (locked.tuples() == 0)
	{
		ec = Error::provider_not_found;
		return 0;
	}

	auto count = m_db.query("SELECT count(*) FROM images WHERE owner = $1 AND provider = $2", ec, owner.username(), id);
	if (ec)
		return 0;

	auto in_use = static_cast<std::size_t>(count.integer(0, 0));
	if (in_use > 0)
	{
		if (policy == ProviderDeletePolicy::block)
		{
			ec = Error::provider_in_use;
			return 0;
		}

		m_db.query(
			"UPDATE images SET provider = NULL, updated = $3, "
			"metadata = metadata || '{\"provider_deleted\": true}'::jsonb "
			"WHERE owner = $1 AND provider = $2",
			ec, owner.username(), id, Timestamp::now().time_since_epoch().count()
		);
		if (ec)
			return 0;
	}

	auto result = m_db.query("DELETE FROM storage_providers WHERE owner = $1 AND id = $2", ec, owner.username(), id);
	if (ec)
	{
		// an image was inserted after counting
		if (result.foreign_key_violation())
			ec = Error::provider_in_use;
		return 0;
	}

	tx.commit(ec);
	return ec ? 0 : in_use;
}

std::optional<StorageProvider> PostgresCatalog::find_provider(const UserID& owner, const ObjectID& id, std::error_code& ec)
{
	std::unique_lock lock{m_mutex};
	auto result = m_db.query(
		"SELECT " + provider_columns + " FROM storage_providers WHERE owner = $1 AND id = $2",
		ec, owner.username(), id
	);
	if (ec || result.tuples() == 0)
		return std::nullopt;

	return read_provider(result, 0);
}

std::optional<StorageProvider> PostgresCatalog::find_default(const UserID& owner, std::error_code& ec)
{
	std::unique_lock lock{m_mutex};
	auto result = m_db.query(
		"SELECT " + provider_columns + " FROM storage_providers WHERE owner = $1 AND is_default",
		ec, owner.username()
	);
	if (ec || result.tuples() == 0)
		return std::nullopt;

	return read_provider(result, 0);
}

std::vector<StorageProvider> PostgresCatalog::list_providers(const UserID& owner, std::error_code& ec)
{
	std::unique_lock lock{m_mutex};
	auto result = m_db.query(
		"SELECT " + provider_columns + " FROM storage_providers WHERE owner = $1 "
		"ORDER BY is_default DESC, created DESC",
		ec, owner.username()
	);
	if (ec)
		return {};

	std::vector<StorageProvider> providers;
	for (int row = 0; row < result.tuples(); ++row)
		providers.push_back(read_provider(result, row));
	return providers;
}

void PostgresCatalog::add_image(const ImageRecord& image, std::error_code& ec)
{
	std::unique_lock lock{m_mutex};
	auto result = m_db.query(
		"INSERT INTO images (" + image_columns + ") VALUES "
		"($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12, $13::jsonb, $14::jsonb, $15, $16)",
		ec,
		image.id, image.owner.username(), image.provider, image.filename,
		static_cast<std::int64_t>(image.file_size), image.content_type, image.storage_path,
		image.width, image.height, image.is_optimized,
		image.optimized_size ? std::optional{static_cast<std::int64_t>(*image.optimized_size)} : std::nullopt,
		image.optimization_percentage,
		nlohmann::json(image.tags).dump(), image.metadata.dump(),
		image.created.time_since_epoch().count(), image.updated.time_since_epoch().count()
	);
	if (ec && result.foreign_key_violation())
		ec = Error::provider_not_found;
}

void PostgresCatalog::update_image(const ImageRecord& image, std::error_code& ec)
{
	std::unique_lock lock{m_mutex};
	auto result = m_db.query(
		"UPDATE images SET tags = $3::jsonb, metadata = $4::jsonb, updated = $5 WHERE owner = $1 AND id = $2",
		ec,
		image.owner.username(), image.id,
		nlohmann::json(image.tags).dump(), image.metadata.dump(),
		image.updated.time_since_epoch().count()
	);
	if (!ec && result.affected() == 0)
		ec = Error::object_not_exist;
}

bool PostgresCatalog::remove_image(const UserID& owner, const ObjectID& id, std::error_code& ec)
{
	std::unique_lock lock{m_mutex};
	auto result = m_db.query("DELETE FROM images WHERE owner = $1 AND id = $2", ec, owner.username(), id);
	return !ec && result.affected() > 0;
}

std::optional<ImageRecord> PostgresCatalog::find_image(const UserID& owner, const ObjectID& id, std::error_code& ec)
{
	std::unique_lock lock{m_mutex};
	auto result = m_db.query(
		"SELECT " + image_columns + " FROM images WHERE owner = $1 AND id = $2",
		ec, owner.username(), id
	);
	if (ec || result.tuples() == 0)
		return std::nullopt;

	return read_image(result, 0);
}

std::vector<ImageRecord> PostgresCatalog::list_images(const UserID& owner, const ImageQuery& query, std::error_code& ec)
{
	std::unique_lock lock{m_mutex};
	auto result = m_db.query(
		"SELECT " + image_columns + " FROM images "
		"WHERE owner = $1 AND ($2::bytea IS NULL OR provider = $2::bytea) "
		"ORDER BY created DESC OFFSET $3 LIMIT $4",
		ec,
		owner.username(), query.provider,
		static_cast<std::int64_t>(query.offset), static_cast<std::int64_t>(query.limit)
	);
	if (ec)
		return {};

	std::vector<ImageRecord> images;
	for (int row = 0; row < result.tuples(); ++row)
		images.push_back(read_image(result, row));
	return images;
}

ImageStats PostgresCatalog::image_stats(const UserID& owner, std::error_code& ec)
{
	std::unique_lock lock{m_mutex};
	auto result = m_db.query(
		"SELECT count(*), coalesce(sum(file_size), 0), "
		"count(*) FILTER (WHERE is_optimized AND optimized_size IS NOT NULL), "
		"coalesce(sum(file_size - optimized_size) FILTER (WHERE is_optimized AND optimized_size IS NOT NULL), 0) "
		"FROM images WHERE owner = $1",
		ec, owner.username()
	);
	if (ec || result.tuples() == 0)
		return {};

	ImageStats stats;
	stats.total_images      = static_cast<std::size_t>(result.integer(0, 0));
	stats.total_size        = static_cast<std::size_t>(result.integer(0, 1));
	stats.optimized_images  = static_cast<std::size_t>(result.integer(0, 2));
	stats.total_saved       = result.integer(0, 3);
	return stats;
}

} // end of namespace ipt
