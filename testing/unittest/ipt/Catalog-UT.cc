/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the image_porter
	distribution for more details.
*/

//
// Created by nestal on 8/12/2021.
//

#include <catch2/catch.hpp>

#include "ipt/MemoryCatalog.hh"
#include "ipt/PostgresCatalog.hh"
#include "util/Error.hh"

#include <algorithm>
#include <cstdlib>

using namespace ipt;
using namespace std::chrono_literals;

namespace {

const UserID alice{"alice"};
const UserID bob{"bob"};

StorageProvider make_provider(const UserID& owner, std::string name, bool is_default = false)
{
	StorageProvider p;
	p.id         = ObjectID::randomize();
	p.owner      = owner;
	p.name       = std::move(name);
	p.type       = ProviderType::object_store;
	p.config     = {{"bucket", "photos"}, {"region", "us-east-1"}};
	p.encrypted_credentials = {1, 2, 3, 4};
	p.is_default = is_default;
	p.created    = p.updated = Timestamp{Timestamp::duration{1'600'000'000'000}};
	return p;
}

ImageRecord make_image(const StorageProvider& provider, Timestamp created)
{
	ImageRecord image;
	image.id            = ObjectID::randomize();
	image.owner         = provider.owner;
	image.provider      = provider.id;
	image.filename      = "cat.jpg";
	image.file_size     = 1000;
	image.content_type  = "image/jpeg";
	image.storage_path  = provider.owner.username() + "/2021/12/" + image.id.hex() + ".jpg";
	image.width         = 640;
	image.height        = 480;
	image.is_optimized  = true;
	image.optimized_size = 400;
	image.optimization_percentage = 60.0;
	image.tags          = {"cat"};
	image.metadata      = {{"format", "JPEG"}};
	image.created       = image.updated = created;
	return image;
}

void check_providers(Catalog& subject)
{
	std::error_code ec;

	auto first  = make_provider(alice, "first", true);
	auto second = make_provider(alice, "second", true);
	subject.add_provider(first, ec);
	REQUIRE(!ec);
	subject.add_provider(second, ec);
	REQUIRE(!ec);

	// adding a default provider takes over the default
	auto def = subject.find_default(alice, ec);
	REQUIRE(def.has_value());
	REQUIRE(def->id == second.id);
	REQUIRE_FALSE(subject.find_provider(alice, first.id, ec)->is_default);

	// round trip
	auto found = subject.find_provider(alice, first.id, ec);
	REQUIRE(!ec);
	REQUIRE(found.has_value());
	REQUIRE(found->name == "first");
	REQUIRE(found->config == first.config);
	REQUIRE(found->encrypted_credentials == first.encrypted_credentials);
	REQUIRE(found->created == first.created);

	// names are unique per user only
	subject.add_provider(make_provider(alice, "first"), ec);
	REQUIRE(ec == Error::duplicate_name);
	subject.add_provider(make_provider(bob, "first"), ec);
	REQUIRE(!ec);

	// other users see nothing
	REQUIRE_FALSE(subject.find_provider(bob, first.id, ec).has_value());
	subject.set_default(bob, first.id, ec);
	REQUIRE(ec == Error::provider_not_found);

	auto switched = subject.set_default(alice, first.id, ec);
	REQUIRE(!ec);
	REQUIRE(switched.is_default);
	REQUIRE(subject.find_default(alice, ec)->id == first.id);

	auto list = subject.list_providers(alice, ec);
	REQUIRE(list.size() == 2);
	REQUIRE(list.front().id == first.id);
	REQUIRE(std::count_if(list.begin(), list.end(), [](auto&& p){return p.is_default;}) == 1);

	// writing back a copy loaded before set_default() keeps the new default
	auto stale = *subject.find_provider(alice, second.id, ec);
	REQUIRE_FALSE(stale.is_default);
	subject.set_default(alice, second.id, ec);
	REQUIRE(!ec);

	stale.name = "renamed";
	auto renamed = subject.update_provider(stale, DefaultFlag::keep, ec);
	REQUIRE(!ec);
	REQUIRE(renamed.name == "renamed");
	REQUIRE(renamed.is_default);
	REQUIRE(subject.find_default(alice, ec)->id == second.id);

	subject.set_default(alice, first.id, ec);
	REQUIRE(!ec);

	// inactive providers cannot be default
	second.name       = "second";
	second.is_default = false;
	second.is_active  = false;
	REQUIRE_FALSE(subject.update_provider(second, DefaultFlag::replace, ec).is_active);
	REQUIRE(!ec);
	subject.set_default(alice, second.id, ec);
	REQUIRE(ec == Error::provider_inactive);
	REQUIRE(subject.find_default(alice, ec)->id == first.id);

	subject.update_provider(make_provider(alice, "ghost"), DefaultFlag::keep, ec);
	REQUIRE(ec == Error::provider_not_found);
}

void check_images(Catalog& subject)
{
	std::error_code ec;

	auto provider = make_provider(alice, "photos", true);
	subject.add_provider(provider, ec);
	REQUIRE(!ec);

	auto t0 = Timestamp::now();
	auto older = make_image(provider, t0);
	auto newer = make_image(provider, t0 + 1s);
	subject.add_image(older, ec);
	REQUIRE(!ec);
	subject.add_image(newer, ec);
	REQUIRE(!ec);

	auto found = subject.find_image(alice, older.id, ec);
	REQUIRE(!ec);
	REQUIRE(found.has_value());
	REQUIRE(found->provider == provider.id);
	REQUIRE(found->storage_path == older.storage_path);
	REQUIRE(found->optimized_size == older.optimized_size);
	REQUIRE(found->tags == older.tags);
	REQUIRE(found->metadata == older.metadata);
	REQUIRE_FALSE(subject.find_image(bob, older.id, ec).has_value());

	// newest first
	auto list = subject.list_images(alice, {}, ec);
	REQUIRE(list.size() == 2);
	REQUIRE(list[0].id == newer.id);
	REQUIRE(list[1].id == older.id);

	ImageQuery page;
	page.offset = 1;
	page.limit  = 10;
	list = subject.list_images(alice, page, ec);
	REQUIRE(list.size() == 1);
	REQUIRE(list[0].id == older.id);

	page.offset = 2;
	REQUIRE(subject.list_images(alice, page, ec).empty());

	auto stats = subject.image_stats(alice, ec);
	REQUIRE(!ec);
	REQUIRE(stats.total_images == 2);
	REQUIRE(stats.total_size == 2000);
	REQUIRE(stats.optimized_images == 2);
	REQUIRE(stats.total_saved == 1200);

	older.tags = {"cat", "sofa"};
	older.metadata["caption"] = "sleeping";
	subject.update_image(older, ec);
	REQUIRE(!ec);
	REQUIRE(subject.find_image(alice, older.id, ec)->tags.size() == 2);

	// providers with images cannot be removed unless the images are detached
	REQUIRE(subject.remove_provider(alice, provider.id, ProviderDeletePolicy::block, ec) == 0);
	REQUIRE(ec == Error::provider_in_use);
	REQUIRE(subject.find_provider(alice, provider.id, ec).has_value());

	REQUIRE(subject.remove_provider(alice, provider.id, ProviderDeletePolicy::detach, ec) == 2);
	REQUIRE(!ec);
	REQUIRE_FALSE(subject.find_provider(alice, provider.id, ec).has_value());

	auto detached = subject.find_image(alice, newer.id, ec);
	REQUIRE(detached.has_value());
	REQUIRE_FALSE(detached->provider.has_value());
	REQUIRE(detached->metadata["provider_deleted"] == true);

	REQUIRE(subject.remove_image(alice, newer.id, ec));
	REQUIRE(!ec);
	REQUIRE_FALSE(subject.remove_image(alice, newer.id, ec));
	REQUIRE(!ec);
	REQUIRE(subject.image_stats(alice, ec).total_images == 1);
}

std::unique_ptr<PostgresCatalog> test_database()
{
	auto conn = std::getenv("IMAGE_PORTER_TEST_DB");
	REQUIRE(conn != nullptr);

	auto db = std::make_unique<PostgresCatalog>(conn);

	std::error_code ec;
	db->drop_all(ec);
	REQUIRE(!ec);
	return db;
}

} // end of local namespace

TEST_CASE("memory catalog providers", "[normal]")
{
	MemoryCatalog subject;
	check_providers(subject);
}

TEST_CASE("memory catalog images", "[normal]")
{
	MemoryCatalog subject;
	check_images(subject);
}

TEST_CASE("memory catalog rejects images of unknown providers", "[error]")
{
	MemoryCatalog subject;

	std::error_code ec;
	subject.add_image(make_image(make_provider(alice, "ghost"), Timestamp::now()), ec);
	REQUIRE(ec == Error::provider_not_found);
	REQUIRE(subject.image_stats(alice, ec).total_images == 0);
}

// needs a PostgreSQL database in IMAGE_PORTER_TEST_DB, e.g. "dbname=image_porter_test"
TEST_CASE("postgres catalog providers", "[.][postgres]")
{
	auto subject = test_database();
	check_providers(*subject);
}

TEST_CASE("postgres catalog images", "[.][postgres]")
{
	auto subject = test_database();
	check_images(*subject);
}
