/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the image_porter
	distribution for more details.
*/

//
// Created by nestal on 9/12/2021.
//

#include <catch2/catch.hpp>

#include "ipt/StorageBackend.hh"
#include "crypto/CredentialVault.hh"
#include "util/Error.hh"

#include "MockStorage.hh"

#include <regex>

using namespace ipt;

namespace {

class BackendFixture
{
public:
	BackendFixture()
	{
		provider.id     = ObjectID::randomize();
		provider.owner  = UserID{"alice"};
		provider.name   = "photos";
	}

	void setup(ProviderType type, nlohmann::json config, const Credentials& cred)
	{
		provider.type   = type;
		provider.config = std::move(config);

		std::error_code ec;
		provider.encrypted_credentials = vault.encrypt(cred, ec);
		REQUIRE(!ec);
	}

	std::unique_ptr<StorageBackend> backend()
	{
		auto result = make_backend(provider, vault, storage);
		REQUIRE(result);
		return result;
	}

protected:
	CredentialVault vault{VaultKey::generate()};
	MockStorage     storage;
	StorageProvider provider;

	const std::vector<unsigned char> data{'h', 'e', 'l', 'l', 'o'};
};

} // end of local namespace

TEST_CASE("generate storage path", "[normal]")
{
	Timestamp when{std::chrono::seconds{1638693000}};    // 2021-12-05 08:30:00 UTC

	auto path = StorageBackend::generate_path(UserID{"alice"}, "cat.jpg", when);
	REQUIRE(std::regex_match(path, std::regex{R"(alice/2021/12/20211205_083000_[0-9a-f]{8}_cat\.jpg)"}));
	REQUIRE(StorageBackend::is_valid_path(path));

	SECTION("unique suffix")
	{
		REQUIRE(StorageBackend::generate_path(UserID{"alice"}, "cat.jpg", when) != path);
	}
	SECTION("only the last component of the filename")
	{
		auto evil = StorageBackend::generate_path(UserID{"alice"}, "../../etc/passwd", when);
		REQUIRE(std::regex_match(evil, std::regex{R"(alice/2021/12/20211205_083000_[0-9a-f]{8}_passwd)"}));

		auto windows = StorageBackend::generate_path(UserID{"alice"}, R"(C:\Users\bob\dog.png)", when);
		REQUIRE(std::regex_match(windows, std::regex{R"(alice/2021/12/20211205_083000_[0-9a-f]{8}_dog\.png)"}));
	}
	SECTION("dot dot filename")
	{
		auto dots = StorageBackend::generate_path(UserID{"alice"}, "..", when);
		REQUIRE(StorageBackend::is_valid_path(dots));
	}
}

TEST_CASE("sanitize path components", "[normal]")
{
	REQUIRE(StorageBackend::sanitize("cat.jpg") == "cat.jpg");
	REQUIRE(StorageBackend::sanitize("my cat.jpg") == "my cat.jpg");
	REQUIRE(StorageBackend::sanitize("a/b") == "a_b");
	REQUIRE(StorageBackend::sanitize("a\\b") == "a_b");
	REQUIRE(StorageBackend::sanitize("line\nbreak") == "line_break");
	REQUIRE(StorageBackend::sanitize("..") == "_");
	REQUIRE(StorageBackend::sanitize(".") == "_");
	REQUIRE(StorageBackend::sanitize("") == "_");
}

TEST_CASE("validate storage paths", "[normal]")
{
	REQUIRE(StorageBackend::is_valid_path("alice/2021/12/x.jpg"));
	REQUIRE(StorageBackend::is_valid_path("x.jpg"));
	REQUIRE(StorageBackend::is_valid_path(".hidden"));
	REQUIRE_FALSE(StorageBackend::is_valid_path(""));
	REQUIRE_FALSE(StorageBackend::is_valid_path("/etc/passwd"));
	REQUIRE_FALSE(StorageBackend::is_valid_path("alice/../bob/x.jpg"));
	REQUIRE_FALSE(StorageBackend::is_valid_path("alice/./x.jpg"));
	REQUIRE_FALSE(StorageBackend::is_valid_path("alice//x.jpg"));
	REQUIRE_FALSE(StorageBackend::is_valid_path("alice/"));
	REQUIRE_FALSE(StorageBackend::is_valid_path("alice/x\ty.jpg"));
}

TEST_CASE_METHOD(BackendFixture, "object store backend", "[normal]")
{
	setup(
		ProviderType::object_store,
		{{"bucket", "my-bucket"}, {"region", "eu-west-1"}},
		{{"access_key_id", "AKID"}, {"secret_access_key", "SECRET"}}
	);
	auto subject = backend();

	std::error_code ec;
	auto path = subject->upload(buffer_view(data), "alice/x.jpg", "image/jpeg", ec);
	REQUIRE(!ec);
	REQUIRE(path == "alice/x.jpg");
	REQUIRE(storage.contains("s3:my-bucket/alice/x.jpg"));
	REQUIRE(storage.get("s3:my-bucket/alice/x.jpg")->content_type == "image/jpeg");

	// credentials are decrypted for the call
	REQUIRE(storage.last_s3.bucket == "my-bucket");
	REQUIRE(storage.last_s3.region == "eu-west-1");
	REQUIRE(storage.last_s3.access_key_id == "AKID");
	REQUIRE(storage.last_s3.secret_access_key == "SECRET");

	REQUIRE(subject->exists("alice/x.jpg", ec));
	REQUIRE(!ec);

	REQUIRE(subject->public_url("alice/x.jpg", ec) == "https://my-bucket.s3.eu-west-1.amazonaws.com/alice/x.jpg");
	REQUIRE(!ec);

	SECTION("overwrite")
	{
		const std::vector<unsigned char> other{'b', 'y', 'e'};
		subject->upload(buffer_view(other), "alice/x.jpg", "image/png", ec);
		REQUIRE(!ec);
		REQUIRE(storage.size() == 1);
		REQUIRE(storage.get("s3:my-bucket/alice/x.jpg")->data == other);
	}
	SECTION("remove twice")
	{
		REQUIRE(subject->remove("alice/x.jpg", ec) == RemoveResult::removed);
		REQUIRE(!ec);
		REQUIRE(subject->remove("alice/x.jpg", ec) == RemoveResult::not_found);
		REQUIRE(!ec);
		REQUIRE_FALSE(subject->exists("alice/x.jpg", ec));
	}
	SECTION("custom endpoint")
	{
		provider.config["endpoint_url"] = "https://minio.example.com/";
		auto minio = backend();
		REQUIRE(minio->public_url("alice/x.jpg", ec) == "https://minio.example.com/my-bucket/alice/x.jpg");
		minio->exists("alice/x.jpg", ec);
		REQUIRE(storage.last_s3.endpoint == "https://minio.example.com/");
	}
}

TEST_CASE_METHOD(BackendFixture, "blob store backend", "[normal]")
{
	setup(
		ProviderType::blob_store,
		{{"container", "images"}},
		{{"account_name", "myaccount"}, {"account_key", "KEY"}}
	);
	auto subject = backend();

	std::error_code ec;
	subject->upload(buffer_view(data), "alice/x.jpg", "image/jpeg", ec);
	REQUIRE(!ec);
	REQUIRE(storage.contains("azure:images/alice/x.jpg"));
	REQUIRE(storage.last_azure.account_name == "myaccount");
	REQUIRE(storage.last_azure.account_key == "KEY");
	REQUIRE(subject->public_url("alice/x.jpg", ec) == "https://myaccount.blob.core.windows.net/images/alice/x.jpg");
}

TEST_CASE_METHOD(BackendFixture, "cloud bucket backend", "[normal]")
{
	setup(
		ProviderType::cloud_bucket,
		{{"bucket", "gcs-bucket"}, {"project_id", "my-project"}},
		{{"credentials_json", R"({"type": "service_account"})"}}
	);
	auto subject = backend();

	std::error_code ec;
	subject->upload(buffer_view(data), "alice/x.jpg", "image/jpeg", ec);
	REQUIRE(!ec);
	REQUIRE(storage.contains("gcs:gcs-bucket/alice/x.jpg"));
	REQUIRE(storage.last_gcs.project_id == "my-project");
	REQUIRE(storage.last_gcs.credentials_json == R"({"type": "service_account"})");
	REQUIRE(subject->public_url("alice/x.jpg", ec) == "https://storage.googleapis.com/gcs-bucket/alice/x.jpg");
}

TEST_CASE_METHOD(BackendFixture, "file transfer backend", "[normal]")
{
	setup(
		ProviderType::file_transfer,
		{{"remote_path", "/srv/images/"}, {"port", 2222}},
		{{"host", "sftp.example.com"}, {"username", "bob"}, {"password", "pw"}}
	);
	auto subject = backend();

	std::error_code ec;
	subject->upload(buffer_view(data), "alice/x.jpg", "image/jpeg", ec);
	REQUIRE(!ec);
	REQUIRE(storage.contains("sftp:sftp.example.com/alice/x.jpg"));
	REQUIRE(storage.last_sftp.port == 2222);
	REQUIRE(storage.last_sftp.username == "bob");
	REQUIRE(storage.last_sftp.password == "pw");
	REQUIRE(storage.last_sftp.remote_path == "/srv/images/");
	REQUIRE(subject->public_url("alice/x.jpg", ec) == "sftp://sftp.example.com/srv/images/alice/x.jpg");
}

TEST_CASE_METHOD(BackendFixture, "connection test never writes", "[normal]")
{
	setup(
		ProviderType::object_store,
		{{"bucket", "my-bucket"}, {"region", "eu-west-1"}},
		{{"access_key_id", "AKID"}, {"secret_access_key", "SECRET"}}
	);
	auto subject = backend();

	auto result = subject->test_connection();
	REQUIRE(result.success);
	REQUIRE(storage.size() == 0);
	REQUIRE(storage.connections() == 1);

	nlohmann::json json(result);
	REQUIRE(json["status"] == "success");

	storage.fail_connect = true;
	result = subject->test_connection();
	REQUIRE_FALSE(result.success);
	REQUIRE(nlohmann::json(result)["status"] == "error");

	// no secrets in the message
	REQUIRE(result.message.find("SECRET") == std::string::npos);
	REQUIRE(storage.size() == 0);
}

TEST_CASE_METHOD(BackendFixture, "unusable credentials", "[error]")
{
	setup(
		ProviderType::object_store,
		{{"bucket", "my-bucket"}, {"region", "eu-west-1"}},
		{{"access_key_id", "AKID"}, {"secret_access_key", "SECRET"}}
	);

	std::error_code ec;
	SECTION("no credentials")
	{
		provider.encrypted_credentials.clear();
	}
	SECTION("encrypted with another key")
	{
		CredentialVault other{VaultKey::generate()};
		provider.encrypted_credentials = other.encrypt({{"access_key_id", "AKID"}, {"secret_access_key", "SECRET"}}, ec);
		REQUIRE(!ec);
	}
	SECTION("incomplete credentials")
	{
		provider.encrypted_credentials = vault.encrypt({{"access_key_id", "AKID"}}, ec);
		REQUIRE(!ec);
	}

	auto subject = backend();
	subject->upload(buffer_view(data), "alice/x.jpg", "image/jpeg", ec);
	REQUIRE(ec == Error::provider_credentials);
	REQUIRE(ec == ErrorClass::provider_connection);
	REQUIRE(storage.size() == 0);
	REQUIRE(storage.connections() == 0);
}

TEST_CASE_METHOD(BackendFixture, "remote storage failures", "[error]")
{
	setup(
		ProviderType::blob_store,
		{{"container", "images"}},
		{{"account_name", "myaccount"}, {"account_key", "KEY"}}
	);
	auto subject = backend();

	std::error_code ec;
	SECTION("cannot connect")
	{
		storage.fail_connect = true;
		subject->upload(buffer_view(data), "alice/x.jpg", "image/jpeg", ec);
		REQUIRE(ec == ErrorClass::provider_connection);
	}
	SECTION("cannot remove")
	{
		storage.fail_remove = true;
		subject->remove("alice/x.jpg", ec);
		REQUIRE(ec == Error::provider_connection_failed);
	}
	SECTION("invalid path")
	{
		subject->upload(buffer_view(data), "../x.jpg", "image/jpeg", ec);
		REQUIRE(ec == Error::invalid_path);
		REQUIRE(storage.connections() == 0);
	}
	REQUIRE(storage.size() == 0);
}
