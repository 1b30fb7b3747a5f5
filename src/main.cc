/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the image_porter
	distribution for more details.
*/

//
// Created by nestal on 12/12/2021.
//

#include "config.hh"

#include "crypto/VaultKey.hh"
#include "ipt/Server.hh"
#include "util/Configuration.hh"
#include "util/Error.hh"
#include "util/Exception.hh"
#include "util/Log.hh"
#include "util/Magic.hh"

#include <boost/exception/diagnostic_information.hpp>
#include <boost/exception/errinfo_file_name.hpp>
#include <boost/exception/info.hpp>
#include <boost/throw_exception.hpp>

#include <openssl/evp.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>

namespace ipt {
namespace {

struct InvalidArgument : virtual Exception {};
using Option = boost::error_info<struct tag_option, std::string>;

std::string required(const Configuration& cfg, const char *option)
{
	if (cfg.args().count(option) == 0)
		BOOST_THROW_EXCEPTION(InvalidArgument() << Option{option});
	return cfg.args()[option].as<std::string>();
}

ObjectID required_id(const Configuration& cfg, const char *option = "id")
{
	auto id = ObjectID::from_hex(required(cfg, option));
	if (!id)
		BOOST_THROW_EXCEPTION(InvalidArgument() << Option{option});
	return *id;
}

std::optional<ObjectID> optional_id(const Configuration& cfg, const char *option)
{
	return cfg.args().count(option) > 0 ? std::optional<ObjectID>{required_id(cfg, option)} : std::nullopt;
}

nlohmann::json json_option(const Configuration& cfg, const char *option)
{
	if (cfg.args().count(option) == 0)
		return nlohmann::json::object();

	auto json = nlohmann::json::parse(cfg.args()[option].as<std::string>(), nullptr, false);
	if (json.is_discarded() || !json.is_object())
		BOOST_THROW_EXCEPTION(InvalidArgument() << Option{option});
	return json;
}

std::vector<std::string> tags(const Configuration& cfg)
{
	return cfg.args().count("tag") > 0 ? cfg.args()["tag"].as<std::vector<std::string>>() : std::vector<std::string>{};
}

std::vector<unsigned char> read_file(const std::string& path)
{
	std::ifstream file{path, std::ios::in | std::ios::binary};
	if (!file)
		BOOST_THROW_EXCEPTION(InvalidArgument() << Option{"file"} << boost::errinfo_file_name{path});

	return {std::istreambuf_iterator<char>{file}, std::istreambuf_iterator<char>{}};
}

template <typename T>
int print(const T& result, std::error_code ec)
{
	if (ec)
	{
		std::cerr << to_string(classify(ec)) << ": " << ec.message() << std::endl;
		return EXIT_FAILURE;
	}

	std::cout << nlohmann::json(result).dump(2) << std::endl;
	return EXIT_SUCCESS;
}

int provider_command(Server& server, const Configuration& cfg, const UserID& user, const std::string& cmd)
{
	std::error_code ec;
	auto& reg = server.providers();

	if (cmd == "provider-add")
	{
		ProviderSpec spec;
		spec.name       = required(cfg, "name");
		spec.type       = required(cfg, "type");
		spec.config     = json_option(cfg, "config");
		spec.is_default = cfg.args().count("default") > 0;
		if (cfg.args().count("credentials") > 0)
			spec.credentials = json_option(cfg, "credentials").get<Credentials>();

		return print(reg.create(user, spec, ec), ec);
	}
	else if (cmd == "provider-list")
		return print(reg.list(user, ec), ec);
	else if (cmd == "provider-default")
		return print(reg.set_default(user, required_id(cfg), ec), ec);
	else if (cmd == "provider-activate")
		return print(reg.set_active(user, required_id(cfg), true, ec), ec);
	else if (cmd == "provider-deactivate")
		return print(reg.set_active(user, required_id(cfg), false, ec), ec);
	else if (cmd == "provider-test")
	{
		auto result = reg.test_connection(user, required_id(cfg), ec);
		auto status = print(result, ec);
		return status == EXIT_SUCCESS && !result.success ? EXIT_FAILURE : status;
	}
	else if (cmd == "provider-remove")
		return print(nlohmann::json{{"detached_images", reg.remove(user, required_id(cfg), ec)}}, ec);

	BOOST_THROW_EXCEPTION(InvalidArgument() << Option{"command"});
}

int image_command(Server& server, const Configuration& cfg, const UserID& user, const std::string& cmd)
{
	std::error_code ec;
	auto& images = server.images();

	if (cmd == "upload")
	{
		UploadRequest req;
		req.user        = user;
		req.filename    = std::filesystem::path{required(cfg, "file")}.filename().string();
		req.data        = read_file(required(cfg, "file"));
		req.provider    = optional_id(cfg, "provider");
		req.tags        = tags(cfg);
		req.optimize    = cfg.args().count("no-optimize") == 0;
		req.content_type = cfg.args().count("content-type") > 0 ?
			cfg.args()["content-type"].as<std::string>() :
			Magic::instance().mime(buffer_view(req.data));

		return print(images.upload(req, ec), ec);
	}
	else if (cmd == "image-list")
	{
		ImageQuery query;
		query.offset    = cfg.args()["offset"].as<std::size_t>();
		query.limit     = cfg.args()["limit"].as<std::size_t>();
		query.provider  = optional_id(cfg, "provider");
		return print(images.list(user, query, ec), ec);
	}
	else if (cmd == "image-show")
	{
		auto id = required_id(cfg);
		auto image = images.find(user, id, ec);
		if (!ec && !image)
			ec = Error::object_not_exist;
		if (ec)
			return print(nullptr, ec);

		nlohmann::json result(*image);
		if (image->provider)
		{
			// the URL is informational, the image itself is still shown
			std::error_code url_ec;
			auto url = images.public_url(user, id, url_ec);
			if (!url_ec)
				result.emplace("url", url);
		}
		return print(result, ec);
	}
	else if (cmd == "image-tag")
	{
		ImageUpdate update;
		update.tags = tags(cfg);
		return print(images.update(user, required_id(cfg), update, ec), ec);
	}
	else if (cmd == "image-remove")
	{
		auto id = required_id(cfg);
		images.remove(user, id, ec);
		return print(nlohmann::json{{"removed", id}}, ec);
	}
	else if (cmd == "stats")
		return print(images.stats(user, ec), ec);

	BOOST_THROW_EXCEPTION(InvalidArgument() << Option{"command"});
}

int run(const Configuration& cfg)
{
	auto cmd = cfg.command();
	if (cmd == "generate-key")
	{
		std::cout << VaultKey::generate().hex() << std::endl;
		return EXIT_SUCCESS;
	}

	UserID user{cfg.user()};
	if (!user.is_valid())
		BOOST_THROW_EXCEPTION(InvalidArgument() << Option{"user"});

	Server server{cfg};
	if (cmd.substr(0, 9) == "provider-")
		return provider_command(server, cfg, user, cmd);
	else
		return image_command(server, cfg, user, cmd);
}

} // end of local namespace
} // end of namespace ipt

int main(int argc, char *argv[])
{
	using namespace ipt;
	try
	{
		Configuration cfg{argc, argv, ::getenv("IMAGE_PORTER_CONFIG")};
		if (cfg.help() || cfg.command().empty())
		{
			cfg.usage(std::cout);
			std::cout << "\n";
			return cfg.help() ? EXIT_SUCCESS : EXIT_FAILURE;
		}

		OpenLog("image_porter", cfg.verbose(), cfg.verbose() ? LOG_DEBUG : LOG_NOTICE);
		OpenSSL_add_all_digests();
		Log(LOG_DEBUG, "image_porter (version %1%) running %2%", constants::version, cfg.command());

		return run(cfg);
	}
	catch (InvalidArgument& e)
	{
		auto option = boost::get_error_info<Option>(e);
		std::cerr << "missing or invalid option --" << (option ? *option : std::string{"?"}) << std::endl;
		return EXIT_FAILURE;
	}
	catch (Exception& e)
	{
		Log(LOG_CRIT, "Uncaught boost::exception: %1%", boost::diagnostic_information(e));
		std::cerr << boost::diagnostic_information(e) << std::endl;
		return EXIT_FAILURE;
	}
	catch (std::exception& e)
	{
		Log(LOG_CRIT, "Uncaught std::exception: %1%", e.what());
		std::cerr << e.what() << std::endl;
		return EXIT_FAILURE;
	}
}
