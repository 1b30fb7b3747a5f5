/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the image_porter
    distribution for more details.
*/

//
// Created by nestal on 1/6/18.
//

#include "Configuration.hh"

#include "config.hh"
#include "crypto/VaultKey.hh"

#include <nlohmann/json.hpp>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/program_options.hpp>
#include <boost/exception/info.hpp>
#include <boost/exception/diagnostic_information.hpp>

#include <openssl/crypto.h>

#include <cstdlib>
#include <fstream>
#include <iterator>

namespace po = boost::program_options;
namespace fs = std::filesystem;

namespace ipt {
namespace {

fs::path relative_to(const fs::path& config, const std::string& path)
{
	fs::path p{path};
	return weakly_canonical(p.is_absolute() ? p : config.parent_path() / p);
}

template <typename T>
T positive(const nlohmann::json& json, const std::string& key, T def)
{
	auto val = json.value(nlohmann::json::json_pointer{key}, def);
	if (val <= 0)
		BOOST_THROW_EXCEPTION(Configuration::InvalidValue()
			<< Configuration::Key{key}
			<< Configuration::Message{"must be positive"}
		);
	return val;
}

} // end of local namespace

Configuration::Configuration(int argc, const char *const *argv, const char *env)
{
	m_desc.add_options()
		("help",        "produce help message")
		("verbose,v",   "print log messages to stderr")
		("cfg",         po::value<std::string>()->default_value(
			env ? std::string{env} : std::string{constants::config_filename}
		)->value_name("path"), "Configuration file. Use environment variable IMAGE_PORTER_CONFIG to set default path.")
		("user,u",      po::value<std::string>()->value_name("name"), "user who owns the providers and images")
		("command",     po::value<std::string>()->value_name("command"),
			"generate-key, provider-add, provider-list, provider-default, provider-activate, "
			"provider-deactivate, provider-test, provider-remove, upload, image-list, image-show, "
			"image-tag, image-remove or stats")
		("id",          po::value<std::string>()->value_name("hex"), "ID of the provider or image")
		("name",        po::value<std::string>(), "name of the new provider")
		("type",        po::value<std::string>(), "provider type: s3, azure, gcs or sftp")
		("config",      po::value<std::string>()->value_name("json"), "provider configuration as a JSON object")
		("credentials", po::value<std::string>()->value_name("json"), "provider credentials as a JSON object")
		("default",     "make the provider the default one")
		("file,f",      po::value<std::string>()->value_name("path"), "image file to upload")
		("provider,p",  po::value<std::string>()->value_name("hex"), "ID of the provider to upload to")
		("tag,t",       po::value<std::vector<std::string>>()->composing(), "tag of the image, can be repeated")
		("content-type",po::value<std::string>()->value_name("mime"), "content type of the uploaded file, detected if absent")
		("no-optimize", "upload the original file as is")
		("offset",      po::value<std::size_t>()->default_value(0), "number of images to skip in image-list")
		("limit",       po::value<std::size_t>()->default_value(100), "maximum number of images in image-list")
	;
	m_positional.add("command", 1);

	if (argc > 0)
	{
		store(po::command_line_parser(argc, argv).options(m_desc).positional(m_positional).run(), m_args);
		po::notify(m_args);
	}

	// no need for other options when --help is specified
	if (!help() && needs_config(command()))
		load_config(
			m_args.count("cfg") > 0 ? m_args["cfg"].as<std::string>() : std::string{env ? env : ""}
		);
}

Configuration::~Configuration()
{
	if (!m_key.empty())
		::OPENSSL_cleanse(m_key.data(), m_key.size());
}

bool Configuration::needs_config(const std::string& command)
{
	return command != "generate-key";
}

std::string Configuration::command() const
{
	return m_args.count("command") > 0 ? m_args["command"].as<std::string>() : std::string{};
}

std::string Configuration::user() const
{
	return m_args.count("user") > 0 ? m_args["user"].as<std::string>() : std::string{};
}

void Configuration::usage(std::ostream &out) const
{
	out << "Usage: image_porter [options] <command>\n" << m_desc;
}

void Configuration::load_config(const fs::path& path)
{
	try
	{
		std::ifstream config_file;
		config_file.open(path.string(), std::ios::in);
		if (!config_file)
		{
			BOOST_THROW_EXCEPTION(FileError()
				<< ErrorCode({errno, std::system_category()})
			);
		}

		auto json = nlohmann::json::parse(config_file);
		using jptr = nlohmann::json::json_pointer;

		m_database = json.value(jptr{"/database"}, m_database);

		// Paths are relative to the configuration file
		m_local_root = relative_to(path, json.value(jptr{"/local_storage_root"}, m_local_root.string()));
		if (auto key = json.find("encryption_key"); key != json.end())
			m_key = key->get<std::string>();
		if (auto file = json.find("encryption_key_file"); file != json.end())
			m_key_file = relative_to(path, file->get<std::string>());

		m_upload_limit = static_cast<std::size_t>(
			positive(json, "/upload_limit_mb", m_upload_limit/1024.0/1024.0) * 1024 * 1024
		);
		m_content_types = json.value(jptr{"/allowed_content_types"}, m_content_types);

		// uploads are matched case-insensitively
		for (auto& type : m_content_types)
		{
			boost::algorithm::trim(type);
			boost::algorithm::to_lower(type);
		}

		m_optimize.max_dimension = positive(json, "/optimization/max_dimension", m_optimize.max_dimension);
		m_optimize.quality       = json.value(jptr{"/optimization/quality"}, m_optimize.quality);
		m_optimize.png_compression = json.value(jptr{"/optimization/png_compression"}, m_optimize.png_compression);
		if (m_optimize.quality < 1 || m_optimize.quality > 100)
			BOOST_THROW_EXCEPTION(InvalidValue() << Key{"/optimization/quality"} << Message{"must be within 1 to 100"});
		if (m_optimize.png_compression < 0 || m_optimize.png_compression > 9)
			BOOST_THROW_EXCEPTION(InvalidValue() << Key{"/optimization/png_compression"} << Message{"must be within 0 to 9"});

		m_backend_timeout = std::chrono::seconds{positive(json, "/backend_timeout_sec", m_backend_timeout.count())};
		m_backend_threads = static_cast<std::size_t>(
			positive(json, "/backend_threads", static_cast<int>(m_backend_threads))
		);

		auto policy = json.value(jptr{"/provider_delete_policy"}, std::string{"block"});
		if (policy == "block")
			m_delete_policy = ProviderDeletePolicy::block;
		else if (policy == "detach")
			m_delete_policy = ProviderDeletePolicy::detach;
		else
			BOOST_THROW_EXCEPTION(InvalidValue() << Key{"/provider_delete_policy"} << Message{"must be \"block\" or \"detach\""});
	}
	catch (nlohmann::json::exception&)
	{
		throw;
	}
	catch (Exception& e)
	{
		e << Path{path};
		throw;
	}
	catch (std::exception& e)
	{
		throw boost::enable_error_info(e) << Path{path};
	}
}

VaultKey Configuration::vault_key() const
{
	if (!m_key.empty())
		return VaultKey{m_key};

	if (!m_key_file.empty())
	{
		std::ifstream file{m_key_file};
		if (!file)
			BOOST_THROW_EXCEPTION(FileError()
				<< ErrorCode({errno, std::system_category()})
				<< Path{m_key_file}
			);

		std::string hex{std::istreambuf_iterator<char>{file}, std::istreambuf_iterator<char>{}};
		boost::algorithm::trim(hex);

		try
		{
			VaultKey key{hex};
			::OPENSSL_cleanse(hex.data(), hex.size());
			return key;
		}
		catch (Exception& e)
		{
			::OPENSSL_cleanse(hex.data(), hex.size());
			e << Path{m_key_file};
			throw;
		}
	}

	if (auto env = std::getenv("IMAGE_PORTER_KEY"); env && *env)
		return VaultKey{env};

	BOOST_THROW_EXCEPTION(MissingKey()
		<< Message{"no encryption key: set encryption_key or encryption_key_file, or IMAGE_PORTER_KEY"}
	);
}

} // end of namespace
