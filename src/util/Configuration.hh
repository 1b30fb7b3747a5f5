/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the image_porter
    distribution for more details.
*/

//
// Created by nestal on 1/6/18.
//

#pragma once

#include "Exception.hh"

#include <boost/program_options/variables_map.hpp>
#include <boost/program_options/options_description.hpp>
#include <boost/program_options/positional_options.hpp>
#include <boost/exception/error_info.hpp>

#include <chrono>
#include <filesystem>
#include <iosfwd>
#include <string>
#include <vector>

namespace ipt {

class VaultKey;

/// Parameters of the image optimization pipeline.
struct OptimizeSetting
{
	int max_dimension{2048};
	int quality{85};
	int png_compression{9};
};

/// What to do with the images stored in a provider when the provider is removed.
enum class ProviderDeletePolicy
{
	block,      ///< refuse to remove the provider while images are stored in it
	detach      ///< keep the images, but clear their provider and mark them in the metadata
};

/// \brief  Parsing command line options and configuration file
class Configuration
{
public:
	struct Error : virtual Exception {};
	struct FileError : virtual Error {};
	struct InvalidValue : virtual Error {};
	struct MissingKey : virtual Error {};
	using Path      = boost::error_info<struct tag_path,    std::filesystem::path>;
	using Message   = ipt::Message;
	using Key       = boost::error_info<struct tag_key,     std::string>;

public:
	Configuration() = default;
	Configuration(int argc, const char *const *argv, const char *env);
	~Configuration();

	Configuration(const Configuration&) = delete;
	Configuration& operator=(const Configuration&) = delete;

	[[nodiscard]] const std::string& database() const {return m_database;}
	[[nodiscard]] const std::filesystem::path& local_storage_root() const {return m_local_root;}
	[[nodiscard]] std::size_t upload_limit() const {return m_upload_limit;}
	[[nodiscard]] const std::vector<std::string>& allowed_content_types() const {return m_content_types;}
	[[nodiscard]] const OptimizeSetting& optimization() const {return m_optimize;}
	[[nodiscard]] std::chrono::seconds backend_timeout() const {return m_backend_timeout;}
	[[nodiscard]] std::size_t backend_threads() const {return m_backend_threads;}
	[[nodiscard]] ProviderDeletePolicy delete_policy() const {return m_delete_policy;}

	/// Loads the encryption key of the credential vault. In order of preference,
	/// it comes from `/encryption_key`, the file in `/encryption_key_file` or the
	/// IMAGE_PORTER_KEY environment variable.
	/// \throw  Configuration::MissingKey if none of them is available.
	/// \throw  VaultKey::Error if the key is malformed.
	[[nodiscard]] VaultKey vault_key() const;

	// command line
	[[nodiscard]] bool help() const {return m_args.count("help") > 0;}
	[[nodiscard]] bool verbose() const {return m_args.count("verbose") > 0;}
	[[nodiscard]] std::string command() const;
	[[nodiscard]] std::string user() const;
	[[nodiscard]] const boost::program_options::variables_map& args() const {return m_args;}

	void usage(std::ostream& out) const;

	// for unit tests
	void local_storage_root(std::filesystem::path path) {m_local_root = std::move(path);}

private:
	void load_config(const std::filesystem::path& path);
	static bool needs_config(const std::string& command);

private:
	boost::program_options::options_description             m_desc{"Allowed options"};
	boost::program_options::positional_options_description  m_positional;
	boost::program_options::variables_map                   m_args;

	std::string             m_database{"memory"};
	std::string             m_key;
	std::filesystem::path   m_key_file;
	std::filesystem::path   m_local_root{"."};
	std::size_t             m_upload_limit{50 * 1024 * 1024};
	std::vector<std::string> m_content_types{
		"image/jpeg", "image/jpg", "image/png", "image/gif", "image/webp"
	};
	OptimizeSetting         m_optimize;
	std::chrono::seconds    m_backend_timeout{30};
	std::size_t             m_backend_threads{4};
	ProviderDeletePolicy    m_delete_policy{ProviderDeletePolicy::block};
};

} // end of namespace
