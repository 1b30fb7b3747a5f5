/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the image_porter
	distribution for more details.
*/

//
// Created by nestal on 8/12/2021.
//

#pragma once

#include "RemoteClient.hh"

#include <filesystem>

namespace ipt {

/// Stores the objects as files in a directory.
class LocalClient : public RemoteClient
{
public:
	explicit LocalClient(std::filesystem::path dir);

	void put(const std::string& key, BufferView data, const std::string& content_type, std::error_code& ec) override;
	bool remove(const std::string& key, std::error_code& ec) override;
	bool exists(const std::string& key, std::error_code& ec) override;

	[[nodiscard]] const std::filesystem::path& directory() const {return m_dir;}

	/// Path of the file of \a key, or empty if \a key escapes from the directory.
	[[nodiscard]] std::filesystem::path file(const std::string& key) const;

private:
	std::filesystem::path m_dir;
};

/// Maps each remote storage onto a directory tree under a local root, e.g.
/// `<root>/s3/<region>/<bucket>` or `<root>/sftp/<host>/<remote_path>`.
/// Useful for development and for remote file systems mounted locally.
class LocalClientFactory : public ClientFactory
{
public:
	explicit LocalClientFactory(std::filesystem::path root);

	std::unique_ptr<RemoteClient> connect(const S3Params& params, std::error_code& ec) override;
	std::unique_ptr<RemoteClient> connect(const AzureParams& params, std::error_code& ec) override;
	std::unique_ptr<RemoteClient> connect(const GCSParams& params, std::error_code& ec) override;
	std::unique_ptr<RemoteClient> connect(const SFTPParams& params, std::error_code& ec) override;

	[[nodiscard]] const std::filesystem::path& root() const {return m_root;}

private:
	std::unique_ptr<RemoteClient> open(const std::filesystem::path& relative, std::error_code& ec) const;

private:
	std::filesystem::path m_root;
};

} // end of namespace ipt
