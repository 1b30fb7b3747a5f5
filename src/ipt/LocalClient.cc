/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the image_porter
	distribution for more details.
*/

//
// Created by nestal on 8/12/2021.
//

#include "LocalClient.hh"

#include "crypto/Random.hh"
#include "util/Error.hh"
#include "util/Log.hh"

#include <boost/beast/core/file.hpp>

namespace fs = std::filesystem;

namespace ipt {
namespace {

bool safe_component(const fs::path& p)
{
	return !p.empty() && p != "." && p != "..";
}

// no absolute paths and no ".." in the relative path from the root
bool safe_relative(const fs::path& rel)
{
	if (rel.empty() || rel.is_absolute())
		return false;

	for (auto&& part : rel)
		if (!safe_component(part))
			return false;
	return true;
}

} // end of local namespace

LocalClient::LocalClient(fs::path dir) : m_dir{std::move(dir)}
{
}

fs::path LocalClient::file(const std::string& key) const
{
	fs::path rel{key};
	return safe_relative(rel) ? m_dir / rel : fs::path{};
}

void LocalClient::put(const std::string& key, BufferView data, const std::string&, std::error_code& ec)
{
	auto dest = file(key);
	if (dest.empty())
	{
		ec = Error::invalid_path;
		return;
	}

	fs::create_directories(dest.parent_path(), ec);
	if (ec)
	{
		Log(LOG_WARNING, "cannot create directory %1% (%2% %3%)", dest.parent_path(), ec, ec.message());
		ec = Error::provider_connection_failed;
		return;
	}

	// write to a temporary file and rename it, so that readers never see a
	// partially written object
	auto tmp = dest;
	tmp += "." + insecure_random_hex(4) + ".tmp";

	boost::system::error_code bec;
	boost::beast::file out;
	out.open(tmp.string().c_str(), boost::beast::file_mode::write, bec);
	if (!bec && !data.empty())
		out.write(data.data(), data.size(), bec);
	if (!bec)
		out.close(bec);

	if (bec)
	{
		Log(LOG_WARNING, "cannot write to file %1% (%2% %3%)", tmp, bec, bec.message());
		std::error_code ignore;
		fs::remove(tmp, ignore);
		ec = Error::provider_connection_failed;
		return;
	}

	fs::rename(tmp, dest, ec);
	if (ec)
	{
		Log(LOG_WARNING, "cannot rename %1% to %2% (%3% %4%)", tmp, dest, ec, ec.message());
		std::error_code ignore;
		fs::remove(tmp, ignore);
		ec = Error::provider_connection_failed;
	}
}

bool LocalClient::remove(const std::string& key, std::error_code& ec)
{
	auto dest = file(key);
	if (dest.empty())
	{
		ec = Error::invalid_path;
		return false;
	}

	auto removed = fs::remove(dest, ec);
	if (ec)
	{
		Log(LOG_WARNING, "cannot remove %1% (%2% %3%)", dest, ec, ec.message());
		ec = Error::provider_connection_failed;
		return false;
	}
	return removed;
}

bool LocalClient::exists(const std::string& key, std::error_code& ec)
{
	auto dest = file(key);
	if (dest.empty())
	{
		ec = Error::invalid_path;
		return false;
	}

	// the directory itself must be there, otherwise it is not "connected"
	if (!fs::is_directory(m_dir, ec))
	{
		Log(LOG_INFO, "storage directory %1% does not exist", m_dir);
		ec = Error::provider_connection_failed;
		return false;
	}

	auto found = fs::exists(dest, ec);
	if (ec)
		ec = Error::provider_connection_failed;
	return found;
}

LocalClientFactory::LocalClientFactory(fs::path root) : m_root{std::move(root)}
{
}

std::unique_ptr<RemoteClient> LocalClientFactory::open(const fs::path& relative, std::error_code& ec) const
{
	if (!safe_relative(relative))
	{
		ec = Error::invalid_path;
		return {};
	}

	// the directory is created by the first put(), not here: connecting must not
	// change anything
	return std::make_unique<LocalClient>(m_root / relative);
}

std::unique_ptr<RemoteClient> LocalClientFactory::connect(const S3Params& params, std::error_code& ec)
{
	return open(fs::path{"s3"} / params.region / params.bucket, ec);
}

std::unique_ptr<RemoteClient> LocalClientFactory::connect(const AzureParams& params, std::error_code& ec)
{
	return open(fs::path{"azure"} / params.account_name / params.container, ec);
}

std::unique_ptr<RemoteClient> LocalClientFactory::connect(const GCSParams& params, std::error_code& ec)
{
	return open(fs::path{"gcs"} / params.bucket, ec);
}

std::unique_ptr<RemoteClient> LocalClientFactory::connect(const SFTPParams& params, std::error_code& ec)
{
	// remote_path is usually absolute on the server
	auto remote = fs::path{params.remote_path}.relative_path();
	return open(fs::path{"sftp"} / params.host / remote, ec);
}

} // end of namespace ipt
