/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the image_porter
	distribution for more details.
*/

//
// Created by nestal on 13/12/2021.
//

#include "MockStorage.hh"

#include "util/Error.hh"

#include <thread>

namespace ipt {

class MockStorage::Client : public RemoteClient
{
public:
	Client(MockStorage& parent, std::string prefix) : m_parent{parent}, m_prefix{std::move(prefix)} {}

	void put(const std::string& key, BufferView data, const std::string& content_type, std::error_code& ec) override
	{
		wait();
		if (m_parent.fail_put)
			ec = Error::provider_connection_failed;
		else
			m_parent.put(m_prefix + "/" + key, Object{{data.begin(), data.end()}, content_type});
	}

	bool remove(const std::string& key, std::error_code& ec) override
	{
		wait();
		if (m_parent.fail_remove)
		{
			ec = Error::provider_connection_failed;
			return false;
		}

		std::unique_lock lock{m_parent.m_mutex};
		return m_parent.m_objects.erase(m_prefix + "/" + key) > 0;
	}

	bool exists(const std::string& key, std::error_code&) override
	{
		return m_parent.contains(m_prefix + "/" + key);
	}

private:
	void wait() const
	{
		if (auto delay = m_parent.delay_ms.load(); delay > 0)
			std::this_thread::sleep_for(std::chrono::milliseconds{delay});
	}

private:
	MockStorage&    m_parent;
	std::string     m_prefix;
};

std::unique_ptr<RemoteClient> MockStorage::open(std::string prefix, std::error_code& ec)
{
	++m_connections;
	if (fail_connect)
	{
		ec = Error::provider_connection_failed;
		return {};
	}
	return std::make_unique<Client>(*this, std::move(prefix));
}

std::unique_ptr<RemoteClient> MockStorage::connect(const S3Params& params, std::error_code& ec)
{
	{
		std::unique_lock lock{m_mutex};
		last_s3 = params;
	}
	return open("s3:" + params.bucket, ec);
}

std::unique_ptr<RemoteClient> MockStorage::connect(const AzureParams& params, std::error_code& ec)
{
	{
		std::unique_lock lock{m_mutex};
		last_azure = params;
	}
	return open("azure:" + params.container, ec);
}

std::unique_ptr<RemoteClient> MockStorage::connect(const GCSParams& params, std::error_code& ec)
{
	{
		std::unique_lock lock{m_mutex};
		last_gcs = params;
	}
	return open("gcs:" + params.bucket, ec);
}

std::unique_ptr<RemoteClient> MockStorage::connect(const SFTPParams& params, std::error_code& ec)
{
	{
		std::unique_lock lock{m_mutex};
		last_sftp = params;
	}
	return open("sftp:" + params.host, ec);
}

void MockStorage::put(const std::string& full_key, Object obj)
{
	std::unique_lock lock{m_mutex};
	m_objects.insert_or_assign(full_key, std::move(obj));
	++m_puts;
}

std::size_t MockStorage::size() const
{
	std::unique_lock lock{m_mutex};
	return m_objects.size();
}

bool MockStorage::contains(const std::string& full_key) const
{
	std::unique_lock lock{m_mutex};
	return m_objects.find(full_key) != m_objects.end();
}

std::optional<MockStorage::Object> MockStorage::get(const std::string& full_key) const
{
	std::unique_lock lock{m_mutex};
	auto it = m_objects.find(full_key);
	return it != m_objects.end() ? std::optional<Object>{it->second} : std::nullopt;
}

std::vector<std::string> MockStorage::keys() const
{
	std::unique_lock lock{m_mutex};
	std::vector<std::string> result;
	for (auto&& [key, obj] : m_objects)
		result.push_back(key);
	return result;
}

} // end of namespace ipt
