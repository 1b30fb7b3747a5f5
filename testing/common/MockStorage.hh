/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the image_porter
	distribution for more details.
*/

//
// Created by nestal on 13/12/2021.
//

#pragma once

#include "ipt/RemoteClient.hh"

#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ipt {

/// In-memory remote storage for unit tests. Objects are keyed by
/// "<type>:<container>/<key>", e.g. "s3:my-bucket/alice/2021/12/...".
class MockStorage : public ClientFactory
{
public:
	struct Object
	{
		std::vector<unsigned char>  data;
		std::string                 content_type;
	};

public:
	std::unique_ptr<RemoteClient> connect(const S3Params& params, std::error_code& ec) override;
	std::unique_ptr<RemoteClient> connect(const AzureParams& params, std::error_code& ec) override;
	std::unique_ptr<RemoteClient> connect(const GCSParams& params, std::error_code& ec) override;
	std::unique_ptr<RemoteClient> connect(const SFTPParams& params, std::error_code& ec) override;

	// failure injection
	std::atomic<bool>   fail_connect{false};
	std::atomic<bool>   fail_put{false};
	std::atomic<bool>   fail_remove{false};

	/// Every put() and remove() sleeps for this long before doing anything.
	std::atomic<std::chrono::milliseconds::rep> delay_ms{0};

	// inspection
	[[nodiscard]] std::size_t size() const;
	[[nodiscard]] bool contains(const std::string& full_key) const;
	[[nodiscard]] std::optional<Object> get(const std::string& full_key) const;
	[[nodiscard]] std::vector<std::string> keys() const;
	[[nodiscard]] std::size_t connections() const {return m_connections;}
	[[nodiscard]] std::size_t puts() const {return m_puts;}

	void put(const std::string& full_key, Object obj);

	// parameters of the last connect()
	S3Params    last_s3;
	AzureParams last_azure;
	GCSParams   last_gcs;
	SFTPParams  last_sftp;

private:
	class Client;
	std::unique_ptr<RemoteClient> open(std::string prefix, std::error_code& ec);

private:
	mutable std::mutex              m_mutex;
	std::map<std::string, Object>   m_objects;
	std::atomic<std::size_t>        m_connections{0};
	std::atomic<std::size_t>        m_puts{0};
};

} // end of namespace ipt
