/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the image_porter
	distribution for more details.
*/

//
// Created by nestal on 12/12/2021.
//

#include "Server.hh"

#include "MemoryCatalog.hh"
#include "PostgresCatalog.hh"

#include "util/Configuration.hh"
#include "util/Escape.hh"
#include "util/Log.hh"

namespace ipt {

Server::Server(const Configuration& cfg) :
	Server{cfg, open_catalog(cfg.database()), std::make_unique<LocalClientFactory>(cfg.local_storage_root()), cfg.vault_key()}
{
}

Server::Server(const Configuration& cfg, std::unique_ptr<Catalog> catalog, std::unique_ptr<ClientFactory> factory, VaultKey key) :
	m_catalog{std::move(catalog)},
	m_factory{std::move(factory)},
	m_vault{std::move(key)},
	m_pipeline{cfg.optimization()},
	m_remote{cfg.backend_threads(), cfg.backend_timeout()},
	m_registry{*m_catalog, m_vault, *m_factory, m_remote, cfg.delete_policy()},
	m_orchestrator{m_registry, *m_catalog, m_pipeline, m_remote, UploadPolicy{cfg.upload_limit(), cfg.allowed_content_types()}}
{
	Log(LOG_INFO, "credential vault key fingerprint %1%", to_hex(m_vault.key().fingerprint()));
}

std::unique_ptr<Catalog> Server::open_catalog(const std::string& database)
{
	if (database == "memory")
	{
		Log(LOG_NOTICE, "using in-memory catalog: nothing will be saved");
		return std::make_unique<MemoryCatalog>();
	}
	else
		return std::make_unique<PostgresCatalog>(database);
}

} // end of namespace ipt
