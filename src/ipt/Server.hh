/*
	Copyright © 2021 Wan Wai Ho <me@nestal.net>

	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the image_porter
	distribution for more details.
*/

//
// Created by nestal on 12/12/2021.
//

#pragma once

#include "Catalog.hh"
#include "LocalClient.hh"
#include "ProviderRegistry.hh"
#include "UploadOrchestrator.hh"

#include "crypto/CredentialVault.hh"
#include "image/ImagePipeline.hh"
#include "util/BoundedCall.hh"

#include <memory>

namespace ipt {

class Configuration;

/// Owns all the components of image_porter and wires them together according
/// to the configuration.
class Server
{
public:
	/// \throw  Configuration::Error, VaultKey::Error or std::runtime_error
	///         if the database cannot be opened.
	explicit Server(const Configuration& cfg);

	/// For unit tests, which bring their own catalog and remote storage.
	Server(const Configuration& cfg, std::unique_ptr<Catalog> catalog, std::unique_ptr<ClientFactory> factory, VaultKey key);

	Server(const Server&) = delete;
	Server& operator=(const Server&) = delete;

	[[nodiscard]] ProviderRegistry& providers() {return m_registry;}
	[[nodiscard]] UploadOrchestrator& images() {return m_orchestrator;}
	[[nodiscard]] Catalog& catalog() {return *m_catalog;}
	[[nodiscard]] const CredentialVault& vault() const {return m_vault;}

	static std::unique_ptr<Catalog> open_catalog(const std::string& database);

private:
	// The tasks in the thread pool of m_remote may refer to all members
	// declared before it, so it must be destroyed first.
	std::unique_ptr<Catalog>        m_catalog;
	std::unique_ptr<ClientFactory>  m_factory;
	CredentialVault     m_vault;
	ImagePipeline       m_pipeline;
	BoundedCall         m_remote;

	ProviderRegistry    m_registry;
	UploadOrchestrator  m_orchestrator;
};

} // end of namespace ipt
