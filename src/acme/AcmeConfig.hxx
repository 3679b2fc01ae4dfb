// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "AcmeDirectory.hxx"

#include <string>

struct AcmeConfig {
	std::string tls_ca;

	std::string directory_url;

	/**
	 * The directory where #FilePersist stores account keys.
	 */
	std::string store_path = ".";

	bool debug = false;

	bool staging = false;

	const char *GetDirectoryURL() const noexcept {
		if (!directory_url.empty())
			return directory_url.c_str();

		return GetAcmeDirectoryUrl(staging
					   ? AcmeServer::LETS_ENCRYPT_STAGING
					   : AcmeServer::LETS_ENCRYPT);
	}

	const char *GetTlsCa() const noexcept {
		return tls_ca.empty() ? nullptr : tls_ca.c_str();
	}
};
