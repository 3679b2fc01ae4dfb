// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "acmecore/Persist.hxx"

/**
 * An #AcmePersist implementation which stores each value in a file
 * inside a directory.  Private keys are created with mode 0600.
 */
class FilePersist final : public AcmePersist {
	const std::string directory;

public:
	explicit FilePersist(std::string_view _directory) noexcept
		:directory(_directory) {}

	/**
	 * Determine the path of the file which stores the given key.
	 */
	[[gnu::pure]]
	std::string GetPath(const AcmePersistKey &key) const noexcept;

	/* virtual methods from class AcmePersist */
	std::optional<std::string> Get(const AcmePersistKey &key) override;
	void Put(const AcmePersistKey &key, std::string_view value) override;
};
