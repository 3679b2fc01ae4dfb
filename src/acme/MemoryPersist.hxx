// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "acmecore/Persist.hxx"

#include <map>
#include <mutex>

/**
 * An #AcmePersist implementation which keeps everything in memory.
 * Useful for testing.
 */
class MemoryPersist final : public AcmePersist {
	mutable std::mutex mutex;

	std::map<std::string, std::string, std::less<>> values;

public:
	std::size_t size() const noexcept {
		const std::scoped_lock lock{mutex};
		return values.size();
	}

	/* virtual methods from class AcmePersist */
	std::optional<std::string> Get(const AcmePersistKey &key) override;
	void Put(const AcmePersistKey &key, std::string_view value) override;
};
