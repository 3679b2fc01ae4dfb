// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "MemoryPersist.hxx"

std::optional<std::string>
MemoryPersist::Get(const AcmePersistKey &key)
{
	const std::scoped_lock lock{mutex};

	auto i = values.find(key.ToString());
	if (i == values.end())
		return std::nullopt;

	return i->second;
}

void
MemoryPersist::Put(const AcmePersistKey &key, std::string_view value)
{
	const std::scoped_lock lock{mutex};
	values.insert_or_assign(key.ToString(), std::string{value});
}
