// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <nlohmann/json_fwd.hpp>

struct AcmeDirectory;
struct AcmeAccount;

void
from_json(const nlohmann::json &j, AcmeDirectory &directory);

/**
 * Build the payload of a "newAccount" request.
 *
 * @param email the contact email address; nullptr for none
 */
[[gnu::pure]]
nlohmann::json
MakeNewAccountRequest(const char *email) noexcept;

void
from_json(const nlohmann::json &j, AcmeAccount &account);
