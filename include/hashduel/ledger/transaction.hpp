/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace hashduel::ledger {

using TransactionId = std::int64_t;
using ClientId = std::int64_t;

// One round of the challenge game. `solution` and `winner` are set together on acceptance.
struct Transaction {
    TransactionId id{0};
    int challenge{0};
    std::optional<std::string> solution;
    std::optional<ClientId> winner;

    bool resolved() const { return winner.has_value(); }
};

} // namespace hashduel::ledger
