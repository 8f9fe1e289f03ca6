#pragma once

#include <cstdint>

namespace tana::ledger {

constexpr uint64_t gas_limit           = 1'000'000;
constexpr uint64_t gas_cost_per_change = 100;

constexpr const char* out_of_gas_error = "Out of gas";

} // tana::ledger
