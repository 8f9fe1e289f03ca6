#pragma once

#include <cstddef>

namespace tana::store {

constexpr std::size_t max_key_size   = 256;
constexpr std::size_t max_value_size = 10'240;
constexpr std::size_t max_total_size = 102'400;
constexpr std::size_t max_keys       = 1'000;

} // tana::store
