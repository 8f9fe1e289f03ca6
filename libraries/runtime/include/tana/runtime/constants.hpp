#pragma once

#include <cstddef>
#include <cstdint>

namespace tana::runtime::constants {

constexpr std::size_t max_batch_query = 10;

constexpr uint64_t    block_height     = 12'345;
constexpr const char* default_executor = "user_edge_server";

constexpr const char* get_entry_point  = "Get";
constexpr const char* post_entry_point = "Post";

constexpr const char* tana_version   = "0.1.0";
constexpr const char* engine_version = "quickjs";

constexpr std::size_t compiler_cache_size = 64;

} // tana::runtime::constants
