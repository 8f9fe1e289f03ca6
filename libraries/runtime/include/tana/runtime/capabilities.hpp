#pragma once

#include <tana/runtime/capability_utils.hpp>
#include <tana/runtime/execution_context.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tana::runtime {

/*
 * Each capability is a free function in namespace `capability` named after its
 * id with a leading underscore. Use CAPABILITY_DECLARE here and register the
 * function in register_capabilities().
 */

CAPABILITY_DECLARE( void, print_stdout, const std::string& message );
CAPABILITY_DECLARE( void, print_stderr, const std::string& message );
CAPABILITY_DECLARE( double, sum, const nlohmann::json& numbers );
CAPABILITY_DECLARE( nlohmann::json, fetch, const std::string& url );

CAPABILITY_DECLARE( void, data_set, const std::string& key, const std::string& value );
CAPABILITY_DECLARE( nlohmann::json, data_get, const std::string& key );
CAPABILITY_DECLARE( void, data_delete, const std::string& key );
CAPABILITY_DECLARE( bool, data_has, const std::string& key );
CAPABILITY_DECLARE( std::vector< std::string >, data_keys, const std::optional< std::string >& pattern );
CAPABILITY_DECLARE( nlohmann::json, data_entries );
CAPABILITY_DECLARE( void, data_clear );
CAPABILITY_DECLARE( void, data_commit );

CAPABILITY_DECLARE( uint64_t, block_get_height );
CAPABILITY_DECLARE( uint64_t, block_get_timestamp );
CAPABILITY_DECLARE( std::string, block_get_hash );
CAPABILITY_DECLARE( std::string, block_get_previous_hash );
CAPABILITY_DECLARE( std::string, block_get_executor );
CAPABILITY_DECLARE( std::string, block_get_contract_id );
CAPABILITY_DECLARE( uint64_t, block_get_gas_limit );
CAPABILITY_DECLARE( uint64_t, block_get_gas_used );
CAPABILITY_DECLARE( nlohmann::json, block_get_balance, const nlohmann::json& user_ids, const std::string& currency );
CAPABILITY_DECLARE( nlohmann::json, block_get_user, const nlohmann::json& user_ids );
CAPABILITY_DECLARE( nlohmann::json, block_get_transaction, const nlohmann::json& tx_ids );

CAPABILITY_DECLARE( void, tx_transfer, const std::string& from, const std::string& to, double amount, const std::string& currency );
CAPABILITY_DECLARE( void, tx_set_balance, const std::string& user_id, double amount, const std::string& currency );
CAPABILITY_DECLARE( nlohmann::json, tx_get_changes );
CAPABILITY_DECLARE( nlohmann::json, tx_execute );

} // tana::runtime
