#pragma once

#include <tana/exception.hpp>

namespace tana::runtime {

TANA_DECLARE_DERIVED_EXCEPTION( runtime_exception, validation_exception );

TANA_DECLARE_DERIVED_EXCEPTION( capability_not_found, runtime_exception );
TANA_DECLARE_DERIVED_EXCEPTION( argument_type_exception, runtime_exception );
TANA_DECLARE_DERIVED_EXCEPTION( batch_query_exception, runtime_exception );
TANA_DECLARE_DERIVED_EXCEPTION( batch_too_large, batch_query_exception );
TANA_DECLARE_DERIVED_EXCEPTION( invalid_contract_id, runtime_exception );
TANA_DECLARE_DERIVED_EXCEPTION( invalid_method, runtime_exception );
TANA_DECLARE_DERIVED_EXCEPTION( invalid_request_body, runtime_exception );

TANA_DECLARE_DERIVED_EXCEPTION( chain_data_exception, transport_exception );
TANA_DECLARE_DERIVED_EXCEPTION( chain_data_fetch_failed, chain_data_exception );
TANA_DECLARE_DERIVED_EXCEPTION( chain_data_parse_failed, chain_data_exception );

TANA_DECLARE_DERIVED_EXCEPTION( contract_exception, setup_exception );
TANA_DECLARE_DERIVED_EXCEPTION( contract_not_found, contract_exception );
TANA_DECLARE_DERIVED_EXCEPTION( contract_read_failed, contract_exception );
TANA_DECLARE_DERIVED_EXCEPTION( compiler_exception, contract_exception );
TANA_DECLARE_DERIVED_EXCEPTION( compiler_unavailable, compiler_exception );

} // tana::runtime
