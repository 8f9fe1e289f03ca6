#pragma once

#include <tana/exception.hpp>

namespace tana::store {

TANA_DECLARE_DERIVED_EXCEPTION( store_exception, validation_exception );
TANA_DECLARE_DERIVED_EXCEPTION( key_too_large, store_exception );
TANA_DECLARE_DERIVED_EXCEPTION( value_too_large, store_exception );

TANA_DECLARE_DERIVED_EXCEPTION( store_limit_exception, limit_exception );
TANA_DECLARE_DERIVED_EXCEPTION( storage_limit_exceeded, store_limit_exception );
TANA_DECLARE_DERIVED_EXCEPTION( too_many_keys, store_limit_exception );

} // tana::store
