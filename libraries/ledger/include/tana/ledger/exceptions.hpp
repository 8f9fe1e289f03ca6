#pragma once

#include <tana/exception.hpp>

namespace tana::ledger {

TANA_DECLARE_DERIVED_EXCEPTION( ledger_exception, validation_exception );
TANA_DECLARE_DERIVED_EXCEPTION( self_transfer, ledger_exception );
TANA_DECLARE_DERIVED_EXCEPTION( non_positive_amount, ledger_exception );
TANA_DECLARE_DERIVED_EXCEPTION( negative_balance, ledger_exception );

} // tana::ledger
