#pragma once

#include <tana/ledger/exceptions.hpp>
#include <tana/ledger/gas_meter.hpp>

#include <tana/ledger/ledger.pb.h>

#include <nlohmann/json.hpp>

#include <mutex>
#include <string>
#include <vector>

namespace tana::ledger {

/**
 * Stages balance changes until execute() settles them against the gas meter.
 *
 * Execution is all or nothing. A batch that does not fit in the remaining gas
 * is dropped and reported in the receipt rather than thrown.
 */
class transaction_ledger final
{
public:
   explicit transaction_ledger( gas_meter& meter );
   ~transaction_ledger();

   void transfer( const std::string& from, const std::string& to, double amount, const std::string& currency );
   void set_balance( const std::string& user_id, double amount, const std::string& currency );

   std::vector< change > get_changes() const;
   execution_receipt execute();

   gas_meter& meter();
   const gas_meter& meter() const;

private:
   mutable std::mutex    _mutex;
   gas_meter&            _meter;
   std::vector< change > _pending;
};

nlohmann::json to_json( const change& c );
nlohmann::json to_json( const std::vector< change >& changes );
nlohmann::json to_json( const execution_receipt& receipt );

} // tana::ledger
