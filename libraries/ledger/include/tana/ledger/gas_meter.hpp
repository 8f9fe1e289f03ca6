#pragma once

#include <tana/ledger/constants.hpp>

#include <cstdint>
#include <mutex>

namespace tana::ledger {

/**
 * A cumulative gas counter with a fixed ceiling. Gas is only ever added, and
 * only when the whole amount fits under the limit.
 */
class gas_meter final
{
public:
   explicit gas_meter( uint64_t limit = gas_limit );
   ~gas_meter();

   uint64_t limit() const;
   uint64_t used() const;
   uint64_t remaining() const;

   /**
    * Adds cost to the counter if the result stays within the limit.
    * Returns false and leaves the counter untouched otherwise.
    */
   bool try_consume( uint64_t cost );

private:
   mutable std::mutex _mutex;
   const uint64_t     _limit;
   uint64_t           _used = 0;
};

} // tana::ledger
