#include <tana/ledger/gas_meter.hpp>

namespace tana::ledger {

gas_meter::gas_meter( uint64_t limit ) : _limit( limit ) {}

gas_meter::~gas_meter() = default;

uint64_t gas_meter::limit() const
{
   return _limit;
}

uint64_t gas_meter::used() const
{
   std::lock_guard< std::mutex > lock( _mutex );
   return _used;
}

uint64_t gas_meter::remaining() const
{
   std::lock_guard< std::mutex > lock( _mutex );
   return _limit - _used;
}

bool gas_meter::try_consume( uint64_t cost )
{
   std::lock_guard< std::mutex > lock( _mutex );

   if ( cost > _limit - _used )
      return false;

   _used += cost;
   return true;
}

} // tana::ledger
