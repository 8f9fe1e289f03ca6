#include <tana/runtime/constants.hpp>
#include <tana/runtime/execution_context.hpp>

#include <chrono>
#include <sstream>

namespace tana::runtime {

execution_context::execution_context( const services& svc, block::block_context ctx ) :
   _services( svc ),
   _block( std::move( ctx ) )
{}

store::staged_store& execution_context::store()
{
   return *_services.store;
}

ledger::transaction_ledger& execution_context::ledger()
{
   return *_services.ledger;
}

net::egress_gateway& execution_context::gateway()
{
   return *_services.gateway;
}

abstract_chain_data& execution_context::chain_data()
{
   return *_services.chain_data;
}

const block::block_context& execution_context::block() const
{
   return _block;
}

void execution_context::console_append( console_stream s, const std::string& text )
{
   _console.push_back( console_line{ s, text } );
}

const std::vector< console_line >& execution_context::console() const
{
   return _console;
}

void execution_context::push_task( host_task&& task )
{
   _tasks.emplace_back( std::move( task ) );
}

bool execution_context::run_task()
{
   if ( _tasks.empty() )
      return false;

   auto task = std::move( _tasks.front() );
   _tasks.pop_front();
   task();

   return true;
}

void execution_context::clear_tasks()
{
   _tasks.clear();
}

std::size_t execution_context::pending_tasks() const
{
   return _tasks.size();
}

block::block_context make_block_context( const std::string& contract_id, const std::string& executor, const ledger::gas_meter& meter )
{
   auto hex = []( uint64_t v )
   {
      std::stringstream ss;
      ss << "0x" << std::hex << v;
      return ss.str();
   };

   block::block_context ctx;
   ctx.set_height( constants::block_height );
   ctx.set_timestamp( std::chrono::duration_cast< std::chrono::milliseconds >( std::chrono::system_clock::now().time_since_epoch() ).count() );
   ctx.set_hash( hex( constants::block_height ) );
   ctx.set_previous_hash( hex( constants::block_height - 1 ) );
   ctx.set_executor( executor );
   ctx.set_contract_id( contract_id );
   ctx.set_gas_limit( meter.limit() );
   ctx.set_gas_used( meter.used() );

   return ctx;
}

} // tana::runtime
