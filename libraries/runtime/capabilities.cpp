#include <tana/runtime/capabilities.hpp>
#include <tana/runtime/capability_dispatcher.hpp>
#include <tana/runtime/constants.hpp>
#include <tana/runtime/exceptions.hpp>

#include <tana/log.hpp>

namespace tana::runtime {

void register_capabilities( capability_dispatcher& cd )
{
   CAPABILITY_REGISTER( cd,
      (print_stdout)
      (print_stderr)
      (sum)

      (data_set)
      (data_get)
      (data_delete)
      (data_has)
      (data_keys)
      (data_entries)
      (data_clear)
      (data_commit)

      (block_get_height)
      (block_get_timestamp)
      (block_get_hash)
      (block_get_previous_hash)
      (block_get_executor)
      (block_get_contract_id)
      (block_get_gas_limit)
      (block_get_gas_used)

      (tx_transfer)
      (tx_set_balance)
      (tx_get_changes)
      (tx_execute)
   )

   CAPABILITY_REGISTER_ASYNC( cd,
      (fetch)
      (block_get_balance)
      (block_get_user)
      (block_get_transaction)
   )
}

namespace detail {

struct batch
{
   std::vector< std::string > ids;
   bool                       single = false;
};

batch batch_ids( const nlohmann::json& ids, const std::string& arg_name, const std::string& kind )
{
   batch b;

   if ( ids.is_string() )
   {
      b.ids.push_back( ids.get< std::string >() );
      b.single = true;
      return b;
   }

   TANA_ASSERT( ids.is_array(), argument_type_exception, "Invalid ${arg}", ("arg", arg_name) );

   for ( const auto& id : ids )
   {
      TANA_ASSERT( id.is_string(), argument_type_exception, "Invalid ${arg}", ("arg", arg_name) );
      b.ids.push_back( id.get< std::string >() );
   }

   TANA_ASSERT( b.ids.size() <= constants::max_batch_query, batch_too_large,
      "Cannot query more than ${max} ${kind} at once", ("max", constants::max_batch_query)("kind", kind) );

   return b;
}

template< typename T >
nlohmann::json batch_result( const batch& b, std::vector< T >&& results )
{
   if ( b.single )
      return nlohmann::json( std::move( results.front() ) );

   return nlohmann::json( std::move( results ) );
}

} // detail

namespace capability {

void _print_stdout( execution_context& context, const std::string& message )
{
   context.console_append( console_stream::out, message );
}

void _print_stderr( execution_context& context, const std::string& message )
{
   context.console_append( console_stream::err, message );
}

double _sum( execution_context& context, const nlohmann::json& numbers )
{
   TANA_ASSERT( numbers.is_array(), argument_type_exception, "sum expects an array of numbers" );

   double total = 0.0;
   for ( const auto& n : numbers )
   {
      TANA_ASSERT( n.is_number(), argument_type_exception, "sum expects an array of numbers" );
      total += n.get< double >();
   }

   return total;
}

nlohmann::json _fetch( execution_context& context, const std::string& url )
{
   auto res = context.gateway().fetch( url );

   LOG(debug) << "Fetched " << url << " (" << res.status << ", " << res.body.size() << " bytes)";

   return nlohmann::json{ { "status", res.status }, { "body", std::move( res.body ) } };
}

void _data_set( execution_context& context, const std::string& key, const std::string& value )
{
   context.store().set( key, value );
}

nlohmann::json _data_get( execution_context& context, const std::string& key )
{
   auto value = context.store().get( key );
   if ( !value )
      return nlohmann::json();

   return *value;
}

void _data_delete( execution_context& context, const std::string& key )
{
   context.store().erase( key );
}

bool _data_has( execution_context& context, const std::string& key )
{
   return context.store().has( key );
}

std::vector< std::string > _data_keys( execution_context& context, const std::optional< std::string >& pattern )
{
   return context.store().keys( pattern );
}

nlohmann::json _data_entries( execution_context& context )
{
   return context.store().entries();
}

void _data_clear( execution_context& context )
{
   context.store().clear();
}

void _data_commit( execution_context& context )
{
   context.store().commit();
}

uint64_t _block_get_height( execution_context& context )
{
   return context.block().height();
}

uint64_t _block_get_timestamp( execution_context& context )
{
   return context.block().timestamp();
}

std::string _block_get_hash( execution_context& context )
{
   return context.block().hash();
}

std::string _block_get_previous_hash( execution_context& context )
{
   return context.block().previous_hash();
}

std::string _block_get_executor( execution_context& context )
{
   return context.block().executor();
}

std::string _block_get_contract_id( execution_context& context )
{
   return context.block().contract_id();
}

uint64_t _block_get_gas_limit( execution_context& context )
{
   return context.block().gas_limit();
}

uint64_t _block_get_gas_used( execution_context& context )
{
   return context.block().gas_used();
}

nlohmann::json _block_get_balance( execution_context& context, const nlohmann::json& user_ids, const std::string& currency )
{
   auto b = detail::batch_ids( user_ids, "user_ids", "balances" );
   if ( b.ids.empty() )
      return nlohmann::json::array();

   return detail::batch_result( b, context.chain_data().balances( b.ids, currency ) );
}

nlohmann::json _block_get_user( execution_context& context, const nlohmann::json& user_ids )
{
   auto b = detail::batch_ids( user_ids, "user_ids", "users" );
   if ( b.ids.empty() )
      return nlohmann::json::array();

   return detail::batch_result( b, context.chain_data().users( b.ids ) );
}

nlohmann::json _block_get_transaction( execution_context& context, const nlohmann::json& tx_ids )
{
   auto b = detail::batch_ids( tx_ids, "tx_ids", "transactions" );
   if ( b.ids.empty() )
      return nlohmann::json::array();

   return detail::batch_result( b, context.chain_data().transactions( b.ids ) );
}

void _tx_transfer( execution_context& context, const std::string& from, const std::string& to, double amount, const std::string& currency )
{
   context.ledger().transfer( from, to, amount, currency );
}

void _tx_set_balance( execution_context& context, const std::string& user_id, double amount, const std::string& currency )
{
   context.ledger().set_balance( user_id, amount, currency );
}

nlohmann::json _tx_get_changes( execution_context& context )
{
   return ledger::to_json( context.ledger().get_changes() );
}

nlohmann::json _tx_execute( execution_context& context )
{
   auto receipt = context.ledger().execute();

   if ( receipt.success() )
      LOG(debug) << "Executed " << receipt.changes_size() << " ledger changes for " << receipt.gas_used() << " gas";
   else
      LOG(debug) << "Ledger batch rejected: " << receipt.error();

   return ledger::to_json( receipt );
}

} // capability

} // tana::runtime
