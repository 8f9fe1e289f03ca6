#include <tana/ledger/transaction_ledger.hpp>

namespace tana::ledger {

transaction_ledger::transaction_ledger( gas_meter& meter ) : _meter( meter ) {}

transaction_ledger::~transaction_ledger() = default;

void transaction_ledger::transfer( const std::string& from, const std::string& to, double amount, const std::string& currency )
{
   TANA_ASSERT( from != to, self_transfer, "Cannot transfer to self" );
   TANA_ASSERT( amount > 0, non_positive_amount, "Amount must be positive" );

   change c;
   auto t = c.mutable_transfer();
   t->set_from( from );
   t->set_to( to );
   t->set_amount( amount );
   t->set_currency( currency );

   std::lock_guard< std::mutex > lock( _mutex );
   _pending.emplace_back( std::move( c ) );
}

void transaction_ledger::set_balance( const std::string& user_id, double amount, const std::string& currency )
{
   TANA_ASSERT( amount >= 0, negative_balance, "Balance cannot be negative" );

   change c;
   auto b = c.mutable_balance_update();
   b->set_user_id( user_id );
   b->set_amount( amount );
   b->set_currency( currency );

   std::lock_guard< std::mutex > lock( _mutex );
   _pending.emplace_back( std::move( c ) );
}

std::vector< change > transaction_ledger::get_changes() const
{
   std::lock_guard< std::mutex > lock( _mutex );
   return _pending;
}

execution_receipt transaction_ledger::execute()
{
   std::lock_guard< std::mutex > lock( _mutex );

   std::vector< change > batch;
   batch.swap( _pending );

   const uint64_t cost = gas_cost_per_change * batch.size();

   execution_receipt receipt;

   if ( !_meter.try_consume( cost ) )
   {
      receipt.set_success( false );
      receipt.set_gas_used( _meter.limit() );
      receipt.set_error( out_of_gas_error );
      return receipt;
   }

   receipt.set_success( true );
   receipt.set_gas_used( cost );
   for ( auto& c : batch )
      *receipt.add_changes() = std::move( c );

   return receipt;
}

gas_meter& transaction_ledger::meter()
{
   return _meter;
}

const gas_meter& transaction_ledger::meter() const
{
   return _meter;
}

nlohmann::json to_json( const change& c )
{
   nlohmann::json j;

   switch ( c.kind_case() )
   {
      case change::KindCase::kTransfer:
         j[ "type" ]     = "transfer";
         j[ "from" ]     = c.transfer().from();
         j[ "to" ]       = c.transfer().to();
         j[ "amount" ]   = c.transfer().amount();
         j[ "currency" ] = c.transfer().currency();
         break;
      case change::KindCase::kBalanceUpdate:
         j[ "type" ]     = "balance_update";
         j[ "userId" ]   = c.balance_update().user_id();
         j[ "amount" ]   = c.balance_update().amount();
         j[ "currency" ] = c.balance_update().currency();
         break;
      default:
         j = nullptr;
         break;
   }

   return j;
}

nlohmann::json to_json( const std::vector< change >& changes )
{
   auto j = nlohmann::json::array();

   for ( const auto& c : changes )
      j.push_back( to_json( c ) );

   return j;
}

nlohmann::json to_json( const execution_receipt& receipt )
{
   nlohmann::json j;
   j[ "success" ] = receipt.success();
   j[ "changes" ] = nlohmann::json::array();
   for ( const auto& c : receipt.changes() )
      j[ "changes" ].push_back( to_json( c ) );
   j[ "gasUsed" ] = receipt.gas_used();

   if ( receipt.error().empty() )
      j[ "error" ] = nullptr;
   else
      j[ "error" ] = receipt.error();

   return j;
}

} // tana::ledger
