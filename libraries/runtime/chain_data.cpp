#include <tana/runtime/chain_data.hpp>
#include <tana/runtime/exceptions.hpp>

#include <tana/log.hpp>

#include <cstdlib>

namespace tana::runtime {

namespace detail {

const std::string* string_field( const nlohmann::json& record, const char* field )
{
   if ( !record.is_object() )
      return nullptr;

   auto it = record.find( field );
   if ( it == record.end() || !it->is_string() )
      return nullptr;

   return it->get_ptr< const std::string* >();
}

// Ledger amounts are decimal strings
double parse_amount( const nlohmann::json& amount )
{
   if ( amount.is_number() )
      return amount.get< double >();

   if ( !amount.is_string() )
      return 0.0;

   const auto& s = amount.get_ref< const std::string& >();
   if ( s.empty() )
      return 0.0;

   char* end = nullptr;
   double value = std::strtod( s.c_str(), &end );
   if ( end != s.c_str() + s.size() )
      return 0.0;

   return value;
}

} // detail

std::string to_string( collection c )
{
   switch ( c )
   {
      case collection::balances:
         return "balances";
      case collection::users:
         return "users";
      case collection::transactions:
         return "transactions";
   }

   return "unknown";
}

abstract_chain_data::abstract_chain_data() = default;
abstract_chain_data::~abstract_chain_data() = default;

std::vector< double > abstract_chain_data::balances( const std::vector< std::string >& owner_ids, const std::string& currency )
{
   auto all = records( collection::balances );

   std::vector< double > result;
   result.reserve( owner_ids.size() );

   for ( const auto& owner : owner_ids )
   {
      double amount = 0.0;

      for ( const auto& b : all )
      {
         auto o = detail::string_field( b, "ownerId" );
         auto c = detail::string_field( b, "currencyCode" );

         if ( o && c && *o == owner && *c == currency )
         {
            auto a = b.find( "amount" );
            if ( a != b.end() )
               amount = detail::parse_amount( *a );
            break;
         }
      }

      result.push_back( amount );
   }

   return result;
}

std::vector< nlohmann::json > abstract_chain_data::users( const std::vector< std::string >& ids )
{
   auto all = records( collection::users );

   std::vector< nlohmann::json > result;
   result.reserve( ids.size() );

   for ( const auto& id : ids )
   {
      nlohmann::json match;

      for ( const auto& u : all )
      {
         auto uid  = detail::string_field( u, "id" );
         auto name = detail::string_field( u, "username" );

         if ( ( uid && *uid == id ) || ( name && *name == id ) )
         {
            match = u;
            break;
         }
      }

      result.push_back( std::move( match ) );
   }

   return result;
}

std::vector< nlohmann::json > abstract_chain_data::transactions( const std::vector< std::string >& ids )
{
   auto all = records( collection::transactions );

   std::vector< nlohmann::json > result;
   result.reserve( ids.size() );

   for ( const auto& id : ids )
   {
      nlohmann::json match;

      for ( const auto& tx : all )
      {
         auto tid = detail::string_field( tx, "id" );
         if ( tid && *tid == id )
         {
            match = tx;
            break;
         }
      }

      result.push_back( std::move( match ) );
   }

   return result;
}

mock_chain_data::mock_chain_data()
{
   _users = nlohmann::json::array( {
      { { "id", "user_alice" }, { "username", "alice" }, { "displayName", "Alice" }, { "bio", "Early adopter" } },
      { { "id", "user_bob" }, { "username", "bob" }, { "displayName", "Bob" }, { "bio", nullptr } }
   } );

   _balances = nlohmann::json::array( {
      { { "ownerId", "user_alice" }, { "ownerType", "user" }, { "currencyCode", "USD" }, { "amount", "1000.00000000" } },
      { { "ownerId", "user_alice" }, { "ownerType", "user" }, { "currencyCode", "BTC" }, { "amount", "0.50000000" } },
      { { "ownerId", "user_bob" }, { "ownerType", "user" }, { "currencyCode", "USD" }, { "amount", "250.00000000" } }
   } );

   _transactions = nlohmann::json::array( {
      {
         { "id", "tx_genesis" },
         { "from", "user_alice" },
         { "to", "user_bob" },
         { "amount", "50.00000000" },
         { "currencyCode", "USD" },
         { "type", "transfer" },
         { "status", "confirmed" }
      }
   } );
}

mock_chain_data::~mock_chain_data() = default;

nlohmann::json mock_chain_data::records( collection c )
{
   switch ( c )
   {
      case collection::balances:
         return _balances;
      case collection::users:
         return _users;
      case collection::transactions:
         return _transactions;
   }

   return nlohmann::json::array();
}

ledger_chain_data::ledger_chain_data( std::shared_ptr< net::transport::http::abstract_http_client > client, const std::string& base_url ) :
   _client( client ),
   _base( net::parse_url( base_url ) )
{
   TANA_ASSERT( _base.host.has_value(), net::invalid_hostname, "Invalid ledger url: ${url}", ("url", base_url) );

   while ( _base.target.size() > 1 && _base.target.back() == '/' )
      _base.target.pop_back();

   if ( _base.target == "/" )
      _base.target.clear();
}

ledger_chain_data::~ledger_chain_data() = default;

nlohmann::json ledger_chain_data::records( collection c )
{
   auto name = to_string( c );
   auto u = _base;
   u.target += "/" + name;

   net::transport::http::http_result res;

   try
   {
      res = _client->get( u );
   }
   catch ( const net::net_exception& e )
   {
      TANA_THROW( chain_data_fetch_failed, "Failed to fetch ${name}: ${what}", ("name", name)("what", e.get_message()) );
   }

   TANA_ASSERT( res.status >= 200 && res.status < 300, chain_data_fetch_failed,
      "Failed to fetch ${name}: HTTP ${status}", ("name", name)("status", res.status) );

   nlohmann::json j;

   try
   {
      j = nlohmann::json::parse( res.body );
   }
   catch ( const nlohmann::json::parse_error& e )
   {
      TANA_THROW( chain_data_parse_failed, "Failed to parse ${name}: ${what}", ("name", name)("what", e.what()) );
   }

   TANA_ASSERT( j.is_array(), chain_data_parse_failed, "Failed to parse ${name}: expected an array", ("name", name) );

   LOG(debug) << "Fetched " << j.size() << " " << name << " from ledger";

   return j;
}

} // tana::runtime
