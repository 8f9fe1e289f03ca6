#include <boost/test/unit_test.hpp>

#include <tana/store/staged_store.hpp>

#include <chrono>
#include <string>

using namespace tana::store;

struct store_fixture
{
   staged_store store;
};

BOOST_FIXTURE_TEST_SUITE( store_tests, store_fixture )

BOOST_AUTO_TEST_CASE( staging_test )
{ try {
   BOOST_TEST_MESSAGE( "Staged writes are visible before commit" );
   store.set( "counter", "1" );
   BOOST_REQUIRE( store.has( "counter" ) );
   BOOST_REQUIRE_EQUAL( *store.get( "counter" ), "1" );

   BOOST_TEST_MESSAGE( "Staged deletes shadow committed values" );
   store.commit();
   store.erase( "counter" );
   BOOST_REQUIRE( !store.has( "counter" ) );
   BOOST_REQUIRE( !store.get( "counter" ) );
   BOOST_REQUIRE( store.keys().empty() );

   BOOST_TEST_MESSAGE( "Overwriting a deleted key revives it" );
   store.set( "counter", "2" );
   BOOST_REQUIRE_EQUAL( *store.get( "counter" ), "2" );
   store.commit();
   BOOST_REQUIRE_EQUAL( *store.get( "counter" ), "2" );

   BOOST_TEST_MESSAGE( "A second commit with nothing staged changes nothing" );
   auto before = store.entries();
   store.commit();
   BOOST_REQUIRE( store.entries() == before );

   BOOST_TEST_MESSAGE( "Entries merge both layers" );
   store.set( "a", "x" );
   auto entries = store.entries();
   BOOST_REQUIRE_EQUAL( entries.size(), 2 );
   BOOST_REQUIRE_EQUAL( entries[ "a" ], "x" );
   BOOST_REQUIRE_EQUAL( entries[ "counter" ], "2" );

   BOOST_TEST_MESSAGE( "Clear wipes committed and staged data" );
   store.clear();
   BOOST_REQUIRE( store.entries().empty() );
   BOOST_REQUIRE_EQUAL( store.size().keys, 0 );
} TANA_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( keys_test )
{ try {
   store.set( "user:1", "a" );
   store.set( "user:2", "b" );
   store.set( "session:1", "c" );
   store.set( "user.x", "d" );

   auto all = store.keys();
   BOOST_REQUIRE_EQUAL( all.size(), 4 );
   BOOST_REQUIRE_EQUAL( all[0], "session:1" );

   auto users = store.keys( std::string( "user:*" ) );
   BOOST_REQUIRE_EQUAL( users.size(), 2 );
   BOOST_REQUIRE_EQUAL( users[0], "user:1" );
   BOOST_REQUIRE_EQUAL( users[1], "user:2" );

   BOOST_TEST_MESSAGE( "Only '*' is special in a pattern" );
   BOOST_REQUIRE_EQUAL( store.keys( std::string( "user.*" ) ).size(), 1 );
   BOOST_REQUIRE( glob_match( "a.c", "a.c" ) );
   BOOST_REQUIRE( !glob_match( "a.c", "abc" ) );
   BOOST_REQUIRE( glob_match( "(x)*", "(x)yz" ) );
   BOOST_REQUIRE( !glob_match( "user", "user:1" ) );
   BOOST_REQUIRE( glob_match( "*", "" ) );
   BOOST_REQUIRE( glob_match( "*:*:*", "a:b:c" ) );
   BOOST_REQUIRE( glob_match( "a*b*c", "aXbYbZc" ) );
   BOOST_REQUIRE( !glob_match( "a*b*c", "aXbYbZ" ) );
   BOOST_REQUIRE( glob_match( "**", "abc" ) );
   BOOST_REQUIRE( !glob_match( "", "a" ) );
} TANA_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( entry_limits_test )
{ try {
   BOOST_REQUIRE_NO_THROW( store.set( std::string( max_key_size, 'k' ), "v" ) );
   BOOST_REQUIRE_THROW( store.set( std::string( max_key_size + 1, 'k' ), "v" ), key_too_large );

   BOOST_REQUIRE_NO_THROW( store.set( "big", std::string( max_value_size, 'v' ) ) );
   BOOST_REQUIRE_THROW( store.set( "bigger", std::string( max_value_size + 1, 'v' ) ), value_too_large );

   try
   {
      store.set( "k", std::string( max_value_size + 1, 'v' ) );
      BOOST_FAIL( "expected value_too_large" );
   }
   catch ( const value_too_large& e )
   {
      BOOST_REQUIRE_EQUAL( e.get_message(), "Value too large: 10241 bytes (max 10240)" );
   }
} TANA_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( commit_limits_test )
{ try {
   BOOST_TEST_MESSAGE( "A commit over the total size applies nothing" );
   store.set( "keep", "me" );
   store.commit();

   for ( int i = 0; i < 11; i++ )
      store.set( "blob" + std::to_string( i ), std::string( max_value_size, 'x' ) );

   BOOST_REQUIRE_THROW( store.commit(), storage_limit_exceeded );

   BOOST_TEST_MESSAGE( "The failed batch stays staged" );
   BOOST_REQUIRE( store.has( "blob10" ) );

   store.erase( "blob10" );
   store.erase( "blob9" );
   BOOST_REQUIRE_NO_THROW( store.commit() );
   BOOST_REQUIRE_EQUAL( store.size().keys, 10 );

   BOOST_TEST_MESSAGE( "A commit over the key count applies nothing" );
   store.clear();
   for ( std::size_t i = 0; i <= max_keys; i++ )
      store.set( std::to_string( i ), "" );

   BOOST_REQUIRE_THROW( store.commit(), too_many_keys );
   store.erase( "0" );
   BOOST_REQUIRE_NO_THROW( store.commit() );
   BOOST_REQUIRE_EQUAL( store.size().keys, max_keys );

   BOOST_TEST_MESSAGE( "Limit errors belong to the limit taxonomy" );
   store.set( "one-too-many", "" );
   BOOST_REQUIRE_THROW( store.commit(), tana::limit_exception );
} TANA_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( adversarial_pattern_test )
{ try {
   BOOST_TEST_MESSAGE( "Star heavy patterns match in polynomial time" );
   store.set( std::string( 200, 'a' ), "v" );
   store.set( "other", "v" );

   std::string pattern;
   for ( int i = 0; i < 40; i++ )
      pattern += "*a";
   pattern += "b";

   auto start = std::chrono::steady_clock::now();
   auto matched = store.keys( pattern );
   auto elapsed = std::chrono::steady_clock::now() - start;

   BOOST_REQUIRE( matched.empty() );
   BOOST_REQUIRE( std::chrono::duration_cast< std::chrono::seconds >( elapsed ).count() < 1 );

   pattern.pop_back();
   BOOST_REQUIRE_EQUAL( store.keys( pattern ).size(), 1 );

   BOOST_TEST_MESSAGE( "Long patterns are not rejected" );
   BOOST_REQUIRE_NO_THROW( store.keys( std::string( 5000, '*' ) + "x" ) );
   BOOST_REQUIRE_EQUAL( store.keys( std::string( 5000, '*' ) ).size(), 2 );
} TANA_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( failed_commit_leaves_storage_test )
{ try {
   store.set( "alpha", "1" );
   store.set( "beta", std::string( 500, 'b' ) );
   store.commit();

   auto keys_before = store.keys( std::string( "*" ) );
   auto entries_before = store.entries();

   for ( int i = 0; i < 10; i++ )
      store.set( "blob" + std::to_string( i ), std::string( max_value_size, 'x' ) );
   store.set( "alpha", "changed" );
   store.erase( "beta" );

   BOOST_REQUIRE_THROW( store.commit(), storage_limit_exceeded );

   BOOST_TEST_MESSAGE( "Dropping the staged batch exposes the untouched committed layer" );
   for ( int i = 0; i < 10; i++ )
      store.erase( "blob" + std::to_string( i ) );
   store.set( "alpha", "1" );
   store.set( "beta", std::string( 500, 'b' ) );

   BOOST_REQUIRE( store.keys( std::string( "*" ) ) == keys_before );
   for ( const auto& [ key, value ] : entries_before )
   {
      auto v = store.get( key );
      BOOST_REQUIRE( v );
      BOOST_REQUIRE_EQUAL( *v, value );
   }
   BOOST_REQUIRE( store.entries() == entries_before );
} TANA_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( oversized_value_never_stored_test )
{ try {
   const std::string big( max_value_size + 1, 'v' );

   BOOST_REQUIRE_THROW( store.set( "big", big ), value_too_large );
   BOOST_REQUIRE( !store.get( "big" ) );
   BOOST_REQUIRE( !store.has( "big" ) );
   BOOST_REQUIRE( store.keys().empty() );

   store.commit();
   BOOST_REQUIRE( !store.get( "big" ) );
   BOOST_REQUIRE( store.keys( std::string( "*" ) ).empty() );

   BOOST_TEST_MESSAGE( "An oversized overwrite keeps the previous value" );
   store.set( "big", "small" );
   store.commit();
   BOOST_REQUIRE_THROW( store.set( "big", big ), value_too_large );
   BOOST_REQUIRE_EQUAL( *store.get( "big" ), "small" );
   store.commit();
   BOOST_REQUIRE_EQUAL( *store.get( "big" ), "small" );
   BOOST_REQUIRE_EQUAL( store.keys().size(), 1 );
} TANA_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_SUITE_END()
