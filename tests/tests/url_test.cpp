#include <boost/test/unit_test.hpp>

#include <tana/net/url.hpp>

using namespace tana::net;

struct url_fixture {};

BOOST_FIXTURE_TEST_SUITE( url_tests, url_fixture )

BOOST_AUTO_TEST_CASE( parse_url_test )
{ try {
   auto u = parse_url( "HTTPS://PokeAPI.co/api/v2/pokemon/ditto?x=1#frag" );
   BOOST_REQUIRE_EQUAL( u.scheme, "https" );
   BOOST_REQUIRE( u.host );
   BOOST_REQUIRE_EQUAL( *u.host, "pokeapi.co" );
   BOOST_REQUIRE_EQUAL( u.port, 443 );
   BOOST_REQUIRE_EQUAL( u.target, "/api/v2/pokemon/ditto?x=1" );
   BOOST_REQUIRE( u.is_secure() );
   BOOST_REQUIRE_EQUAL( u.authority(), "pokeapi.co" );

   u = parse_url( "http://user:pw@localhost:8080" );
   BOOST_REQUIRE_EQUAL( *u.host, "localhost" );
   BOOST_REQUIRE_EQUAL( u.port, 8080 );
   BOOST_REQUIRE_EQUAL( u.target, "/" );
   BOOST_REQUIRE_EQUAL( u.authority(), "localhost:8080" );

   u = parse_url( "http://[::1]:9000/x" );
   BOOST_REQUIRE_EQUAL( *u.host, "::1" );
   BOOST_REQUIRE_EQUAL( u.authority(), "[::1]:9000" );

   BOOST_TEST_MESSAGE( "A URL without an authority has no host" );
   u = parse_url( "data:text/plain,hi" );
   BOOST_REQUIRE( !u.host );
} TANA_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( invalid_url_test )
{ try {
   BOOST_REQUIRE_THROW( parse_url( "not a url" ), invalid_url );
   BOOST_REQUIRE_THROW( parse_url( "/relative/path" ), invalid_url );
   BOOST_REQUIRE_THROW( parse_url( "http://" ), invalid_url );
   BOOST_REQUIRE_THROW( parse_url( "http://host:99999/" ), invalid_url );
   BOOST_REQUIRE_THROW( parse_url( "http://host:12ab/" ), invalid_url );
   BOOST_REQUIRE_THROW( parse_url( "http://bad host/" ), invalid_url );
   BOOST_REQUIRE_THROW( parse_url( "http://[::1/" ), invalid_url );
} TANA_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_SUITE_END()
