#include <boost/test/unit_test.hpp>

#include <tana/edge/contract_handler.hpp>

#include <tana/tests/runtime_fixture.hpp>

using namespace tana;
using nlohmann::json;

struct edge_fixture : public runtime_fixture
{
   std::shared_ptr< edge::contract_handler > handler;

   edge_fixture()
   {
      handler = std::make_shared< edge::contract_handler >( make_dispatcher() );

      write_contract( "echo", "get.js", R"js(
export function Get(req) {
  console.log("echo", req.params.path);
  return { status: 200, body: { path: req.path, rest: req.params.path, id: req.params.contract_id, query: req.query, ip: req.ip, agent: req.headers["user-agent"] } };
}
)js" );

      write_contract( "echo", "post.js", R"js(
export function Post(req, body) {
  return { status: 201, body: { received: body } };
}
)js" );
   }

   net::transport::http::response send( const std::string& method, const std::string& path, const std::string& body = "" )
   {
      net::transport::http::request req;
      req.method = method;
      req.path = path;
      req.query[ "x" ] = "1";
      req.headers[ "user-agent" ] = "edge-test";
      req.body = body;
      req.remote_address = "192.0.2.7";
      return handler->handle( req );
   }
};

BOOST_FIXTURE_TEST_SUITE( edge_tests, edge_fixture )

BOOST_AUTO_TEST_CASE( split_contract_path_test )
{ try {
   BOOST_REQUIRE( edge::split_contract_path( "/counter" ) == std::make_pair( std::string( "counter" ), std::string() ) );
   BOOST_REQUIRE( edge::split_contract_path( "/counter/a/b" ) == std::make_pair( std::string( "counter" ), std::string( "a/b" ) ) );
   BOOST_REQUIRE( edge::split_contract_path( "//counter/" ) == std::make_pair( std::string( "counter" ), std::string() ) );
   BOOST_REQUIRE( edge::split_contract_path( "/" ).first.empty() );
   BOOST_REQUIRE( edge::split_contract_path( "" ).first.empty() );
} TANA_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( get_test )
{ try {
   auto res = send( "GET", "/echo/items/42" );
   BOOST_REQUIRE_EQUAL( res.status, 200 );
   BOOST_REQUIRE_EQUAL( res.headers[ "Content-Type" ], "application/json" );

   auto j = json::parse( res.body );
   BOOST_REQUIRE_EQUAL( j[ "status" ], 200 );
   BOOST_REQUIRE_EQUAL( j[ "body" ][ "path" ], "/echo/items/42" );
   BOOST_REQUIRE_EQUAL( j[ "body" ][ "rest" ], "items/42" );
   BOOST_REQUIRE_EQUAL( j[ "body" ][ "id" ], "echo" );
   BOOST_REQUIRE_EQUAL( j[ "body" ][ "query" ][ "x" ], "1" );
   BOOST_REQUIRE_EQUAL( j[ "body" ][ "ip" ], "192.0.2.7" );
   BOOST_REQUIRE_EQUAL( j[ "body" ][ "agent" ], "edge-test" );
} TANA_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( post_test )
{ try {
   auto res = send( "POST", "/echo", R"({"amount":5})" );
   BOOST_REQUIRE_EQUAL( res.status, 201 );
   BOOST_REQUIRE_EQUAL( json::parse( res.body )[ "body" ][ "received" ][ "amount" ], 5 );

   BOOST_TEST_MESSAGE( "An empty body arrives as an empty object" );
   res = send( "POST", "/echo" );
   BOOST_REQUIRE_EQUAL( json::parse( res.body )[ "body" ][ "received" ], json::object() );

   BOOST_TEST_MESSAGE( "Malformed JSON is rejected before the contract runs" );
   res = send( "POST", "/echo", "{not json" );
   BOOST_REQUIRE_EQUAL( res.status, 400 );
   auto j = json::parse( res.body );
   BOOST_REQUIRE_EQUAL( j[ "status" ], 400 );
   BOOST_REQUIRE( j[ "body" ][ "error" ].get< std::string >().rfind( "Invalid JSON body", 0 ) == 0 );
} TANA_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( error_test )
{ try {
   auto res = send( "GET", "/" );
   BOOST_REQUIRE_EQUAL( res.status, 404 );

   res = send( "GET", "/unknown" );
   BOOST_REQUIRE_EQUAL( res.status, 500 );
   BOOST_REQUIRE_EQUAL( json::parse( res.body )[ "body" ][ "error" ], "Contract not found: unknown/get.{js,ts}" );

   res = send( "GET", "/../secret" );
   BOOST_REQUIRE_EQUAL( res.status, 500 );
} TANA_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_SUITE_END()
