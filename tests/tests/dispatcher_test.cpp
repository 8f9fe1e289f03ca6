#include <boost/test/unit_test.hpp>

#include <tana/runtime/compiler.hpp>
#include <tana/runtime/constants.hpp>
#include <tana/runtime/dispatcher.hpp>
#include <tana/runtime/exceptions.hpp>

#include <tana/tests/runtime_fixture.hpp>

#include <fstream>
#include <string>

using namespace tana;
using nlohmann::json;

namespace {

// Stands in for the TypeScript compiler bundle: strips simple type annotations.
constexpr const char* fake_typescript = R"js(
var ts = {
   ScriptTarget: { ES2020: 7 },
   ModuleKind: { ESNext: 99 },
   transpileModule: function (source, options) {
      globalThis.__lastFileName = options.fileName;
      return { outputText: source.replace(/: (string|number)/g, "") };
   }
};
)js";

} // anonymous

struct dispatcher_fixture : public runtime_fixture
{
   std::shared_ptr< runtime::dispatcher > dispatcher;

   dispatcher_fixture()
   {
      dispatcher = make_dispatcher();
   }

   runtime::invocation_result get( const std::string& id, const std::map< std::string, std::string >& query = {} )
   {
      runtime::invocation inv;
      inv.contract_id = id;
      inv.path = "/" + id;
      inv.query = query;
      return dispatcher->execute( inv );
   }

   runtime::invocation_result post( const std::string& id, const json& body )
   {
      runtime::invocation inv;
      inv.contract_id = id;
      inv.method = "POST";
      inv.path = "/" + id;
      inv.body = body;
      return dispatcher->execute( inv );
   }

   runtime::invocation_result run_get( const std::string& source )
   {
      write_contract( "scratch", "get.js", source );
      return get( "scratch" );
   }

   static std::string error_of( const runtime::invocation_result& r )
   {
      return r.response[ "body" ][ "error" ].get< std::string >();
   }
};

BOOST_FIXTURE_TEST_SUITE( dispatcher_tests, dispatcher_fixture )

BOOST_AUTO_TEST_CASE( response_shape_test )
{ try {
   BOOST_TEST_MESSAGE( "Helpers normalize whatever a contract returns" );
   BOOST_REQUIRE_EQUAL( runtime::make_response( {} ), runtime::error_response( "No Get or Post function exported" ) );
   BOOST_REQUIRE_EQUAL( runtime::make_response( json() ), runtime::error_response( "No result returned" ) );
   BOOST_REQUIRE_EQUAL( runtime::make_response( json( "hi" ) ), ( json{ { "status", 200 }, { "body", "hi" } } ) );

   auto r = runtime::make_response( json{ { "status", 201 }, { "body", { { "a", 1 } } }, { "headers", { { "X-A", "b" } } } } );
   BOOST_REQUIRE_EQUAL( r[ "status" ], 201 );
   BOOST_REQUIRE_EQUAL( r[ "headers" ][ "X-A" ], "b" );

   r = runtime::make_response( json{ { "status", "teapot" }, { "headers", "nope" } } );
   BOOST_REQUIRE_EQUAL( r[ "status" ], 200 );
   BOOST_REQUIRE( r[ "body" ].is_null() );
   BOOST_REQUIRE( !r.contains( "headers" ) );

   BOOST_REQUIRE_EQUAL( runtime::response_status( json{ { "status", 404 } } ), 404 );
   BOOST_REQUIRE_EQUAL( runtime::response_status( json::object() ), 200 );

   BOOST_REQUIRE_EQUAL( runtime::entry_point( "GET" ), "Get" );
   BOOST_REQUIRE_EQUAL( runtime::entry_point( "POST" ), "Post" );
   BOOST_REQUIRE_THROW( runtime::entry_point( "PUT" ), runtime::invalid_method );

   BOOST_REQUIRE_NO_THROW( runtime::validate_contract_id( "hello-world_2" ) );
   BOOST_REQUIRE_THROW( runtime::validate_contract_id( "" ), runtime::invalid_contract_id );
   BOOST_REQUIRE_THROW( runtime::validate_contract_id( ".." ), runtime::invalid_contract_id );
   BOOST_REQUIRE_THROW( runtime::validate_contract_id( "." ), runtime::invalid_contract_id );
   BOOST_REQUIRE_THROW( runtime::validate_contract_id( "a/b" ), runtime::invalid_contract_id );
   BOOST_REQUIRE_THROW( runtime::validate_contract_id( "a\\b" ), runtime::invalid_contract_id );
} TANA_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( hello_test )
{ try {
   write_contract( "hello", "get.js", R"js(
import { console, version } from "tana/core";
import { block } from "tana/block";

export function Get(req) {
  console.log("hello from", block.getContractId());
  console.error({ warn: true });
  return { status: 200, body: { path: req.path, q: req.query.q, ip: req.ip, height: block.getHeight(), version } };
}
)js" );

   auto r = get( "hello", { { "q", "x" } } );
   BOOST_REQUIRE_EQUAL( r.status, 200 );
   BOOST_REQUIRE_EQUAL( r.response[ "status" ], 200 );
   BOOST_REQUIRE_EQUAL( r.response[ "body" ][ "path" ], "/hello" );
   BOOST_REQUIRE_EQUAL( r.response[ "body" ][ "q" ], "x" );
   BOOST_REQUIRE_EQUAL( r.response[ "body" ][ "ip" ], "127.0.0.1" );
   BOOST_REQUIRE_EQUAL( r.response[ "body" ][ "height" ], runtime::constants::block_height );
   BOOST_REQUIRE_EQUAL( r.response[ "body" ][ "version" ][ "tana" ], runtime::constants::tana_version );

   BOOST_REQUIRE_EQUAL( r.console.size(), 2 );
   BOOST_REQUIRE( r.console[0].stream == runtime::console_stream::out );
   BOOST_REQUIRE_EQUAL( r.console[0].text, "hello from hello" );
   BOOST_REQUIRE( r.console[1].stream == runtime::console_stream::err );
   BOOST_REQUIRE_EQUAL( r.console[1].text, "{\n  \"warn\": true\n}" );
} TANA_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( sandbox_test )
{ try {
   auto r = run_get( R"js(
export function Get() {
  return { body: {
    core: typeof __tanaCore,
    viaGlobal: typeof globalThis.__tanaCore,
    std: typeof std,
    os: typeof os,
    require: typeof require,
    process: typeof process,
  } };
}
)js" );

   BOOST_REQUIRE_EQUAL( r.status, 200 );
   BOOST_REQUIRE_EQUAL( r.response[ "body" ].size(), 6 );
   for ( const auto& item : r.response[ "body" ].items() )
      BOOST_REQUIRE_MESSAGE( item.value() == "undefined", item.key() << " is reachable from contract code" );

   BOOST_TEST_MESSAGE( "Modules are frozen" );
   r = run_get( R"js(
import { data } from "tana/data";
export function Get() {
  const m = __tanaImport("tana/data");
  try { m.data = null; } catch (e) {}
  return m.data === data && Object.isFrozen(m);
}
)js" );
   BOOST_REQUIRE_EQUAL( r.response[ "body" ], true );
} TANA_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( error_results_test )
{ try {
   BOOST_TEST_MESSAGE( "Missing contract" );
   auto r = get( "nowhere" );
   BOOST_REQUIRE_EQUAL( r.status, 500 );
   BOOST_REQUIRE_EQUAL( error_of( r ), "Contract not found: nowhere/get.{js,ts}" );

   BOOST_TEST_MESSAGE( "GET only contracts reject POST" );
   write_contract( "getonly", "get.js", "export function Get() { return 1; }" );
   r = post( "getonly", json::object() );
   BOOST_REQUIRE_EQUAL( r.status, 500 );
   BOOST_REQUIRE_EQUAL( error_of( r ), "Contract not found: getonly/post.{js,ts}" );

   write_contract( "getonly", "post.js", "export function Get() { return 1; }" );
   r = post( "getonly", json::object() );
   BOOST_REQUIRE_EQUAL( r.status, 500 );
   BOOST_REQUIRE_EQUAL( error_of( r ), "No Get or Post function exported" );

   BOOST_TEST_MESSAGE( "Path traversal" );
   r = get( "../etc" );
   BOOST_REQUIRE_EQUAL( r.status, 500 );

   BOOST_TEST_MESSAGE( "Missing entry point" );
   r = run_get( "function get() { return 1; }" );
   BOOST_REQUIRE_EQUAL( error_of( r ), "No Get or Post function exported" );

   r = run_get( "const Get = 42;" );
   BOOST_REQUIRE_EQUAL( error_of( r ), "No Get or Post function exported" );

   BOOST_TEST_MESSAGE( "Undefined result" );
   r = run_get( "export async function Get() {}" );
   BOOST_REQUIRE_EQUAL( error_of( r ), "No result returned" );

   BOOST_TEST_MESSAGE( "Plain values are wrapped" );
   r = run_get( "export const Get = () => \"plain\";" );
   BOOST_REQUIRE_EQUAL( r.status, 200 );
   BOOST_REQUIRE_EQUAL( r.response[ "body" ], "plain" );

   BOOST_TEST_MESSAGE( "Thrown errors" );
   r = run_get( "export function Get() { throw new Error(\"boom\"); }" );
   BOOST_REQUIRE_EQUAL( r.status, 500 );
   BOOST_REQUIRE( error_of( r ).find( "boom" ) != std::string::npos );

   r = run_get( "export async function Get() { await null; throw new RangeError(\"late boom\"); }" );
   BOOST_REQUIRE_EQUAL( r.status, 500 );
   BOOST_REQUIRE( error_of( r ).find( "late boom" ) != std::string::npos );

   BOOST_TEST_MESSAGE( "Syntax errors" );
   r = run_get( "export function Get( {" );
   BOOST_REQUIRE_EQUAL( r.status, 500 );
   BOOST_REQUIRE( error_of( r ).find( "SyntaxError" ) != std::string::npos );

   BOOST_TEST_MESSAGE( "Unknown modules" );
   r = run_get( "import { x } from 'tana/nope';\nexport function Get() { return x; }" );
   BOOST_REQUIRE_EQUAL( r.status, 500 );
   BOOST_REQUIRE( error_of( r ).find( "unknown tana module: tana/nope" ) != std::string::npos );

   BOOST_TEST_MESSAGE( "Work that never settles" );
   r = run_get( "export function Get() { return new Promise(() => {}); }" );
   BOOST_REQUIRE_EQUAL( r.status, 500 );
   BOOST_REQUIRE_EQUAL( error_of( r ), "contract left unresolved asynchronous work" );

   BOOST_TEST_MESSAGE( "Status codes pass through" );
   r = run_get( "import { Response } from 'tana/net';\nexport function Get() { return Response.json({ missing: true }, 404); }" );
   BOOST_REQUIRE_EQUAL( r.status, 404 );
   BOOST_REQUIRE_EQUAL( r.response[ "headers" ][ "Content-Type" ], "application/json" );
   BOOST_REQUIRE_EQUAL( r.response[ "body" ][ "missing" ], true );
} TANA_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( isolation_test )
{ try {
   BOOST_TEST_MESSAGE( "Globals do not leak between invocations" );
   auto r = run_get( R"js(
export function Get() {
  globalThis.counter = (globalThis.counter || 0) + 1;
  return globalThis.counter;
}
)js" );
   BOOST_REQUIRE_EQUAL( r.response[ "body" ], 1 );

   r = get( "scratch" );
   BOOST_REQUIRE_EQUAL( r.response[ "body" ], 1 );

   BOOST_TEST_MESSAGE( "A contract cannot exhaust the host" );
   r = run_get( "export function Get() { const a = []; for (;;) a.push(new Array(100000).fill(1)); }" );
   BOOST_REQUIRE_EQUAL( r.status, 500 );

   r = run_get( "function f() { return f() + 1; }\nexport function Get() { return f(); }" );
   BOOST_REQUIRE_EQUAL( r.status, 500 );
} TANA_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( data_test )
{ try {
   write_contract( "counter", "get.js", R"js(
import { data } from "tana/data";
export async function Get() {
  return { body: { count: (await data.get("counter")) || 0, keys: await data.keys("counter*"), max: data.MAX_KEYS } };
}
)js" );

   write_contract( "counter", "post.js", R"js(
import { console } from "tana/core";
import { data } from "tana/data";
export async function Post(req, body) {
  const count = ((await data.get("counter")) || 0) + (body.step || 1);
  await data.set("counter", count);
  await data.set("counter:meta", { big: 10n, name: "meta" });
  if (body.fail) throw new Error("rolled back");
  await data.commit();
  console.log("counter is now", count);
  return { status: 200, body: { count, meta: await data.get("counter:meta"), has: await data.has("counter") } };
}
)js" );

   auto r = get( "counter" );
   BOOST_REQUIRE_EQUAL( r.response[ "body" ][ "count" ], 0 );
   BOOST_REQUIRE_EQUAL( r.response[ "body" ][ "max" ], store::max_keys );

   r = post( "counter", json{ { "step", 5 } } );
   BOOST_REQUIRE_EQUAL( r.status, 200 );
   BOOST_REQUIRE_EQUAL( r.response[ "body" ][ "count" ], 5 );
   BOOST_REQUIRE_EQUAL( r.response[ "body" ][ "meta" ][ "big" ], "10" );
   BOOST_REQUIRE_EQUAL( r.response[ "body" ][ "has" ], true );
   BOOST_REQUIRE_EQUAL( r.console.size(), 1 );
   BOOST_REQUIRE_EQUAL( r.console[0].text, "counter is now 5" );

   r = get( "counter" );
   BOOST_REQUIRE_EQUAL( r.response[ "body" ][ "count" ], 5 );
   BOOST_REQUIRE_EQUAL( r.response[ "body" ][ "keys" ], json::array( { "counter", "counter:meta" } ) );
   BOOST_REQUIRE_EQUAL( *svc.store->get( "counter" ), "5" );

   BOOST_TEST_MESSAGE( "Storage errors reach the contract as exceptions" );
   auto big = run_get( R"js(
import { data } from "tana/data";
export async function Get() {
  try { await data.set("k".repeat(300), 1); return "stored"; }
  catch (e) { return e.message; }
}
)js" );
   BOOST_REQUIRE_EQUAL( big.response[ "body" ], "Key too large: 300 bytes (max 256)" );
} TANA_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( fetch_test )
{ try {
   http->respond( "pokeapi.co/api/v2/pokemon/ditto", 200, R"({"name":"ditto","id":132})" );

   write_contract( "pokemon", "get.js", R"js(
import { fetch } from "tana/utils";
export async function Get(req) {
  const res = await fetch("https://pokeapi.co/api/v2/pokemon/" + req.query.name);
  if (!res.ok) return { status: 502, body: { error: "upstream " + res.status } };
  const p = await res.json();
  return { body: { name: p.name, id: p.id } };
}
)js" );

   auto r = get( "pokemon", { { "name", "ditto" } } );
   BOOST_REQUIRE_EQUAL( r.status, 200 );
   BOOST_REQUIRE_EQUAL( r.response[ "body" ][ "name" ], "ditto" );
   BOOST_REQUIRE_EQUAL( r.response[ "body" ][ "id" ], 132 );

   http->respond( "pokeapi.co/api/v2/pokemon/missingno", 404, "Not Found" );
   r = get( "pokemon", { { "name", "missingno" } } );
   BOOST_REQUIRE_EQUAL( r.status, 502 );

   BOOST_TEST_MESSAGE( "Blocked domains reject the fetch promise" );
   r = run_get( R"js(
import { fetch } from "tana/utils";
export async function Get() {
  try { await fetch("https://evil.example.com/"); return "fetched"; }
  catch (e) { return { body: { name: e.name, message: e.message } }; }
}
)js" );
   BOOST_REQUIRE_EQUAL( r.response[ "body" ][ "name" ], "Error" );
   BOOST_REQUIRE( r.response[ "body" ][ "message" ].get< std::string >().find( "not in whitelist" ) != std::string::npos );

   r = run_get( R"js(
import { fetch } from "tana/utils";
export async function Get() {
  try { await fetch("garbage"); return "fetched"; }
  catch (e) { return e instanceof TypeError; }
}
)js" );
   BOOST_REQUIRE_EQUAL( r.response[ "body" ], true );

   BOOST_TEST_MESSAGE( "An unawaited rejection fails the invocation" );
   r = run_get( R"js(
import { fetch } from "tana/utils";
export async function Get() { return await fetch("https://pokeapi.co/nothing-here"); }
)js" );
   BOOST_REQUIRE_EQUAL( r.status, 500 );
   BOOST_REQUIRE( error_of( r ).find( "connection refused" ) != std::string::npos );
} TANA_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( block_test )
{ try {
   auto r = run_get( R"js(
import { block } from "tana/block";
export async function Get() {
  const [alice, users, balances, genesis] = await Promise.all([
    block.getUser("alice"),
    block.getUser(["alice", "carol"]),
    block.getBalance(["user_alice", "user_bob"], "USD"),
    block.getTransaction("tx_genesis"),
  ]);
  let tooMany;
  try { await block.getUser(["1","2","3","4","5","6","7","8","9","10","11"]); }
  catch (e) { tooMany = e.message; }
  let badIds;
  try { await block.getTransaction(7); }
  catch (e) { badIds = e.name + ": " + e.message; }
  return { body: {
    alice, users, balances, genesis, tooMany, badIds,
    executor: block.getExecutor(),
    gasLimit: block.getGasLimit(),
    hash: block.getHash(),
  } };
}
)js" );

   BOOST_REQUIRE_EQUAL( r.status, 200 );
   auto& body = r.response[ "body" ];
   BOOST_REQUIRE_EQUAL( body[ "alice" ][ "id" ], "user_alice" );
   BOOST_REQUIRE_EQUAL( body[ "users" ].size(), 2 );
   BOOST_REQUIRE( body[ "users" ][1].is_null() );
   BOOST_REQUIRE_EQUAL( body[ "balances" ], json::array( { 1000.0, 250.0 } ) );
   BOOST_REQUIRE_EQUAL( body[ "genesis" ][ "amount" ], "50.00000000" );
   BOOST_REQUIRE_EQUAL( body[ "tooMany" ], "Cannot query more than 10 users at once" );
   BOOST_REQUIRE_EQUAL( body[ "badIds" ], "TypeError: Invalid tx_ids" );
   BOOST_REQUIRE_EQUAL( body[ "executor" ], runtime::constants::default_executor );
   BOOST_REQUIRE_EQUAL( body[ "gasLimit" ], ledger::gas_limit );
   BOOST_REQUIRE_EQUAL( body[ "hash" ], "0x3039" );
} TANA_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( tx_test )
{ try {
   write_contract( "transfer", "post.js", R"js(
import { tx } from "tana/tx";
import { Response } from "tana/net";
export function Post(req, body) {
  try { tx.transfer(body.from, body.to, body.amount, "USD"); }
  catch (e) { return Response.json({ error: e.message }, 400); }
  const staged = tx.getChanges();
  const receipt = tx.execute();
  return Response.json({ staged: staged.length, receipt }, receipt.success ? 200 : 409);
}
)js" );

   auto r = post( "transfer", json{ { "from", "alice" }, { "to", "bob" }, { "amount", 10 } } );
   BOOST_REQUIRE_EQUAL( r.status, 200 );
   BOOST_REQUIRE_EQUAL( r.response[ "body" ][ "staged" ], 1 );
   BOOST_REQUIRE_EQUAL( r.response[ "body" ][ "receipt" ][ "gasUsed" ], ledger::gas_cost_per_change );
   BOOST_REQUIRE_EQUAL( r.response[ "body" ][ "receipt" ][ "changes" ][0][ "to" ], "bob" );

   r = post( "transfer", json{ { "from", "alice" }, { "to", "alice" }, { "amount", 10 } } );
   BOOST_REQUIRE_EQUAL( r.status, 400 );
   BOOST_REQUIRE_EQUAL( r.response[ "body" ][ "error" ], "Cannot transfer to self" );

   r = post( "transfer", json{ { "from", "alice" }, { "to", "bob" }, { "amount", "ten" } } );
   BOOST_REQUIRE_EQUAL( r.status, 400 );
   BOOST_REQUIRE_EQUAL( r.response[ "body" ][ "error" ], "Argument 3 must be a number" );

   BOOST_TEST_MESSAGE( "Gas used is visible to later invocations" );
   r = run_get( "import { block } from 'tana/block';\nexport function Get() { return block.getGasUsed(); }" );
   BOOST_REQUIRE_EQUAL( r.response[ "body" ], ledger::gas_cost_per_change );
} TANA_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( typescript_test )
{ try {
   write_contract( "greeter", "get.ts", R"ts(
import { Response } from "tana/net";
export function Get(req) {
  const name: string = req.query.name || "world";
  return Response.json({ greeting: "hello " + name });
}
)ts" );

   BOOST_TEST_MESSAGE( "TypeScript without a compiler" );
   auto r = get( "greeter" );
   BOOST_REQUIRE_EQUAL( r.status, 500 );
   BOOST_REQUIRE_EQUAL( error_of( r ), "No TypeScript compiler configured for greeter/get.ts" );

   BOOST_TEST_MESSAGE( "A compiler script that does not exist" );
   auto backend = vm_manager::get_vm_backend();
   auto missing = std::make_shared< runtime::typescript_compiler >( backend, contracts_root / "missing.js", 4 );
   dispatcher = make_dispatcher( missing );
   r = get( "greeter" );
   BOOST_REQUIRE_EQUAL( r.status, 500 );
   BOOST_REQUIRE( error_of( r ).find( "TypeScript compiler not found" ) != std::string::npos );

   {
      std::ofstream out( contracts_root / "typescript.js" );
      out << fake_typescript;
   }

   auto compiler = std::make_shared< runtime::typescript_compiler >( backend, contracts_root / "typescript.js", 4 );
   dispatcher = make_dispatcher( compiler );

   r = get( "greeter", { { "name", "tana" } } );
   BOOST_REQUIRE_EQUAL( r.status, 200 );
   BOOST_REQUIRE_EQUAL( r.response[ "body" ][ "greeting" ], "hello tana" );

   BOOST_TEST_MESSAGE( "JavaScript wins over TypeScript" );
   write_contract( "greeter", "get.js", "export function Get() { return 'js'; }" );
   r = get( "greeter" );
   BOOST_REQUIRE_EQUAL( r.response[ "body" ], "js" );

   BOOST_TEST_MESSAGE( "Compiled output is cached by source digest" );
   auto out1 = compiler->compile( "a.ts", "const x: number = 1; x" );
   auto out2 = compiler->compile( "b.ts", "const x: number = 1; x" );
   BOOST_REQUIRE_EQUAL( out1, "const x = 1; x" );
   BOOST_REQUIRE_EQUAL( out1, out2 );

   BOOST_REQUIRE_EQUAL( runtime::source_digest( "" ), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855" );
} TANA_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_CASE( compile_cache_test )
{ try {
   runtime::compile_cache cache( 2 );
   cache.put( "a", "1" );
   cache.put( "b", "2" );
   BOOST_REQUIRE_EQUAL( *cache.get( "a" ), "1" );

   cache.put( "c", "3" );
   BOOST_REQUIRE( !cache.get( "b" ) );
   BOOST_REQUIRE_EQUAL( *cache.get( "a" ), "1" );
   BOOST_REQUIRE_EQUAL( *cache.get( "c" ), "3" );
} TANA_CATCH_LOG_AND_RETHROW(info) }

BOOST_AUTO_TEST_SUITE_END()
