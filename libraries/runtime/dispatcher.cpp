#include <tana/runtime/bootstrap.hpp>
#include <tana/runtime/constants.hpp>
#include <tana/runtime/dispatcher.hpp>
#include <tana/runtime/exceptions.hpp>
#include <tana/runtime/host_api.hpp>
#include <tana/runtime/import_rewriter.hpp>

#include <tana/exception.hpp>
#include <tana/log.hpp>

#include <boost/algorithm/string.hpp>

#include <fstream>
#include <new>
#include <sstream>

namespace tana::runtime {

namespace detail {

nlohmann::json request_object( const invocation& inv )
{
   return nlohmann::json{
      { "path",    inv.path },
      { "method",  inv.method },
      { "query",   inv.query },
      { "headers", inv.headers },
      { "params",  inv.params },
      { "ip",      inv.ip }
   };
}

} // detail

void validate_contract_id( const std::string& contract_id )
{
   TANA_ASSERT( !contract_id.empty(), invalid_contract_id, "Invalid contract id: empty" );
   TANA_ASSERT(
      contract_id.find_first_of( std::string( "/\\\0", 3 ) ) == std::string::npos &&
      contract_id.find( ".." ) == std::string::npos &&
      contract_id != ".",
      invalid_contract_id, "Invalid contract id: ${id}", ("id", contract_id) );
}

std::string entry_point( const std::string& method )
{
   if ( method == "GET" )
      return constants::get_entry_point;
   if ( method == "POST" )
      return constants::post_entry_point;

   TANA_THROW( invalid_method, "Unsupported method: ${method}", ("method", method) );
}

nlohmann::json error_response( const std::string& message, unsigned status )
{
   return nlohmann::json{ { "status", status }, { "body", { { "error", message } } } };
}

nlohmann::json make_response( const std::optional< nlohmann::json >& raw )
{
   if ( !raw )
      return error_response( "No Get or Post function exported" );

   if ( raw->is_null() )
      return error_response( "No result returned" );

   if ( !raw->is_object() )
      return nlohmann::json{ { "status", 200 }, { "body", *raw } };

   nlohmann::json response;

   auto status = raw->find( "status" );
   if ( status != raw->end() && ( status->is_number_integer() || status->is_number_unsigned() ) )
      response[ "status" ] = *status;
   else
      response[ "status" ] = 200;

   auto body = raw->find( "body" );
   response[ "body" ] = body != raw->end() ? *body : nlohmann::json();

   auto headers = raw->find( "headers" );
   if ( headers != raw->end() && headers->is_object() )
      response[ "headers" ] = *headers;

   return response;
}

unsigned response_status( const nlohmann::json& response )
{
   auto status = response.find( "status" );
   if ( status == response.end() )
      return 200;

   if ( status->is_number_unsigned() )
      return status->get< unsigned >();

   if ( status->is_number_integer() )
   {
      auto s = status->get< int64_t >();
      return s < 0 ? 0 : unsigned( s );
   }

   return 200;
}

dispatcher::dispatcher(
   services svc,
   std::shared_ptr< vm_manager::vm_backend > backend,
   std::shared_ptr< abstract_compiler > compiler,
   dispatcher_config config ) :
   _services( std::move( svc ) ),
   _backend( backend ),
   _compiler( compiler ),
   _config( std::move( config ) )
{
   TANA_ASSERT( _backend, setup_exception, "no vm backend" );
   TANA_ASSERT( _services.store && _services.meter && _services.ledger && _services.gateway && _services.chain_data,
      setup_exception, "incomplete runtime services" );

   if ( _config.executor.empty() )
      _config.executor = constants::default_executor;
}

dispatcher::~dispatcher() {}

const services& dispatcher::get_services() const
{
   return _services;
}

contract_source dispatcher::load_contract( const std::string& contract_id, const std::string& method ) const
{
   validate_contract_id( contract_id );
   entry_point( method );

   auto stem = boost::algorithm::to_lower_copy( method );
   auto dir = _config.contracts_root / contract_id;

   contract_source src;
   auto path = dir / ( stem + ".js" );

   if ( !std::filesystem::exists( path ) )
   {
      path = dir / ( stem + ".ts" );
      src.typescript = true;

      TANA_ASSERT( std::filesystem::exists( path ), contract_not_found, "Contract not found: ${id}/${file}.{js,ts}",
         ("id", contract_id)("file", stem) );
   }

   std::ifstream in( path, std::ios::binary );
   TANA_ASSERT( in, contract_read_failed, "Failed to read contract: ${path}", ("path", path.string()) );

   std::stringstream ss;
   ss << in.rdbuf();
   TANA_ASSERT( !in.bad(), contract_read_failed, "Failed to read contract: ${path}", ("path", path.string()) );

   src.name = contract_id + "/" + path.filename().string();
   src.source = ss.str();

   return src;
}

invocation_result dispatcher::execute( const invocation& inv ) const
{
   contract_source src;

   try
   {
      src = load_contract( inv.contract_id, inv.method );
   }
   catch ( const tana::exception& e )
   {
      LOG(warning) << "Could not load contract " << inv.contract_id << ": " << e.get_message();

      invocation_result result;
      result.response = error_response( e.get_message() );
      result.status = response_status( result.response );
      return result;
   }

   return execute_source( src, inv );
}

invocation_result dispatcher::execute_source( const contract_source& src, const invocation& inv ) const
{
   execution_context ctx( _services, make_block_context( inv.contract_id, _config.executor, *_services.meter ) );

   invocation_result result;

   try
   {
      result.response = run( src, inv, ctx );
   }
   catch ( const tana::exception& e )
   {
      LOG(warning) << "Contract " << inv.contract_id << " failed: " << boost::diagnostic_information( e );
      result.response = error_response( e.get_message() );
   }
   catch ( const std::bad_alloc& )
   {
      throw;
   }
   catch ( const std::exception& e )
   {
      LOG(error) << "Contract " << inv.contract_id << " raised an unexpected error: " << e.what();
      result.response = error_response( e.what() );
   }

   result.status = response_status( result.response );
   result.console = ctx.console();

   return result;
}

nlohmann::json dispatcher::run( const contract_source& src, const invocation& inv, execution_context& ctx ) const
{
   auto entry = entry_point( inv.method );

   auto source = rewrite_imports( src.source );

   if ( src.typescript )
   {
      TANA_ASSERT( _compiler, compiler_unavailable, "No TypeScript compiler configured for ${name}", ("name", src.name) );
      source = _compiler->compile( src.name, source );
   }

   vm_manager::program prog;
   prog.bootstrap = vm_manager::script{ "tana-bootstrap.js", bootstrap_script() };
   prog.contract = vm_manager::script{ src.name, std::move( source ) };
   prog.entry_point = entry;
   prog.arguments.push_back( detail::request_object( inv ) );

   if ( entry == constants::post_entry_point )
      prog.arguments.push_back( inv.body ? *inv.body : nlohmann::json() );

   host_api hapi( ctx );
   vm_manager::context vctx( hapi, _config.limits );

   LOG(debug) << "Invoking " << entry << " of " << src.name;

   return make_response( _backend->run( vctx, prog ) );
}

} // tana::runtime
