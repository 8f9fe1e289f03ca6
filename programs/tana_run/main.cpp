#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include <boost/algorithm/string.hpp>
#include <boost/program_options.hpp>

#include <tana/exception.hpp>
#include <tana/log.hpp>
#include <tana/net/egress_gateway.hpp>
#include <tana/net/transport/http/client.hpp>
#include <tana/runtime/chain_data.hpp>
#include <tana/runtime/compiler.hpp>
#include <tana/runtime/constants.hpp>
#include <tana/runtime/dispatcher.hpp>
#include <tana/runtime/exceptions.hpp>
#include <tana/vm_manager/vm_backend.hpp>

#define HELP_OPTION            "help"
#define VERSION_OPTION         "version"
#define CONTRACT_OPTION        "contract"
#define METHOD_OPTION          "method"
#define METHOD_DEFAULT         "GET"
#define BODY_OPTION            "body"
#define TYPESCRIPT_OPTION      "typescript"
#define TYPESCRIPT_DEFAULT     "typescript.js"
#define ALLOWED_DOMAINS_OPTION "allowed-domains"
#define LEDGER_URL_OPTION      "ledger-url"
#define EXECUTOR_OPTION        "executor"
#define LOG_LEVEL_OPTION       "log-level"
#define LOG_LEVEL_DEFAULT      "warning"

TANA_DECLARE_DERIVED_EXCEPTION( invalid_argument, tana::setup_exception );

using namespace boost;
using namespace tana;

const std::string& version_string();

int main( int argc, char** argv )
{
   int retcode = EXIT_SUCCESS;

   try
   {
      program_options::options_description options;
      options.add_options()
         (HELP_OPTION           ",h", "Print this help message and exit")
         (VERSION_OPTION        ",v", "Print version string and exit")
         (CONTRACT_OPTION       ",c", program_options::value< std::string >(), "The contract file to run")
         (METHOD_OPTION         ",m", program_options::value< std::string >()->default_value( METHOD_DEFAULT ), "The entry point to call, GET or POST")
         (BODY_OPTION           ",b", program_options::value< std::string >(), "JSON body passed to Post")
         (TYPESCRIPT_OPTION         , program_options::value< std::string >()->default_value( TYPESCRIPT_DEFAULT ), "The TypeScript compiler script used for .ts contracts")
         (ALLOWED_DOMAINS_OPTION    , program_options::value< std::vector< std::string > >()->multitoken(), "Domains the contract may fetch from")
         (LEDGER_URL_OPTION         , program_options::value< std::string >(), "HTTP ledger answering block queries")
         (EXECUTOR_OPTION           , program_options::value< std::string >()->default_value( runtime::constants::default_executor ), "The executor reported to the contract")
         (LOG_LEVEL_OPTION      ",l", program_options::value< std::string >()->default_value( LOG_LEVEL_DEFAULT ), "The log filtering level");

      program_options::positional_options_description positional;
      positional.add( CONTRACT_OPTION, 1 );

      program_options::variables_map args;
      program_options::store( program_options::command_line_parser( argc, argv ).options( options ).positional( positional ).run(), args );

      if ( args.count( HELP_OPTION ) )
      {
         std::cout << options << std::endl;
         return EXIT_SUCCESS;
      }

      if ( args.count( VERSION_OPTION ) )
      {
         const auto& v_str = version_string();
         std::cout.write( v_str.c_str(), v_str.size() );
         std::cout << std::endl;
         return EXIT_SUCCESS;
      }

      tana::initialize_logging( "tana_run", args[ LOG_LEVEL_OPTION ].as< std::string >() );

      TANA_ASSERT( args.count( CONTRACT_OPTION ), invalid_argument, "a contract file is required" );

      auto contract_file = std::filesystem::path( args[ CONTRACT_OPTION ].as< std::string >() );
      auto method = boost::algorithm::to_upper_copy( args[ METHOD_OPTION ].as< std::string >() );

      TANA_ASSERT( method == "GET" || method == "POST", invalid_argument, "method must be GET or POST" );

      runtime::invocation inv;
      inv.method = method;

      // The contract directory names the contract
      inv.contract_id = contract_file.has_parent_path() ? std::filesystem::absolute( contract_file ).parent_path().filename().string() : "local";
      if ( inv.contract_id.empty() )
         inv.contract_id = "local";

      if ( args.count( BODY_OPTION ) )
      {
         try
         {
            inv.body = nlohmann::json::parse( args[ BODY_OPTION ].as< std::string >() );
         }
         catch ( const nlohmann::json::parse_error& e )
         {
            TANA_THROW( invalid_argument, "body is not valid JSON: ${what}", ("what", e.what()) );
         }
      }
      else if ( method == "POST" )
      {
         inv.body = nlohmann::json::object();
      }

      std::ifstream in( contract_file, std::ios::binary );
      TANA_ASSERT( in, runtime::contract_not_found, "Contract not found: ${path}", ("path", contract_file.string()) );

      std::stringstream ss;
      ss << in.rdbuf();

      runtime::contract_source src;
      src.name = contract_file.filename().string();
      src.source = ss.str();
      src.typescript = contract_file.extension() == ".ts";

      auto allowed_domains = net::default_allowed_domains();
      if ( args.count( ALLOWED_DOMAINS_OPTION ) )
         allowed_domains = args[ ALLOWED_DOMAINS_OPTION ].as< std::vector< std::string > >();

      auto http_client = std::make_shared< net::transport::http::client >();

      runtime::services svc;
      svc.store   = std::make_shared< store::staged_store >();
      svc.meter   = std::make_shared< ledger::gas_meter >();
      svc.ledger  = std::make_shared< ledger::transaction_ledger >( *svc.meter );
      svc.gateway = std::make_shared< net::egress_gateway >( http_client, allowed_domains );

      if ( args.count( LEDGER_URL_OPTION ) && !args[ LEDGER_URL_OPTION ].as< std::string >().empty() )
         svc.chain_data = std::make_shared< runtime::ledger_chain_data >( http_client, args[ LEDGER_URL_OPTION ].as< std::string >() );
      else
         svc.chain_data = std::make_shared< runtime::mock_chain_data >();

      auto backend = vm_manager::get_vm_backend();
      TANA_ASSERT( backend, invalid_argument, "could not get vm backend" );
      backend->initialize();

      auto compiler = std::make_shared< runtime::typescript_compiler >(
         backend,
         std::filesystem::path( args[ TYPESCRIPT_OPTION ].as< std::string >() ),
         runtime::constants::compiler_cache_size );

      runtime::dispatcher_config dcfg;
      dcfg.contracts_root = contract_file.parent_path();
      dcfg.executor = args[ EXECUTOR_OPTION ].as< std::string >();

      runtime::dispatcher dispatcher( svc, backend, compiler, dcfg );

      auto result = dispatcher.execute_source( src, inv );

      for ( const auto& line : result.console )
      {
         if ( line.stream == runtime::console_stream::err )
            std::cerr << line.text << std::endl;
         else
            std::cout << line.text << std::endl;
      }

      std::cout << result.response.dump( 2, ' ', false, nlohmann::json::error_handler_t::replace ) << std::endl;

      if ( result.status >= 500 )
         retcode = EXIT_FAILURE;
   }
   catch ( const invalid_argument& e )
   {
      LOG(error) << "Invalid argument: " << e.what();
      retcode = EXIT_FAILURE;
   }
   catch ( const tana::exception& e )
   {
      LOG(fatal) << "An unexpected error has occurred: " << e.what();
      retcode = EXIT_FAILURE;
   }
   catch ( const boost::exception& e )
   {
      LOG(fatal) << "An unexpected error has occurred: " << boost::diagnostic_information( e );
      retcode = EXIT_FAILURE;
   }
   catch ( const std::exception& e )
   {
      LOG(fatal) << "An unexpected error has occurred: " << e.what();
      retcode = EXIT_FAILURE;
   }

   return retcode;
}

const std::string& version_string()
{
   static std::string v_str = "Tana run v" TANA_VERSION;
   return v_str;
}
