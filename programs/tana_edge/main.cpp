#include <algorithm>
#include <atomic>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <boost/algorithm/string.hpp>
#include <boost/asio.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/program_options.hpp>

#include <yaml-cpp/yaml.h>

#include <tana/edge/contract_handler.hpp>
#include <tana/exception.hpp>
#include <tana/log.hpp>
#include <tana/net/egress_gateway.hpp>
#include <tana/net/transport/http/client.hpp>
#include <tana/net/transport/http/router.hpp>
#include <tana/net/transport/http/server.hpp>
#include <tana/runtime/chain_data.hpp>
#include <tana/runtime/compiler.hpp>
#include <tana/runtime/constants.hpp>
#include <tana/runtime/dispatcher.hpp>
#include <tana/util/options.hpp>
#include <tana/vm_manager/vm_backend.hpp>

#define HELP_OPTION             "help"
#define VERSION_OPTION          "version"
#define BASEDIR_OPTION          "basedir"
#define BASEDIR_DEFAULT         "."
#define LISTEN_OPTION           "listen"
#define LISTEN_DEFAULT          "127.0.0.1"
#define PORT_OPTION             "port"
#define PORT_DEFAULT            8180
#define JOBS_OPTION             "jobs"
#define CONTRACTS_DIR_OPTION    "contracts-dir"
#define CONTRACTS_DIR_DEFAULT   "contracts"
#define TYPESCRIPT_OPTION       "typescript"
#define TYPESCRIPT_DEFAULT      "typescript.js"
#define ALLOWED_DOMAINS_OPTION  "allowed-domains"
#define LEDGER_URL_OPTION       "ledger-url"
#define EXECUTOR_OPTION         "executor"
#define MEMORY_LIMIT_OPTION     "memory-limit"
#define STACK_SIZE_OPTION       "stack-size"
#define FETCH_TIMEOUT_OPTION    "fetch-timeout"
#define FETCH_TIMEOUT_DEFAULT   30'000
#define LOG_LEVEL_OPTION        "log-level"
#define LOG_LEVEL_DEFAULT       "info"
#define LOG_DIR_OPTION          "log-dir"
#define LOG_COLOR_OPTION        "log-color"
#define LOG_COLOR_DEFAULT       true

#define EDGE_SERVICE            "edge"

TANA_DECLARE_DERIVED_EXCEPTION( service_exception, tana::setup_exception );
TANA_DECLARE_DERIVED_EXCEPTION( invalid_argument, service_exception );

using namespace boost;
using namespace tana;

const std::string& version_string();
void splash();

int main( int argc, char** argv )
{
   std::atomic< bool > stopped = false;
   int retcode = EXIT_SUCCESS;

   try
   {
      program_options::options_description options;
      options.add_options()
         (HELP_OPTION            ",h", "Print this help message and exit")
         (VERSION_OPTION         ",v", "Print version string and exit")
         (BASEDIR_OPTION         ",d", program_options::value< std::string >()->default_value( BASEDIR_DEFAULT ), "Base directory for the config file and relative paths")
         (LISTEN_OPTION              , program_options::value< std::string >(), "The address to listen on")
         (PORT_OPTION            ",p", program_options::value< uint16_t >(), "The port to listen on")
         (JOBS_OPTION            ",j", program_options::value< uint64_t >(), "The number of worker jobs")
         (CONTRACTS_DIR_OPTION   ",c", program_options::value< std::string >(), "The contracts root directory")
         (TYPESCRIPT_OPTION          , program_options::value< std::string >(), "The TypeScript compiler script used for .ts contracts")
         (ALLOWED_DOMAINS_OPTION     , program_options::value< std::vector< std::string > >()->multitoken(), "Domains contracts may fetch from")
         (LEDGER_URL_OPTION          , program_options::value< std::string >(), "HTTP ledger answering block queries, mock data when empty")
         (EXECUTOR_OPTION            , program_options::value< std::string >(), "The executor reported to contracts")
         (MEMORY_LIMIT_OPTION        , program_options::value< uint64_t >(), "Heap limit of each isolate in bytes")
         (STACK_SIZE_OPTION          , program_options::value< uint64_t >(), "Stack limit of each isolate in bytes")
         (FETCH_TIMEOUT_OPTION       , program_options::value< uint64_t >(), "Outbound HTTP timeout in milliseconds")
         (LOG_LEVEL_OPTION       ",l", program_options::value< std::string >(), "The log filtering level")
         (LOG_DIR_OPTION             , program_options::value< std::string >(), "The directory for rotating log files")
         (LOG_COLOR_OPTION           , program_options::value< bool >(), "Log color toggle");

      program_options::variables_map args;
      program_options::store( program_options::parse_command_line( argc, argv, options ), args );

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

      splash();

      auto basedir = std::filesystem::path( args[ BASEDIR_OPTION ].as< std::string >() );
      if ( basedir.is_relative() )
         basedir = std::filesystem::current_path() / basedir;

      YAML::Node config;
      YAML::Node global_config;
      YAML::Node edge_config;

      auto yaml_config = basedir / "config.yml";
      if ( !std::filesystem::exists( yaml_config ) )
      {
         yaml_config = basedir / "config.yaml";
      }

      if ( std::filesystem::exists( yaml_config ) )
      {
         config = YAML::LoadFile( yaml_config );
         global_config = config[ "global" ];
         edge_config = config[ EDGE_SERVICE ];
      }

      uint64_t jobs_default = std::max( uint64_t( std::thread::hardware_concurrency() ), uint64_t( 2 ) );

      auto listen          = util::get_option< std::string >( LISTEN_OPTION, LISTEN_DEFAULT, args, edge_config, global_config );
      auto port            = util::get_option< uint16_t >( PORT_OPTION, PORT_DEFAULT, args, edge_config, global_config );
      auto jobs            = util::get_option< uint64_t >( JOBS_OPTION, jobs_default, args, edge_config, global_config );
      auto contracts_dir   = std::filesystem::path( util::get_option< std::string >( CONTRACTS_DIR_OPTION, CONTRACTS_DIR_DEFAULT, args, edge_config, global_config ) );
      auto typescript      = std::filesystem::path( util::get_option< std::string >( TYPESCRIPT_OPTION, TYPESCRIPT_DEFAULT, args, edge_config, global_config ) );
      auto allowed_domains = util::get_options< std::string >( ALLOWED_DOMAINS_OPTION, net::default_allowed_domains(), args, edge_config, global_config );
      auto ledger_url      = util::get_option< std::string >( LEDGER_URL_OPTION, "", args, edge_config, global_config );
      auto executor        = util::get_option< std::string >( EXECUTOR_OPTION, runtime::constants::default_executor, args, edge_config, global_config );
      auto memory_limit    = util::get_option< uint64_t >( MEMORY_LIMIT_OPTION, vm_manager::default_memory_limit, args, edge_config, global_config );
      auto stack_size      = util::get_option< uint64_t >( STACK_SIZE_OPTION, vm_manager::default_stack_size, args, edge_config, global_config );
      auto fetch_timeout   = util::get_option< uint64_t >( FETCH_TIMEOUT_OPTION, FETCH_TIMEOUT_DEFAULT, args, edge_config, global_config );
      auto log_level       = util::get_option< std::string >( LOG_LEVEL_OPTION, LOG_LEVEL_DEFAULT, args, edge_config, global_config );
      auto log_dir         = util::get_option< std::string >( LOG_DIR_OPTION, "", args, edge_config, global_config );
      auto log_color       = util::get_option< bool >( LOG_COLOR_OPTION, LOG_COLOR_DEFAULT, args, edge_config, global_config );

      std::optional< std::filesystem::path > logdir_path;
      if ( !log_dir.empty() )
      {
         logdir_path = std::filesystem::path( log_dir );
         if ( logdir_path->is_relative() )
            logdir_path = basedir / *logdir_path;
      }

      tana::initialize_logging( EDGE_SERVICE, log_level, logdir_path, log_color );

      TANA_ASSERT( jobs > 0, invalid_argument, "jobs must be greater than 0" );
      TANA_ASSERT( memory_limit > 0, invalid_argument, "memory-limit must be greater than 0" );
      TANA_ASSERT( stack_size > 0, invalid_argument, "stack-size must be greater than 0" );

      if ( config.IsNull() )
      {
         LOG(warning) << "Could not find config (config.yml or config.yaml expected). Using default values";
      }

      if ( contracts_dir.is_relative() )
         contracts_dir = basedir / contracts_dir;

      if ( typescript.is_relative() )
         typescript = basedir / typescript;

      if ( !std::filesystem::exists( contracts_dir ) )
         LOG(warning) << "Contracts directory " << contracts_dir.string() << " does not exist";

      LOG(info) << "Contracts directory: " << contracts_dir.string();
      LOG(info) << "Allowed domains: " << boost::algorithm::join( allowed_domains, ", " );
      LOG(info) << "Number of jobs: " << jobs;

      auto http_client = std::make_shared< net::transport::http::client >( std::chrono::milliseconds( fetch_timeout ) );

      runtime::services svc;
      svc.store      = std::make_shared< store::staged_store >();
      svc.meter      = std::make_shared< ledger::gas_meter >();
      svc.ledger     = std::make_shared< ledger::transaction_ledger >( *svc.meter );
      svc.gateway    = std::make_shared< net::egress_gateway >( http_client, allowed_domains );

      if ( ledger_url.empty() )
      {
         LOG(info) << "Serving block queries from mock data";
         svc.chain_data = std::make_shared< runtime::mock_chain_data >();
      }
      else
      {
         LOG(info) << "Serving block queries from ledger at " << ledger_url;
         svc.chain_data = std::make_shared< runtime::ledger_chain_data >( http_client, ledger_url );
      }

      auto backend = vm_manager::get_vm_backend();
      TANA_ASSERT( backend, service_exception, "could not get vm backend" );
      backend->initialize();
      LOG(info) << "Initialized " << backend->backend_name() << " VM backend";

      auto compiler = std::make_shared< runtime::typescript_compiler >( backend, typescript, runtime::constants::compiler_cache_size );

      runtime::dispatcher_config dcfg;
      dcfg.contracts_root      = contracts_dir;
      dcfg.executor            = executor;
      dcfg.limits.memory_limit = memory_limit;
      dcfg.limits.stack_size   = stack_size;

      auto dispatcher = std::make_shared< runtime::dispatcher >( svc, backend, compiler, dcfg );

      auto http_router = std::make_shared< net::transport::http::router >();
      http_router->handler = std::make_shared< edge::contract_handler >( dispatcher );

      asio::io_context server_ioc, main_ioc;

      auto address = asio::ip::make_address( listen );
      auto http_server = std::make_shared< net::transport::http::server >( server_ioc, asio::ip::tcp::endpoint{ address, port }, http_router );
      http_server->run();

      LOG(info) << "Listening on http://" << http_server->local_endpoint();

      asio::signal_set signals( main_ioc );
      signals.add( SIGINT );
      signals.add( SIGTERM );
#if defined( SIGQUIT )
      signals.add( SIGQUIT );
#endif

      signals.async_wait( [&]( const system::error_code& err, int num )
      {
         LOG(info) << "Caught signal, shutting down...";
         stopped = true;
         main_ioc.stop();
         server_ioc.stop();
      } );

      std::vector< std::thread > server_threads;
      for ( std::size_t i = 0; i < jobs; i++ )
         server_threads.emplace_back( [&]() { server_ioc.run(); } );

      main_ioc.run();

      for ( auto& t : server_threads )
         t.join();
   }
   catch ( const invalid_argument& e )
   {
      LOG(error) << "Invalid argument: " << e.what();
      retcode = EXIT_FAILURE;
   }
   catch ( const tana::exception& e )
   {
      if ( !stopped )
      {
         LOG(fatal) << "An unexpected error has occurred: " << e.what();
         retcode = EXIT_FAILURE;
      }
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

   LOG(info) << "Shut down gracefully";

   return retcode;
}

const std::string& version_string()
{
   static std::string v_str = "Tana edge v" TANA_VERSION;
   return v_str;
}

void splash()
{
   const char* banner = R"BANNER(
  _
 | |_ __ _ _ __   __ _
 | __/ _` | '_ \ / _` |
 | || (_| | | | | (_| |
  \__\__,_|_| |_|\__,_|)BANNER";

   std::cout.write( banner, std::strlen( banner ) );
   std::cout << std::endl;
   const char* launch_message = "          ...launching edge";
   std::cout.write( launch_message, std::strlen( launch_message ) );
   std::cout << std::endl << std::flush;
}
