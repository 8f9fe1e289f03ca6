#pragma once

#include <tana/runtime/compiler.hpp>
#include <tana/runtime/execution_context.hpp>

#include <tana/vm_manager/context.hpp>
#include <tana/vm_manager/vm_backend.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tana::runtime {

/**
 * An incoming request for a contract entry point.
 */
struct invocation
{
   std::string                          contract_id;
   std::string                          method = "GET";
   std::string                          path = "/";
   std::map< std::string, std::string > query;
   std::map< std::string, std::string > headers;
   std::map< std::string, std::string > params;
   std::string                          ip = "127.0.0.1";
   std::optional< nlohmann::json >      body;
};

struct invocation_result
{
   unsigned                    status = 200;
   nlohmann::json              response;
   std::vector< console_line > console;
};

struct contract_source
{
   std::string name;
   std::string source;
   bool        typescript = false;
};

struct dispatcher_config
{
   std::filesystem::path      contracts_root = "contracts";
   std::string                executor;
   vm_manager::isolate_limits limits;
};

/**
 * Runs contract entry points, one fresh isolate per invocation.
 *
 * Every failure is folded into a `{status: 500, body: {error}}` result. The
 * shared services are only ever touched through capabilities.
 */
class dispatcher
{
   public:
      dispatcher(
         services svc,
         std::shared_ptr< vm_manager::vm_backend > backend,
         std::shared_ptr< abstract_compiler > compiler,
         dispatcher_config config );
      ~dispatcher();

      invocation_result execute( const invocation& inv ) const;
      invocation_result execute_source( const contract_source& src, const invocation& inv ) const;

      /**
       * Locates `{root}/{id}/{get|post}.{js|ts}`, preferring JavaScript.
       */
      contract_source load_contract( const std::string& contract_id, const std::string& method ) const;

      const services& get_services() const;

   private:
      nlohmann::json run( const contract_source& src, const invocation& inv, execution_context& ctx ) const;

      services                                  _services;
      std::shared_ptr< vm_manager::vm_backend > _backend;
      std::shared_ptr< abstract_compiler >      _compiler;
      dispatcher_config                         _config;
};

void validate_contract_id( const std::string& contract_id );

/**
 * Maps GET and POST to the `Get` and `Post` entry points.
 */
std::string entry_point( const std::string& method );

nlohmann::json error_response( const std::string& message, unsigned status = 500 );

/**
 * Normalizes the value a contract returned into `{status, body, headers?}`.
 */
nlohmann::json make_response( const std::optional< nlohmann::json >& raw );

unsigned response_status( const nlohmann::json& response );

} // tana::runtime
