#pragma once

#include <tana/vm_manager/context.hpp>

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tana::vm_manager {

struct script
{
   std::string name;
   std::string source;
};

/**
 * A unit of work for one isolate. The bootstrap runs with the host object
 * `__tanaCore` in scope and must remove it. The contract is then evaluated in
 * global scope and the entry point is called with the arguments.
 */
struct program
{
   script                    bootstrap;
   script                    contract;
   std::string               entry_point;
   std::vector< nlohmann::json > arguments;
};

/**
 * Abstract class for script virtual machines.
 *
 * To add a new VM, you need to implement this class
 * and return it in get_vm_backends().
 */
class vm_backend
{
   public:
      vm_backend();
      virtual ~vm_backend();

      virtual std::string backend_name() = 0;

      /**
       * Initialize the backend.  Should only be called once.
       */
      virtual void initialize() = 0;

      /**
       * Run a program in a fresh isolate, draining all guest and host work.
       *
       * Returns the settled value of the entry point as JSON (null for undefined),
       * or an empty optional when the contract does not define the entry point.
       */
      virtual std::optional< nlohmann::json > run( context& ctx, const program& p ) = 0;

      /**
       * Evaluate scripts in order in a fresh isolate with no host capabilities and
       * return the completion value of the last one as a string.
       */
      virtual std::string evaluate( const std::vector< script >& scripts, const isolate_limits& limits = isolate_limits() ) = 0;
};

/**
 * Get a list of available VM backends.
 */
std::vector< std::shared_ptr< vm_backend > > get_vm_backends();

std::string get_default_vm_backend_name();

/**
 * Get a shared_ptr to the named VM backend.
 */
std::shared_ptr< vm_backend > get_vm_backend( const std::string& name = get_default_vm_backend_name() );

} // tana::vm_manager
