#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace tana::vm_manager {

enum class call_convention
{
   sync,
   async
};

struct capability_descriptor
{
   uint32_t        id;
   std::string     name;
   call_convention convention;
};

struct guest_error
{
   std::string name = "Error";
   std::string message;
};

/**
 * The outcome of a host call. An empty value with no error is `undefined`.
 */
struct call_result
{
   std::optional< nlohmann::json > value;
   std::optional< guest_error >     error;
};

using completion_handler = std::function< void( const call_result& ) >;

/**
 * An abstract class representing an implementation of an API.
 *
 * The user of the vm_manager library is responsible for creating an application-specific subclass.
 * Calls never throw; failures are reported in the call_result so the backend can raise them in
 * guest code.
 */
class abstract_host_api
{
   public:
      abstract_host_api();
      virtual ~abstract_host_api();

      virtual std::vector< capability_descriptor > capabilities() const = 0;

      virtual call_result invoke( uint32_t id, const nlohmann::json& args ) = 0;

      /**
       * Queue an asynchronous call. The handler runs from run_pending_task().
       */
      virtual void schedule( uint32_t id, nlohmann::json args, completion_handler done ) = 0;

      /**
       * Run the oldest queued call. Returns false when the queue is empty.
       */
      virtual bool run_pending_task() = 0;

      virtual void cancel_pending_tasks() = 0;
};

} // tana::vm_manager
