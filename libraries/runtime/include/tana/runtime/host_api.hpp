#pragma once

#include <tana/runtime/execution_context.hpp>

#include <tana/vm_manager/host_api.hpp>

namespace tana::runtime {

/**
 * Connects a VM backend to the capability dispatcher for one invocation.
 * Asynchronous capabilities are queued on the execution context and run when
 * the backend drains host work.
 */
class host_api final : public vm_manager::abstract_host_api
{
   public:
      host_api( execution_context& ctx );
      ~host_api() override;

      std::vector< vm_manager::capability_descriptor > capabilities() const override;

      vm_manager::call_result invoke( uint32_t id, const nlohmann::json& args ) override;
      void schedule( uint32_t id, nlohmann::json args, vm_manager::completion_handler done ) override;
      bool run_pending_task() override;
      void cancel_pending_tasks() override;

   private:
      execution_context& _ctx;
};

} // tana::runtime
