#pragma once

#include <tana/vm_manager/vm_backend.hpp>

#include <string>

namespace tana::vm_manager::quickjs {

/**
 * Implementation of vm_backend for QuickJS. Every call creates and destroys
 * its own runtime and context.
 */
class quickjs_vm_backend : public vm_backend
{
   public:
      quickjs_vm_backend();
      virtual ~quickjs_vm_backend();

      virtual std::string backend_name() override;
      virtual void initialize() override;

      virtual std::optional< nlohmann::json > run( context& ctx, const program& p ) override;
      virtual std::string evaluate( const std::vector< script >& scripts, const isolate_limits& limits ) override;
};

} // tana::vm_manager::quickjs
