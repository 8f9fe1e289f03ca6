#pragma once

#include <tana/runtime/capability_utils.hpp>
#include <tana/runtime/exceptions.hpp>
#include <tana/runtime/execution_context.hpp>

#include <tana/vm_manager/host_api.hpp>

#include <boost/container/flat_map.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tana::runtime {

/**
 * The closed registry of capabilities reachable from guest code.
 *
 * - A capability is one-directional: it is a call from guest code to native C++ code.
 * - A capability is immutable: an id always refers to the same native function,
 *   name and calling convention.
 *
 * Arguments arrive as a JSON array and are checked against the native signature
 * before the function runs.
 */
class capability_dispatcher
{
   public:
      std::optional< nlohmann::json > call_capability( uint32_t id, execution_context& ctx, const nlohmann::json& args ) const;

      template< typename Ret, typename... Args >
      void register_capability( uint32_t id, std::string name, vm_manager::call_convention convention, Ret (*fn)( execution_context&, Args... ) )
      {
         generic_capability_handler handler = [fn]( execution_context& ctx, const nlohmann::json& args )
         {
            return detail::call_capability_impl( fn, ctx, args, std::index_sequence_for< Args... >() );
         };

         _dispatch_map.emplace( id, registration{ std::move( name ), convention, std::move( handler ) } );
      }

      bool capability_exists( uint32_t id ) const;
      std::vector< vm_manager::capability_descriptor > descriptors() const;

      static const capability_dispatcher& instance();

   private:
      capability_dispatcher();

      typedef std::function< std::optional< nlohmann::json >( execution_context&, const nlohmann::json& ) > generic_capability_handler;

      struct registration
      {
         std::string                 name;
         vm_manager::call_convention convention;
         generic_capability_handler  handler;
      };

      boost::container::flat_map< uint32_t, registration > _dispatch_map;
};

void register_capabilities( capability_dispatcher& cd );

} // tana::runtime
