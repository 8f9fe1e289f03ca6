#include <tana/runtime/capability_dispatcher.hpp>

namespace tana::runtime {

capability_dispatcher::capability_dispatcher()
{
   register_capabilities( *this );
}

const capability_dispatcher& capability_dispatcher::instance()
{
   static const capability_dispatcher cd;
   return cd;
}

std::optional< nlohmann::json > capability_dispatcher::call_capability( uint32_t id, execution_context& ctx, const nlohmann::json& args ) const
{
   auto it = _dispatch_map.find( id );
   TANA_ASSERT( it != _dispatch_map.end(), capability_not_found, "capability ${id} not found", ("id", id) );
   return it->second.handler( ctx, args );
}

bool capability_dispatcher::capability_exists( uint32_t id ) const
{
   return _dispatch_map.count( id );
}

std::vector< vm_manager::capability_descriptor > capability_dispatcher::descriptors() const
{
   std::vector< vm_manager::capability_descriptor > result;
   result.reserve( _dispatch_map.size() );

   for ( const auto& [ id, reg ] : _dispatch_map )
      result.push_back( vm_manager::capability_descriptor{ id, reg.name, reg.convention } );

   return result;
}

} // tana::runtime
