#include <tana/runtime/capability_dispatcher.hpp>
#include <tana/runtime/exceptions.hpp>
#include <tana/runtime/host_api.hpp>

#include <tana/net/exceptions.hpp>

#include <tana/log.hpp>

#include <new>

namespace tana::runtime {

namespace detail {

vm_manager::call_result guest_error( const std::string& name, const std::string& message )
{
   vm_manager::call_result r;
   r.error = vm_manager::guest_error{ name, message };
   return r;
}

} // detail

host_api::host_api( execution_context& ctx ) : _ctx( ctx ) {}

host_api::~host_api() {}

std::vector< vm_manager::capability_descriptor > host_api::capabilities() const
{
   return capability_dispatcher::instance().descriptors();
}

vm_manager::call_result host_api::invoke( uint32_t id, const nlohmann::json& args )
{
   try
   {
      vm_manager::call_result r;
      r.value = capability_dispatcher::instance().call_capability( id, _ctx, args );
      return r;
   }
   catch ( const argument_type_exception& e )
   {
      return detail::guest_error( "TypeError", e.get_message() );
   }
   catch ( const net::invalid_url& e )
   {
      return detail::guest_error( "TypeError", e.get_message() );
   }
   catch ( const net::invalid_hostname& e )
   {
      return detail::guest_error( "TypeError", e.get_message() );
   }
   catch ( const tana::exception& e )
   {
      LOG(debug) << "Capability " << capability_id_Name( capability_id( id ) ) << " failed: " << e.get_message();
      return detail::guest_error( "Error", e.get_message() );
   }
   catch ( const std::bad_alloc& )
   {
      throw;
   }
   catch ( const std::exception& e )
   {
      LOG(warning) << "Capability " << id << " raised an unexpected error: " << e.what();
      return detail::guest_error( "Error", e.what() );
   }
}

void host_api::schedule( uint32_t id, nlohmann::json args, vm_manager::completion_handler done )
{
   _ctx.push_task( [this, id, args = std::move( args ), done = std::move( done )]()
   {
      done( invoke( id, args ) );
   } );
}

bool host_api::run_pending_task()
{
   return _ctx.run_task();
}

void host_api::cancel_pending_tasks()
{
   _ctx.clear_tasks();
}

} // tana::runtime
