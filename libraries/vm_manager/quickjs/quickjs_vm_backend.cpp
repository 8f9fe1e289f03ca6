#include <quickjs.h>

#include <tana/exception.hpp>
#include <tana/log.hpp>

#include <tana/vm_manager/quickjs/exceptions.hpp>
#include <tana/vm_manager/quickjs/quickjs_vm_backend.hpp>

#include <boost/container/flat_map.hpp>

#include <cstring>
#include <exception>
#include <list>
#include <optional>
#include <string>
#include <vector>

namespace tana::vm_manager::quickjs {

namespace constants {
   constexpr const char* host_object      = "__tanaCore";
   constexpr const char* host_ops         = "ops";
   constexpr const char* settle_helper    = "(function(P){ return function(v){ return P.resolve(v); }; })(Promise)";
   constexpr const char* unresolved_work  = "contract left unresolved asynchronous work";
}

/**
 * Owns one reference to a JSValue.
 */
class value_ref
{
   public:
      value_ref( JSContext* ctx, JSValue v ) : _ctx( ctx ), _value( v ) {}
      value_ref( const value_ref& ) = delete;
      value_ref( value_ref&& other ) : _ctx( other._ctx ), _value( other._value )
      {
         other._value = JS_UNDEFINED;
      }
      ~value_ref()
      {
         JS_FreeValue( _ctx, _value );
      }

      value_ref& operator=( const value_ref& ) = delete;

      JSValue get() const { return _value; }

      JSValue release()
      {
         JSValue v = _value;
         _value = JS_UNDEFINED;
         return v;
      }

   private:
      JSContext* _ctx;
      JSValue    _value;
};

struct pending_promise
{
   JSValue resolve;
   JSValue reject;
};

class quickjs_runner
{
   public:
      quickjs_runner( const isolate_limits& limits );
      ~quickjs_runner();

      void bind_capabilities( abstract_host_api& hapi );
      void verify_sandbox();

      value_ref eval_script( const script& s );
      std::optional< value_ref > lookup_entry( const std::string& entry_point );
      value_ref call( const value_ref& fn, const std::vector< nlohmann::json >& arguments );
      void drain();
      nlohmann::json settle( value_ref&& result );

      std::string to_string( JSValueConst v );

      JSValue invoke_capability( uint32_t id, int argc, JSValueConst* argv ) noexcept;

   private:
      JSValue to_js( const nlohmann::json& j );
      std::optional< nlohmann::json > to_json( JSValueConst v );
      JSValue make_error( const guest_error& e );
      void complete( std::list< pending_promise >::iterator it, const call_result& r );
      std::string take_exception();
      void rethrow_host_exception();

      JSRuntime*                                                 _rt = nullptr;
      JSContext*                                                 _ctx = nullptr;
      abstract_host_api*                                         _hapi = nullptr;
      boost::container::flat_map< uint32_t, call_convention >   _conventions;
      std::list< pending_promise >                               _pending;
      JSValue                                                    _settle_helper = JS_UNDEFINED;
      std::exception_ptr                                         _exception;
};

JSValue native_capability( JSContext* ctx, JSValueConst this_val, int argc, JSValueConst* argv, int magic, JSValue* func_data )
{
   auto runner = static_cast< quickjs_runner* >( JS_GetContextOpaque( ctx ) );
   return runner->invoke_capability( uint32_t( magic ), argc, argv );
}

quickjs_runner::quickjs_runner( const isolate_limits& limits )
{
   _rt = JS_NewRuntime();
   TANA_ASSERT( _rt != nullptr, create_runtime_exception, "could not create runtime" );

   JS_SetMemoryLimit( _rt, limits.memory_limit );
   JS_SetMaxStackSize( _rt, limits.stack_size );

   // Standard intrinsics only, nothing from quickjs-libc
   _ctx = JS_NewContext( _rt );
   if ( _ctx == nullptr )
   {
      JS_FreeRuntime( _rt );
      TANA_THROW( create_context_exception, "could not create context" );
   }

   JS_SetContextOpaque( _ctx, this );

   _settle_helper = JS_Eval( _ctx, constants::settle_helper, std::strlen( constants::settle_helper ), "<settle>", JS_EVAL_TYPE_GLOBAL );
   if ( JS_IsException( _settle_helper ) )
   {
      auto msg = take_exception();
      JS_FreeContext( _ctx );
      JS_FreeRuntime( _rt );
      TANA_THROW( create_context_exception, "could not create context: ${msg}", ("msg", msg) );
   }
}

quickjs_runner::~quickjs_runner()
{
   if ( _hapi != nullptr )
      _hapi->cancel_pending_tasks();

   for ( auto& p : _pending )
   {
      JS_FreeValue( _ctx, p.resolve );
      JS_FreeValue( _ctx, p.reject );
   }
   _pending.clear();

   JS_FreeValue( _ctx, _settle_helper );
   JS_FreeContext( _ctx );
   JS_FreeRuntime( _rt );
}

void quickjs_runner::bind_capabilities( abstract_host_api& hapi )
{
   _hapi = &hapi;

   value_ref global( _ctx, JS_GetGlobalObject( _ctx ) );
   JSValue core = JS_NewObject( _ctx );
   JSValue ops = JS_NewObject( _ctx );

   for ( const auto& desc : hapi.capabilities() )
   {
      _conventions[ desc.id ] = desc.convention;
      JS_SetPropertyStr( _ctx, ops, desc.name.c_str(), JS_NewCFunctionData( _ctx, native_capability, 0, int( desc.id ), 0, nullptr ) );
   }

   JS_SetPropertyStr( _ctx, core, constants::host_ops, ops );
   JS_SetPropertyStr( _ctx, global.get(), constants::host_object, core );
}

void quickjs_runner::verify_sandbox()
{
   value_ref global( _ctx, JS_GetGlobalObject( _ctx ) );
   value_ref core( _ctx, JS_GetPropertyStr( _ctx, global.get(), constants::host_object ) );

   TANA_ASSERT( JS_IsUndefined( core.get() ), sandbox_violation_exception, "host object is still reachable after bootstrap" );
}

value_ref quickjs_runner::eval_script( const script& s )
{
   JSValue v = JS_Eval( _ctx, s.source.c_str(), s.source.size(), s.name.c_str(), JS_EVAL_TYPE_GLOBAL );
   rethrow_host_exception();

   if ( JS_IsException( v ) )
   {
      auto msg = take_exception();
      TANA_THROW( evaluation_exception, "${msg}", ("msg", msg)("script", s.name) );
   }

   return value_ref( _ctx, v );
}

std::optional< value_ref > quickjs_runner::lookup_entry( const std::string& entry_point )
{
   // Lexical declarations are not properties of the global object, resolve by name instead
   std::string expr = "typeof " + entry_point + " === 'function' ? " + entry_point + " : undefined";
   auto fn = eval_script( script{ "<entry>", expr } );

   if ( !JS_IsFunction( _ctx, fn.get() ) )
      return {};

   return fn;
}

value_ref quickjs_runner::call( const value_ref& fn, const std::vector< nlohmann::json >& arguments )
{
   std::vector< JSValue > args;
   args.reserve( arguments.size() );
   for ( const auto& a : arguments )
   {
      JSValue v = to_js( a );
      if ( JS_IsException( v ) )
      {
         for ( auto& x : args )
            JS_FreeValue( _ctx, x );
         auto msg = take_exception();
         TANA_THROW( value_conversion_exception, "could not convert argument: ${msg}", ("msg", msg) );
      }
      args.push_back( v );
   }

   JSValue result = JS_Call( _ctx, fn.get(), JS_UNDEFINED, int( args.size() ), args.data() );

   for ( auto& x : args )
      JS_FreeValue( _ctx, x );

   rethrow_host_exception();

   if ( JS_IsException( result ) )
   {
      auto msg = take_exception();
      TANA_THROW( evaluation_exception, "${msg}", ("msg", msg) );
   }

   // Normalize plain values and promises into one promise
   JSValue arg = result;
   JSValue settled = JS_Call( _ctx, _settle_helper, JS_UNDEFINED, 1, &arg );
   JS_FreeValue( _ctx, result );

   if ( JS_IsException( settled ) )
   {
      auto msg = take_exception();
      TANA_THROW( evaluation_exception, "${msg}", ("msg", msg) );
   }

   return value_ref( _ctx, settled );
}

void quickjs_runner::drain()
{
   for ( ;; )
   {
      for ( ;; )
      {
         JSContext* job_ctx = nullptr;
         int r = JS_ExecutePendingJob( _rt, &job_ctx );
         rethrow_host_exception();

         if ( r < 0 )
         {
            auto msg = take_exception();
            TANA_THROW( evaluation_exception, "${msg}", ("msg", msg) );
         }

         if ( r == 0 )
            break;
      }

      if ( _hapi == nullptr || !_hapi->run_pending_task() )
         break;

      rethrow_host_exception();
   }
}

nlohmann::json quickjs_runner::settle( value_ref&& promise )
{
   switch ( JS_PromiseState( _ctx, promise.get() ) )
   {
      case JS_PROMISE_FULFILLED:
      {
         value_ref result( _ctx, JS_PromiseResult( _ctx, promise.get() ) );
         auto j = to_json( result.get() );
         if ( !j )
         {
            auto msg = take_exception();
            TANA_THROW( value_conversion_exception, "could not convert result: ${msg}", ("msg", msg) );
         }
         return *j;
      }
      case JS_PROMISE_REJECTED:
      {
         value_ref reason( _ctx, JS_PromiseResult( _ctx, promise.get() ) );
         TANA_THROW( evaluation_exception, "${msg}", ("msg", to_string( reason.get() )) );
      }
      default:
         break;
   }

   TANA_THROW( unresolved_work_exception, constants::unresolved_work );
}

std::string quickjs_runner::to_string( JSValueConst v )
{
   const char* str = JS_ToCString( _ctx, v );
   if ( str == nullptr )
   {
      // Converting the value itself threw, discard that secondary error
      JS_FreeValue( _ctx, JS_GetException( _ctx ) );
      return "unknown error";
   }

   std::string result( str );
   JS_FreeCString( _ctx, str );
   return result;
}

std::string quickjs_runner::take_exception()
{
   value_ref exc( _ctx, JS_GetException( _ctx ) );
   return to_string( exc.get() );
}

void quickjs_runner::rethrow_host_exception()
{
   if ( _exception )
   {
      std::exception_ptr exc = _exception;
      _exception = std::exception_ptr();
      std::rethrow_exception( exc );
   }
}

JSValue quickjs_runner::to_js( const nlohmann::json& j )
{
   auto s = j.dump( -1, ' ', false, nlohmann::json::error_handler_t::replace );
   return JS_ParseJSON( _ctx, s.c_str(), s.size(), "<host>" );
}

std::optional< nlohmann::json > quickjs_runner::to_json( JSValueConst v )
{
   if ( JS_IsUndefined( v ) )
      return nlohmann::json();

   JSValue str = JS_JSONStringify( _ctx, v, JS_UNDEFINED, JS_UNDEFINED );
   if ( JS_IsException( str ) )
      return {};

   value_ref holder( _ctx, str );

   // Functions and symbols have no JSON form
   if ( JS_IsUndefined( str ) )
      return nlohmann::json();

   auto text = to_string( str );

   try
   {
      return nlohmann::json::parse( text );
   }
   catch ( const nlohmann::json::parse_error& e )
   {
      JS_ThrowTypeError( _ctx, "%s", e.what() );
      return {};
   }
}

JSValue quickjs_runner::make_error( const guest_error& e )
{
   if ( e.name == "TypeError" )
   {
      JS_ThrowTypeError( _ctx, "%s", e.message.c_str() );
      return JS_GetException( _ctx );
   }

   JSValue err = JS_NewError( _ctx );
   JS_SetPropertyStr( _ctx, err, "message", JS_NewStringLen( _ctx, e.message.data(), e.message.size() ) );
   return err;
}

JSValue quickjs_runner::invoke_capability( uint32_t id, int argc, JSValueConst* argv ) noexcept
{
   try
   {
      auto conv = _conventions.find( id );
      if ( conv == _conventions.end() || _hapi == nullptr )
         return JS_ThrowReferenceError( _ctx, "capability %u is not bound", id );

      nlohmann::json args = nlohmann::json::array();
      for ( int i = 0; i < argc; i++ )
      {
         auto j = to_json( argv[i] );
         if ( !j )
            return JS_EXCEPTION;
         args.push_back( std::move( *j ) );
      }

      if ( conv->second == call_convention::sync )
      {
         auto r = _hapi->invoke( id, args );
         if ( r.error )
            return JS_Throw( _ctx, make_error( *r.error ) );
         if ( !r.value )
            return JS_UNDEFINED;
         return to_js( *r.value );
      }

      JSValue funcs[2];
      JSValue promise = JS_NewPromiseCapability( _ctx, funcs );
      if ( JS_IsException( promise ) )
         return promise;

      auto it = _pending.insert( _pending.end(), pending_promise{ funcs[0], funcs[1] } );
      _hapi->schedule( id, std::move( args ), [this, it]( const call_result& r ) { complete( it, r ); } );

      return promise;
   }
   catch ( ... )
   {
      // Raised again on the host side once the engine unwinds
      _exception = std::current_exception();
   }

   return JS_ThrowInternalError( _ctx, "host failure" );
}

void quickjs_runner::complete( std::list< pending_promise >::iterator it, const call_result& r )
{
   JSValue arg;
   JSValue fn;

   if ( r.error )
   {
      arg = make_error( *r.error );
      fn = it->reject;
   }
   else
   {
      arg = r.value ? to_js( *r.value ) : JS_UNDEFINED;
      fn = it->resolve;

      if ( JS_IsException( arg ) )
      {
         arg = JS_GetException( _ctx );
         fn = it->reject;
      }
   }

   JSValue ret = JS_Call( _ctx, fn, JS_UNDEFINED, 1, &arg );
   JS_FreeValue( _ctx, ret );
   JS_FreeValue( _ctx, arg );

   JS_FreeValue( _ctx, it->resolve );
   JS_FreeValue( _ctx, it->reject );
   _pending.erase( it );
}

quickjs_vm_backend::quickjs_vm_backend() {}
quickjs_vm_backend::~quickjs_vm_backend() {}

std::string quickjs_vm_backend::backend_name()
{
   return "quickjs";
}

void quickjs_vm_backend::initialize()
{
}

std::optional< nlohmann::json > quickjs_vm_backend::run( context& ctx, const program& p )
{
   quickjs_runner runner( ctx.limits );

   runner.bind_capabilities( ctx.host_api );

   try
   {
      runner.eval_script( p.bootstrap );
   }
   TANA_CAPTURE_CATCH_AND_RETHROW( ("phase", "bootstrap") )

   runner.verify_sandbox();

   runner.eval_script( p.contract );

   auto entry = runner.lookup_entry( p.entry_point );
   if ( !entry )
      return {};

   auto settled = runner.call( *entry, p.arguments );
   runner.drain();

   return runner.settle( std::move( settled ) );
}

std::string quickjs_vm_backend::evaluate( const std::vector< script >& scripts, const isolate_limits& limits )
{
   TANA_ASSERT( !scripts.empty(), quickjs_vm_exception, "nothing to evaluate" );

   quickjs_runner runner( limits );

   std::optional< value_ref > last;
   for ( const auto& s : scripts )
      last.emplace( runner.eval_script( s ) );

   runner.drain();

   TANA_ASSERT( JS_IsString( last->get() ), evaluation_exception, "script ${name} did not produce a string", ("name", scripts.back().name) );

   return runner.to_string( last->get() );
}

} // tana::vm_manager::quickjs
