#include <tana/runtime/compiler.hpp>
#include <tana/runtime/exceptions.hpp>

#include <tana/vm_manager/exceptions.hpp>

#include <tana/log.hpp>

#include <nlohmann/json.hpp>

#include <openssl/evp.h>

#include <fstream>
#include <iomanip>
#include <sstream>

namespace tana::runtime {

abstract_compiler::abstract_compiler() {}
abstract_compiler::~abstract_compiler() {}

compile_cache::compile_cache( std::size_t size ) : _cache_size( size ) {}

compile_cache::~compile_cache()
{
   std::lock_guard< std::mutex > lock( _mutex );
   _cache_map.clear();
}

std::optional< std::string > compile_cache::get( const std::string& key )
{
   std::lock_guard< std::mutex > lock( _mutex );

   auto itr = _cache_map.find( key );
   if ( itr == _cache_map.end() )
      return {};

   // Erase the entry from the list and push front
   _lru_list.erase( itr->second.second );
   _lru_list.push_front( key );
   itr->second.second = _lru_list.begin();

   return itr->second.first;
}

void compile_cache::put( const std::string& key, const std::string& output )
{
   std::lock_guard< std::mutex > lock( _mutex );

   auto existing = _cache_map.find( key );
   if ( existing != _cache_map.end() )
   {
      _lru_list.erase( existing->second.second );
      _cache_map.erase( existing );
   }

   // If the cache is full, remove the last entry from the map and pop back
   if ( _cache_size > 0 && _lru_list.size() >= _cache_size )
   {
      _cache_map.erase( _lru_list.back() );
      _lru_list.pop_back();
   }

   _lru_list.push_front( key );
   _cache_map[ key ] = std::make_pair( output, _lru_list.begin() );
}

std::string source_digest( const std::string& source )
{
   unsigned char md[ EVP_MAX_MD_SIZE ];
   unsigned int len = 0;

   TANA_ASSERT( EVP_Digest( source.data(), source.size(), md, &len, EVP_sha256(), nullptr ) == 1,
      compiler_exception, "could not hash contract source" );

   std::stringstream ss;
   ss << std::hex << std::setfill( '0' );
   for ( unsigned int i = 0; i < len; i++ )
      ss << std::setw( 2 ) << static_cast< unsigned int >( md[i] );

   return ss.str();
}

typescript_compiler::typescript_compiler(
   std::shared_ptr< vm_manager::vm_backend > backend,
   std::filesystem::path compiler_script,
   std::size_t cache_size ) :
   _backend( backend ),
   _compiler_script( std::move( compiler_script ) ),
   _cache( cache_size )
{
   _limits.memory_limit = default_compiler_memory_limit;
   _limits.stack_size = default_compiler_stack_size;
}

typescript_compiler::~typescript_compiler() {}

const std::string& typescript_compiler::compiler_source()
{
   std::lock_guard< std::mutex > lock( _source_mutex );

   if ( !_source )
   {
      std::ifstream in( _compiler_script, std::ios::binary );
      TANA_ASSERT( in, compiler_unavailable, "TypeScript compiler not found: ${path}", ("path", _compiler_script.string()) );

      std::stringstream ss;
      ss << in.rdbuf();
      _source = ss.str();

      LOG(info) << "Loaded TypeScript compiler from " << _compiler_script.string();
   }

   return *_source;
}

std::string typescript_compiler::compile( const std::string& name, const std::string& source )
{
   auto key = source_digest( source );

   if ( auto cached = _cache.get( key ) )
   {
      LOG(debug) << "Using cached compilation of " << name;
      return *cached;
   }

   const auto dump = []( const std::string& s )
   {
      return nlohmann::json( s ).dump( -1, ' ', true, nlohmann::json::error_handler_t::replace );
   };

   std::string driver =
      "ts.transpileModule(" + dump( source ) + ", {"
         " fileName: " + dump( name ) + ","
         " compilerOptions: { target: ts.ScriptTarget.ES2020, module: ts.ModuleKind.ESNext }"
      " }).outputText";

   std::string output;

   try
   {
      output = _backend->evaluate( {
         vm_manager::script{ _compiler_script.filename().string(), compiler_source() },
         vm_manager::script{ "<transpile>", driver }
      }, _limits );
   }
   catch ( const vm_manager::vm_exception& e )
   {
      TANA_THROW( compiler_exception, "Failed to compile ${name}: ${what}", ("name", name)("what", e.get_message()) );
   }

   _cache.put( key, output );

   return output;
}

} // tana::runtime
