#pragma once

#include <tana/vm_manager/context.hpp>
#include <tana/vm_manager/vm_backend.hpp>

#include <cstddef>
#include <filesystem>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace tana::runtime {

/**
 * Turns contract source in another language into JavaScript.
 */
class abstract_compiler
{
   public:
      abstract_compiler();
      virtual ~abstract_compiler();

      virtual std::string compile( const std::string& name, const std::string& source ) = 0;
};

/**
 * An LRU cache of compiled sources keyed by the digest of their input.
 */
class compile_cache
{
   public:
      compile_cache( std::size_t size );
      ~compile_cache();

      std::optional< std::string > get( const std::string& key );
      void put( const std::string& key, const std::string& output );

   private:
      using lru_list_type = std::list< std::string >;
      using cache_entry_type = std::pair< std::string, lru_list_type::iterator >;

      lru_list_type                                _lru_list;
      std::map< std::string, cache_entry_type >    _cache_map;
      std::mutex                                   _mutex;
      const std::size_t                            _cache_size;
};

constexpr std::size_t default_compiler_memory_limit = 512 * 1024 * 1024;
constexpr std::size_t default_compiler_stack_size   = 4 * 1024 * 1024;

/**
 * Compiles TypeScript by loading the TypeScript compiler script into a
 * capability free isolate and calling `ts.transpileModule`.
 */
class typescript_compiler final : public abstract_compiler
{
   public:
      typescript_compiler(
         std::shared_ptr< vm_manager::vm_backend > backend,
         std::filesystem::path compiler_script,
         std::size_t cache_size );
      ~typescript_compiler() override;

      std::string compile( const std::string& name, const std::string& source ) override;

   private:
      const std::string& compiler_source();

      std::shared_ptr< vm_manager::vm_backend > _backend;
      std::filesystem::path                     _compiler_script;
      vm_manager::isolate_limits                _limits;
      compile_cache                             _cache;
      std::mutex                                _source_mutex;
      std::optional< std::string >              _source;
};

/**
 * Hex encoded SHA-256 of the input.
 */
std::string source_digest( const std::string& source );

} // tana::runtime
