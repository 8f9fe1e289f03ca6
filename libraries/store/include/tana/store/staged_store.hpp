#pragma once

#include <tana/store/constants.hpp>
#include <tana/store/exceptions.hpp>

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace tana::store {

struct store_size
{
   std::size_t keys  = 0;
   std::size_t bytes = 0;
};

/**
 * A two layer key value store.
 *
 * Writes and deletes are staged and shadow the committed layer on every read
 * until commit() applies them. Commit checks the aggregate limits against the
 * merged state and either applies every staged change or none of them.
 *
 * All operations are serialized on an internal mutex.
 */
class staged_store final
{
   public:
      using key_type      = std::string;
      using value_type    = std::string;
      using entry_map     = std::map< key_type, value_type >;

      staged_store() = default;
      ~staged_store() = default;

      staged_store( const staged_store& ) = delete;
      staged_store& operator=( const staged_store& ) = delete;

      void set( const key_type& key, const value_type& value );
      std::optional< value_type > get( const key_type& key ) const;
      void erase( const key_type& key );
      bool has( const key_type& key ) const;

      /**
       * Live keys in lexicographic order. The optional pattern is a glob where
       * '*' matches any run of characters and everything else is literal.
       */
      std::vector< key_type > keys( const std::optional< std::string >& pattern = {} ) const;
      entry_map entries() const;

      void clear();
      void commit();

      store_size size() const;

   private:
      entry_map merged() const;

      mutable std::mutex                                _mutex;
      entry_map                                         _committed;
      std::map< key_type, std::optional< value_type > > _staging;
};

/**
 * Matches a full string against a '*' glob.
 */
bool glob_match( const std::string& pattern, const std::string& str );

} // tana::store
