#include <tana/store/staged_store.hpp>

namespace tana::store {

bool glob_match( const std::string& pattern, const std::string& str )
{
   // Greedy two pointer match. On a mismatch, backtrack to the most recent
   // '*' and let it absorb one more character. Runs in O(pattern * str).
   std::size_t p = 0, s = 0;
   std::size_t star = std::string::npos, resume = 0;

   while ( s < str.size() )
   {
      if ( p < pattern.size() && pattern[ p ] == '*' )
      {
         star = p++;
         resume = s;
      }
      else if ( p < pattern.size() && pattern[ p ] == str[ s ] )
      {
         p++;
         s++;
      }
      else if ( star != std::string::npos )
      {
         p = star + 1;
         s = ++resume;
      }
      else
      {
         return false;
      }
   }

   while ( p < pattern.size() && pattern[ p ] == '*' )
      p++;

   return p == pattern.size();
}

void staged_store::set( const key_type& key, const value_type& value )
{
   TANA_ASSERT(
      key.size() <= max_key_size,
      key_too_large,
      "Key too large: ${size} bytes (max ${max})",
      ("size", key.size())("max", max_key_size)
   );

   TANA_ASSERT(
      value.size() <= max_value_size,
      value_too_large,
      "Value too large: ${size} bytes (max ${max})",
      ("size", value.size())("max", max_value_size)
   );

   std::lock_guard< std::mutex > lock( _mutex );
   _staging[ key ] = value;
}

std::optional< staged_store::value_type > staged_store::get( const key_type& key ) const
{
   std::lock_guard< std::mutex > lock( _mutex );

   if ( auto it = _staging.find( key ); it != _staging.end() )
      return it->second;

   if ( auto it = _committed.find( key ); it != _committed.end() )
      return it->second;

   return {};
}

void staged_store::erase( const key_type& key )
{
   std::lock_guard< std::mutex > lock( _mutex );
   _staging[ key ] = std::nullopt;
}

bool staged_store::has( const key_type& key ) const
{
   std::lock_guard< std::mutex > lock( _mutex );

   if ( auto it = _staging.find( key ); it != _staging.end() )
      return it->second.has_value();

   return _committed.count( key ) > 0;
}

std::vector< staged_store::key_type > staged_store::keys( const std::optional< std::string >& pattern ) const
{
   entry_map snapshot;
   {
      std::lock_guard< std::mutex > lock( _mutex );
      snapshot = merged();
   }

   std::vector< key_type > result;
   for ( const auto& [ key, value ] : snapshot )
   {
      if ( !pattern || glob_match( *pattern, key ) )
         result.push_back( key );
   }

   return result;
}

staged_store::entry_map staged_store::entries() const
{
   std::lock_guard< std::mutex > lock( _mutex );
   return merged();
}

void staged_store::clear()
{
   std::lock_guard< std::mutex > lock( _mutex );
   _committed.clear();
   _staging.clear();
}

void staged_store::commit()
{
   std::lock_guard< std::mutex > lock( _mutex );

   auto next = merged();

   std::size_t total_size = 0;
   for ( const auto& [ key, value ] : next )
      total_size += key.size() + value.size();

   TANA_ASSERT(
      total_size <= max_total_size,
      storage_limit_exceeded,
      "Storage limit exceeded: ${size} bytes (max ${max})",
      ("size", total_size)("max", max_total_size)
   );

   TANA_ASSERT(
      next.size() <= max_keys,
      too_many_keys,
      "Too many keys: ${count} (max ${max})",
      ("count", next.size())("max", max_keys)
   );

   _committed = std::move( next );
   _staging.clear();
}

store_size staged_store::size() const
{
   std::lock_guard< std::mutex > lock( _mutex );

   store_size s;
   for ( const auto& [ key, value ] : merged() )
   {
      s.keys++;
      s.bytes += key.size() + value.size();
   }

   return s;
}

// Caller must hold _mutex
staged_store::entry_map staged_store::merged() const
{
   entry_map result = _committed;

   for ( const auto& [ key, value ] : _staging )
   {
      if ( value )
         result[ key ] = *value;
      else
         result.erase( key );
   }

   return result;
}

} // tana::store
