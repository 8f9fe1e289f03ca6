#pragma once

#include <tana/net/url.hpp>
#include <tana/net/transport/http/abstract_http_client.hpp>

#include <nlohmann/json.hpp>

#include <memory>
#include <string>
#include <vector>

namespace tana::runtime {

enum class collection
{
   balances,
   users,
   transactions
};

std::string to_string( collection c );

/**
 * Read-only view of ledger records used by the batch queries of the block
 * namespace. Subclasses supply the raw record arrays, matching is shared.
 */
class abstract_chain_data
{
   public:
      abstract_chain_data();
      virtual ~abstract_chain_data();

      /**
       * Balance of each owner in the currency, 0 when unknown.
       */
      std::vector< double > balances( const std::vector< std::string >& owner_ids, const std::string& currency );

      /**
       * Users matched by id or username, null when unknown.
       */
      std::vector< nlohmann::json > users( const std::vector< std::string >& ids );

      std::vector< nlohmann::json > transactions( const std::vector< std::string >& ids );

   protected:
      virtual nlohmann::json records( collection c ) = 0;
};

/**
 * A fixed data set, used when no ledger is configured.
 */
class mock_chain_data final : public abstract_chain_data
{
   public:
      mock_chain_data();
      ~mock_chain_data() override;

   protected:
      nlohmann::json records( collection c ) override;

   private:
      nlohmann::json _balances;
      nlohmann::json _users;
      nlohmann::json _transactions;
};

/**
 * Reads `{base}/balances`, `{base}/users` and `{base}/transactions` from an
 * HTTP ledger on every query.
 */
class ledger_chain_data final : public abstract_chain_data
{
   public:
      ledger_chain_data( std::shared_ptr< net::transport::http::abstract_http_client > client, const std::string& base_url );
      ~ledger_chain_data() override;

   protected:
      nlohmann::json records( collection c ) override;

   private:
      std::shared_ptr< net::transport::http::abstract_http_client > _client;
      net::url                                                       _base;
};

} // tana::runtime
