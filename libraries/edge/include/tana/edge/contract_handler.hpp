#pragma once

#include <tana/net/transport/http/abstract_request_handler.hpp>
#include <tana/runtime/dispatcher.hpp>

#include <memory>
#include <string>

namespace tana::edge {

/**
 * Routes `GET|POST /{contract_id}[/{*path}]` to the dispatcher and answers with
 * the contract's `{status, body, headers}` document.
 */
class contract_handler final : public net::transport::http::abstract_request_handler
{
   public:
      explicit contract_handler( std::shared_ptr< runtime::dispatcher > dispatcher );
      ~contract_handler() override;

      net::transport::http::response handle( const net::transport::http::request& req ) override;

   private:
      std::shared_ptr< runtime::dispatcher > _dispatcher;
};

/**
 * Splits a request path into the contract id and the remainder below it.
 */
std::pair< std::string, std::string > split_contract_path( const std::string& path );

} // tana::edge
