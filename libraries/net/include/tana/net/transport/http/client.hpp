#pragma once

#include <tana/net/transport/http/abstract_http_client.hpp>

#include <boost/asio/ssl/context.hpp>

#include <chrono>
#include <cstddef>

namespace tana::net::transport::http {

constexpr std::size_t default_body_limit = 8 * 1024 * 1024;

/**
 * A blocking HTTP/1.1 client over Boost.Beast. TLS connections verify the peer
 * against the default trust store and send SNI.
 */
class client final : public abstract_http_client
{
public:
   explicit client( std::chrono::milliseconds timeout = std::chrono::seconds( 30 ), std::size_t body_limit = default_body_limit );
   ~client() override;

   http_result get( const url& u ) override;

private:
   std::chrono::milliseconds      _timeout;
   std::size_t                    _body_limit;
   boost::asio::ssl::context      _ssl_ctx;
};

} // tana::net::transport::http
