#include <tana/net/transport/http/client.hpp>

#include <tana/log.hpp>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include <openssl/ssl.h>

namespace tana::net::transport::http {

namespace beast = boost::beast;
namespace bhttp = beast::http;
namespace asio  = boost::asio;
using tcp       = asio::ip::tcp;

constexpr const char* user_agent = "tana-edge/" TANA_VERSION;

namespace {

/*
 * Beast stream timeouts only apply to asynchronous operations, so each step is
 * started asynchronously and the private io_context is run to completion.
 */
template< typename Initiate >
beast::error_code run_operation( asio::io_context& ioc, Initiate&& initiate )
{
   beast::error_code result = asio::error::would_block;

   initiate( [&result]( beast::error_code ec, auto&&... ) { result = ec; } );

   ioc.restart();
   ioc.run();

   return result;
}

template< typename Stream >
http_result request( asio::io_context& ioc, Stream& stream, const url& u, std::chrono::milliseconds timeout, std::size_t body_limit )
{
   bhttp::request< bhttp::empty_body > req{ bhttp::verb::get, u.target, 11 };
   req.set( bhttp::field::host, u.authority() );
   req.set( bhttp::field::user_agent, user_agent );
   req.set( bhttp::field::accept, "*/*" );

   beast::flat_buffer buffer;
   bhttp::response_parser< bhttp::string_body > parser;
   parser.body_limit( body_limit );

   beast::get_lowest_layer( stream ).expires_after( timeout );
   auto ec = run_operation( ioc, [&]( auto handler ) { bhttp::async_write( stream, req, handler ); } );
   TANA_ASSERT( !ec, fetch_failed, "fetch failed: ${msg}", ("msg", ec.message()) );

   ec = run_operation( ioc, [&]( auto handler ) { bhttp::async_read_header( stream, buffer, parser, handler ); } );
   TANA_ASSERT( !ec, fetch_failed, "fetch failed: ${msg}", ("msg", ec.message()) );

   ec = run_operation( ioc, [&]( auto handler ) { bhttp::async_read( stream, buffer, parser, handler ); } );
   TANA_ASSERT( !ec, body_read_failed, "failed to read response body: ${msg}", ("msg", ec.message()) );

   auto res = parser.release();

   http_result result;
   result.status = res.result_int();
   result.body = std::move( res.body() );

   return result;
}

} // anonymous

client::client( std::chrono::milliseconds timeout, std::size_t body_limit ) :
   _timeout( timeout ),
   _body_limit( body_limit ),
   _ssl_ctx( asio::ssl::context::tls_client )
{
   _ssl_ctx.set_default_verify_paths();
   _ssl_ctx.set_verify_mode( asio::ssl::verify_peer );
}

client::~client() = default;

http_result client::get( const url& u )
{
   TANA_ASSERT( u.host, fetch_failed, "fetch failed: missing host" );
   TANA_ASSERT( u.scheme == "http" || u.scheme == "https", fetch_failed, "fetch failed: unsupported scheme ${s}", ("s", u.scheme) );

   LOG(debug) << "GET " << u.scheme << "://" << u.authority() << u.target;

   asio::io_context ioc;
   tcp::resolver resolver( ioc );
   tcp::resolver::results_type endpoints;

   auto ec = run_operation( ioc, [&]( auto handler )
   {
      resolver.async_resolve( *u.host, std::to_string( u.port ), [&endpoints, handler]( beast::error_code ec, tcp::resolver::results_type results ) mutable
      {
         endpoints = std::move( results );
         handler( ec );
      } );
   } );
   TANA_ASSERT( !ec, fetch_failed, "fetch failed: ${msg}", ("msg", ec.message()) );

   if ( !u.is_secure() )
   {
      beast::tcp_stream stream( ioc );
      stream.expires_after( _timeout );
      ec = run_operation( ioc, [&]( auto handler ) { stream.async_connect( endpoints, handler ); } );
      TANA_ASSERT( !ec, fetch_failed, "fetch failed: ${msg}", ("msg", ec.message()) );

      auto result = request( ioc, stream, u, _timeout, _body_limit );

      stream.socket().shutdown( tcp::socket::shutdown_both, ec );
      return result;
   }

   beast::ssl_stream< beast::tcp_stream > stream( ioc, _ssl_ctx );

   if ( !SSL_set_tlsext_host_name( stream.native_handle(), u.host->c_str() ) )
   {
      TANA_THROW( fetch_failed, "fetch failed: unable to set SNI hostname ${host}", ("host", *u.host) );
   }
   stream.set_verify_callback( asio::ssl::host_name_verification( *u.host ) );

   beast::get_lowest_layer( stream ).expires_after( _timeout );
   ec = run_operation( ioc, [&]( auto handler ) { beast::get_lowest_layer( stream ).async_connect( endpoints, handler ); } );
   TANA_ASSERT( !ec, fetch_failed, "fetch failed: ${msg}", ("msg", ec.message()) );

   ec = run_operation( ioc, [&]( auto handler ) { stream.async_handshake( asio::ssl::stream_base::client, handler ); } );
   TANA_ASSERT( !ec, fetch_failed, "fetch failed: ${msg}", ("msg", ec.message()) );

   auto result = request( ioc, stream, u, _timeout, _body_limit );

   // Peers commonly close without a TLS close_notify, the response is already complete
   beast::get_lowest_layer( stream ).expires_after( _timeout );
   ec = run_operation( ioc, [&]( auto handler ) { stream.async_shutdown( handler ); } );
   if ( ec && ec != asio::ssl::error::stream_truncated )
      LOG(debug) << "TLS shutdown: " << ec.message();

   return result;
}

} // tana::net::transport::http
