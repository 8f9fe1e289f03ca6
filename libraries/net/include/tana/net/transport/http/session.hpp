#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include <boost/asio/dispatch.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/make_unique.hpp>
#include <boost/optional.hpp>

#include <tana/log.hpp>
#include <tana/net/transport/http/router.hpp>

namespace tana::net::transport::http {

namespace asio = boost::asio;

constexpr std::size_t          request_body_limit = 1024 * 1024;
constexpr std::chrono::seconds session_timeout{ 30 };

// Handles an HTTP server connection
class session : public std::enable_shared_from_this< session >
{
   // This queue is used for HTTP pipelining.
   class queue
   {
      enum
      {
         // Maximum number of responses we will queue
         limit = 8
      };

      // The type-erased, saved work item
      struct work
      {
         virtual ~work() = default;
         virtual void operator()() = 0;
      };

      session& self_;
      std::vector< std::unique_ptr< work > > items_;

   public:
      explicit queue( session& self ) : self_( self )
      {
         static_assert( limit > 0, "queue limit must be positive" );
         items_.reserve( limit );
      }

      // Returns `true` if we have reached the queue limit
      bool is_full() const
      {
         return items_.size() >= limit;
      }

      // Called when a message finishes sending
      // Returns `true` if the caller should initiate a read
      bool on_write()
      {
         BOOST_ASSERT( !items_.empty() );
         auto const was_full = is_full();
         items_.erase( items_.begin() );
         if ( !items_.empty() )
            (*items_.front())();
         return was_full;
      }

      // Called by the HTTP handler to send a response.
      template< bool IsRequest, class Body, class Fields >
      void operator()( bhttp::message< IsRequest, Body, Fields >&& msg )
      {
         struct work_impl : work
         {
            session& self_;
            bhttp::message< IsRequest, Body, Fields > msg_;

            work_impl( session& self, bhttp::message< IsRequest, Body, Fields >&& msg ) :
               self_( self ),
               msg_( std::move( msg ) ) {}

            void operator()()
            {
               bhttp::async_write( self_.stream_, msg_, beast::bind_front_handler( &session::on_write, self_.shared_from_this(), msg_.need_eof() ) );
            }
         };

         items_.push_back( boost::make_unique< work_impl >( self_, std::move( msg ) ) );

         // If there was no previous work, start this one
         if ( items_.size() == 1 )
            (*items_.front())();
      }
   };

   beast::tcp_stream stream_;
   beast::flat_buffer buffer_;
   std::shared_ptr< const router > http_router_;
   std::string remote_address_;
   queue queue_;

   // Constructed anew for each message
   boost::optional< bhttp::request_parser< bhttp::string_body > > parser_;

public:
   session( asio::ip::tcp::socket&& socket, std::shared_ptr< const router > const& http_router ) :
      stream_( std::move( socket ) ),
      http_router_( http_router ),
      queue_( *this )
   {
      beast::error_code ec;
      auto endpoint = stream_.socket().remote_endpoint( ec );
      if ( !ec )
         remote_address_ = endpoint.address().to_string();
   }

   void run()
   {
      asio::dispatch( stream_.get_executor(), beast::bind_front_handler( &session::do_read, this->shared_from_this() ) );
   }

private:
   void do_read()
   {
      parser_.emplace();
      parser_->body_limit( request_body_limit );

      stream_.expires_after( session_timeout );

      bhttp::async_read( stream_, buffer_, *parser_, beast::bind_front_handler( &session::on_read, shared_from_this() ) );
   }

   void on_read( beast::error_code ec, std::size_t bytes_transferred )
   {
      boost::ignore_unused( bytes_transferred );

      // This means they closed the connection
      if ( ec == bhttp::error::end_of_stream )
         return do_close();

      if ( ec )
      {
         if ( ec != beast::error::timeout )
            LOG(debug) << "read: " << ec.message();
         return;
      }

      http_router_->handle( parser_->release(), remote_address_, queue_ );

      // If we aren't at the queue limit, try to pipeline another request
      if ( !queue_.is_full() )
         do_read();
   }

   void on_write( bool close, beast::error_code ec, std::size_t bytes_transferred )
   {
      boost::ignore_unused( bytes_transferred );

      if ( ec )
      {
         LOG(error) << "write: " << ec.message();
         return;
      }

      if ( close )
         return do_close();

      if ( queue_.on_write() )
         do_read();
   }

   void do_close()
   {
      beast::error_code ec;
      stream_.socket().shutdown( asio::ip::tcp::socket::shutdown_send, ec );
   }
};

} // tana::net::transport::http
