#pragma once

#include <memory>

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>

#include <tana/net/transport/http/session.hpp>
#include <tana/net/transport/http/router.hpp>

namespace tana::net::transport::http {

// Accepts incoming connections and launches the sessions
class server : public std::enable_shared_from_this< server >
{
   boost::asio::io_context& ioc_;
   boost::asio::ip::tcp::acceptor acceptor_;
   std::shared_ptr< const router > router_;

public:
   server( boost::asio::io_context& ioc, boost::asio::ip::tcp::endpoint endpoint, std::shared_ptr< const router > const& r );

   // Start accepting incoming connections
   void run();

   boost::asio::ip::tcp::endpoint local_endpoint() const;

private:
   void do_accept();
   void on_accept( boost::beast::error_code ec, boost::asio::ip::tcp::socket socket );
};

} // tana::net::transport::http
