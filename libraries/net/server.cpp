#include <tana/net/transport/http/server.hpp>

#include <boost/asio/dispatch.hpp>
#include <boost/asio/strand.hpp>

#include <tana/log.hpp>

namespace tana::net::transport::http {

server::server( boost::asio::io_context& ioc, boost::asio::ip::tcp::endpoint endpoint, std::shared_ptr< const router > const& r ) :
   ioc_( ioc ),
   acceptor_( boost::asio::make_strand( ioc ) ),
   router_( r )
{
   acceptor_.open( endpoint.protocol() );
   acceptor_.set_option( boost::asio::socket_base::reuse_address( true ) );
   acceptor_.bind( endpoint );
   acceptor_.listen( boost::asio::socket_base::max_listen_connections );
}

void server::run()
{
   boost::asio::dispatch( acceptor_.get_executor(), boost::beast::bind_front_handler( &server::do_accept, this->shared_from_this() ) );
}

boost::asio::ip::tcp::endpoint server::local_endpoint() const
{
   return acceptor_.local_endpoint();
}

void server::do_accept()
{
   // The new connection gets its own strand
   acceptor_.async_accept( boost::asio::make_strand( ioc_ ), boost::beast::bind_front_handler( &server::on_accept, this->shared_from_this() ) );
}

void server::on_accept( boost::beast::error_code ec, boost::asio::ip::tcp::socket socket )
{
   if ( ec )
   {
      LOG(error) << "accept: " << ec.message();
   }
   else
   {
      std::make_shared< session >( std::move( socket ), router_ )->run();
   }

   if ( acceptor_.is_open() )
      do_accept();
}

} // tana::net::transport::http
