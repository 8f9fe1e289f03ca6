#pragma once

#include <tana/net/exceptions.hpp>
#include <tana/net/url.hpp>
#include <tana/net/transport/http/abstract_http_client.hpp>

#include <memory>
#include <string>
#include <vector>

namespace tana::net {

const std::vector< std::string >& default_allowed_domains();

/**
 * The only path from guest code to the network. A request leaves the process
 * only when its hostname is an allowed domain or a subdomain of one.
 */
class egress_gateway final
{
public:
   egress_gateway(
      std::shared_ptr< transport::http::abstract_http_client > client,
      std::vector< std::string > allowed_domains = default_allowed_domains() );
   ~egress_gateway();

   bool is_allowed( const std::string& hostname ) const;

   transport::http::http_result fetch( const std::string& url ) const;

   const std::vector< std::string >& allowed_domains() const;

private:
   std::shared_ptr< transport::http::abstract_http_client > _client;
   std::vector< std::string >                               _allowed_domains;
};

} // tana::net
