#pragma once

#include <tana/exception.hpp>

namespace tana::net {

TANA_DECLARE_DERIVED_EXCEPTION( net_exception, transport_exception );

// Malformed input, surfaced to guest code as a TypeError
TANA_DECLARE_DERIVED_EXCEPTION( invalid_url, net_exception );
TANA_DECLARE_DERIVED_EXCEPTION( invalid_hostname, net_exception );

TANA_DECLARE_DERIVED_EXCEPTION( domain_not_allowed, net_exception );
TANA_DECLARE_DERIVED_EXCEPTION( fetch_failed, net_exception );
TANA_DECLARE_DERIVED_EXCEPTION( body_read_failed, net_exception );

} // tana::net
