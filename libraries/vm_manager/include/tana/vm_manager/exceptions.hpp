#pragma once

#include <tana/exception.hpp>

namespace tana::vm_manager {

// Root of exception hierarchy for vm_manager library
TANA_DECLARE_DERIVED_EXCEPTION( vm_exception, setup_exception );

// Exceptions thrown by vm_manager
TANA_DECLARE_DERIVED_EXCEPTION( vm_manager_exception, vm_exception );
// Any particular backend should subclass all its exceptions from vm_backend_exception
TANA_DECLARE_DERIVED_EXCEPTION( vm_backend_exception, vm_exception );

TANA_DECLARE_DERIVED_EXCEPTION( unknown_backend_exception, vm_manager_exception );

// Guest code threw, rejected, or left its work unfinished
TANA_DECLARE_DERIVED_EXCEPTION( guest_exception, vm_exception );

} // tana::vm_manager
