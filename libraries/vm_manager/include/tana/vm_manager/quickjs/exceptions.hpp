#pragma once

#include <tana/exception.hpp>
#include <tana/vm_manager/exceptions.hpp>

namespace tana::vm_manager::quickjs {

TANA_DECLARE_DERIVED_EXCEPTION( quickjs_vm_exception, vm_backend_exception );

// Isolate setup exceptions
TANA_DECLARE_DERIVED_EXCEPTION( create_runtime_exception, quickjs_vm_exception );
TANA_DECLARE_DERIVED_EXCEPTION( create_context_exception, quickjs_vm_exception );
TANA_DECLARE_DERIVED_EXCEPTION( bootstrap_exception, quickjs_vm_exception );
TANA_DECLARE_DERIVED_EXCEPTION( sandbox_violation_exception, quickjs_vm_exception );

// Runtime exceptions
TANA_DECLARE_DERIVED_EXCEPTION( evaluation_exception, guest_exception );
TANA_DECLARE_DERIVED_EXCEPTION( unresolved_work_exception, guest_exception );
TANA_DECLARE_DERIVED_EXCEPTION( value_conversion_exception, guest_exception );

} // tana::vm_manager::quickjs
