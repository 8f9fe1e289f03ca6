#pragma once

#include <string>

namespace tana::runtime {

/**
 * The script run before every contract. It captures the host object in a
 * closure, deletes it from the global scope and installs the module table
 * behind `__tanaImport`.
 */
const std::string& bootstrap_script();

} // tana::runtime
