#pragma once

#include <string>

namespace tana::runtime {

/**
 * Rewrites `import { a, b as c } from "tana/<module>"` lines into
 * `const { a, b: c } = __tanaImport('tana/<module>');` and strips a leading
 * `export` keyword from every other line. Works line by line, so imports
 * spanning several lines are left untouched.
 */
std::string rewrite_imports( const std::string& source );

} // tana::runtime
