#pragma once

#include <tana/vm_manager/host_api.hpp>

#include <cstddef>

namespace tana::vm_manager {

constexpr std::size_t default_memory_limit = 64 * 1024 * 1024;
constexpr std::size_t default_stack_size   = 1024 * 1024;

struct isolate_limits
{
   std::size_t memory_limit = default_memory_limit;
   std::size_t stack_size   = default_stack_size;
};

/**
 * A class containing information which may change the execution of a VM.
 */
class context
{
   public:
      context() = delete;
      context( abstract_host_api& hapi, isolate_limits l = isolate_limits() )
         : host_api(hapi), limits(l) {}

      abstract_host_api& host_api;
      isolate_limits     limits;
};

} // tana::vm_manager
