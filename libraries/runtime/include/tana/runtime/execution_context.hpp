#pragma once

#include <tana/ledger/gas_meter.hpp>
#include <tana/ledger/transaction_ledger.hpp>
#include <tana/net/egress_gateway.hpp>
#include <tana/runtime/chain_data.hpp>
#include <tana/store/staged_store.hpp>

#include <tana/block/block.pb.h>

#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace tana::runtime {

/**
 * The process wide services reachable from guest code. Each one serializes
 * its own operations.
 */
struct services
{
   std::shared_ptr< store::staged_store >        store;
   std::shared_ptr< ledger::gas_meter >          meter;
   std::shared_ptr< ledger::transaction_ledger > ledger;
   std::shared_ptr< net::egress_gateway >        gateway;
   std::shared_ptr< abstract_chain_data >        chain_data;
};

enum class console_stream
{
   out,
   err
};

struct console_line
{
   console_stream stream;
   std::string    text;
};

using host_task = std::function< void() >;

/**
 * State for a single contract invocation.
 */
class execution_context
{
   public:
      execution_context() = delete;
      execution_context( const services& svc, block::block_context ctx );

      store::staged_store&        store();
      ledger::transaction_ledger& ledger();
      net::egress_gateway&        gateway();
      abstract_chain_data&        chain_data();

      const block::block_context& block() const;

      void console_append( console_stream s, const std::string& text );
      const std::vector< console_line >& console() const;

      void push_task( host_task&& task );
      bool run_task();
      void clear_tasks();
      std::size_t pending_tasks() const;

   private:
      services                      _services;
      block::block_context          _block;
      std::vector< console_line >   _console;
      std::deque< host_task >       _tasks;
};

/**
 * Builds the block context for an invocation starting now.
 */
block::block_context make_block_context( const std::string& contract_id, const std::string& executor, const ledger::gas_meter& meter );

} // tana::runtime
