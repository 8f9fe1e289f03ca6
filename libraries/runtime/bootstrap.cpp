#include <tana/runtime/bootstrap.hpp>
#include <tana/runtime/constants.hpp>

#include <tana/store/constants.hpp>

namespace tana::runtime {

namespace detail {

constexpr const char* bootstrap_prologue = R"js(
(function (core, config) {
   "use strict";

   const ops = core.ops;
   const modules = Object.create(null);

   const format = (args) => args.map((v) => {
      if (typeof v === "object" && v !== null) {
         try { return JSON.stringify(v, null, 2); }
         catch (e) { return String(v); }
      }
      return String(v);
   }).join(" ");

   const console = Object.freeze({
      log(...args) { ops.print_stdout(format(args)); },
      info(...args) { ops.print_stdout(format(args)); },
      error(...args) { ops.print_stderr(format(args)); },
      warn(...args) { ops.print_stderr(format(args)); },
   });

   modules["tana/core"] = {
      console,
      version: Object.freeze({ tana: config.version, engine: config.engine }),
   };

   class Request {
      constructor(data) {
         this.path = (data && data.path) || "/";
         this.method = (data && data.method) || "GET";
         this.query = (data && data.query) || {};
         this.headers = (data && data.headers) || {};
         this.params = (data && data.params) || {};
         this.ip = (data && data.ip) || "127.0.0.1";
      }
   }

   class Response {
      constructor(status, body, headers) {
         this.status = status || 200;
         this.body = body === undefined ? null : body;
         this.headers = headers || {};
      }

      static json(data, status = 200) {
         return new Response(status, data, { "Content-Type": "application/json" });
      }

      static text(data, status = 200) {
         return new Response(status, data, { "Content-Type": "text/plain" });
      }
   }

   modules["tana/net"] = { Request, Response };

   modules["tana/block"] = {
      block: {
         async getBalance(userIds, currencyCode) { return ops.block_get_balance(userIds, currencyCode); },
         async getUser(userIds) { return ops.block_get_user(userIds); },
         async getTransaction(txIds) { return ops.block_get_transaction(txIds); },
         getHeight() { return ops.block_get_height(); },
         getTimestamp() { return ops.block_get_timestamp(); },
         getHash() { return ops.block_get_hash(); },
         getPreviousHash() { return ops.block_get_previous_hash(); },
         getExecutor() { return ops.block_get_executor(); },
         getContractId() { return ops.block_get_contract_id(); },
         getGasLimit() { return ops.block_get_gas_limit(); },
         getGasUsed() { return ops.block_get_gas_used(); },
      },
   };

   modules["tana/tx"] = {
      tx: {
         transfer(from, to, amount, currency) { ops.tx_transfer(from, to, amount, currency); },
         setBalance(userId, amount, currency) { ops.tx_set_balance(userId, amount, currency); },
         getChanges() { return ops.tx_get_changes(); },
         execute() { return ops.tx_execute(); },
      },
   };

   modules["tana/utils"] = {
      async fetch(url) {
         const response = await ops.fetch(url);
         return {
            ok: response.status >= 200 && response.status < 300,
            status: response.status,
            async text() { return response.body; },
            async json() { return JSON.parse(response.body); },
         };
      },
      sum(numbers) { return ops.sum(numbers); },
   };

   const serialize = (value) => {
      if (typeof value === "string") return value;
      return JSON.stringify(value, (key, val) => typeof val === "bigint" ? val.toString() : val);
   };

   const deserialize = (value) => {
      if (value === null || value === undefined) return null;
      try { return JSON.parse(value); }
      catch (e) { return value; }
   };

   modules["tana/data"] = {
      data: {
         MAX_KEY_SIZE: config.limits.maxKeySize,
         MAX_VALUE_SIZE: config.limits.maxValueSize,
         MAX_TOTAL_SIZE: config.limits.maxTotalSize,
         MAX_KEYS: config.limits.maxKeys,
         _serialize: serialize,
         _deserialize: deserialize,
         async set(key, value) { ops.data_set(key, serialize(value)); },
         async get(key) { return deserialize(ops.data_get(key)); },
         async delete(key) { ops.data_delete(key); },
         async has(key) { return ops.data_has(key); },
         async keys(pattern) { return ops.data_keys(pattern || null); },
         async entries() {
            const raw = ops.data_entries();
            const result = {};
            for (const key of Object.keys(raw)) result[key] = deserialize(raw[key]);
            return result;
         },
         async clear() { ops.data_clear(); },
         async commit() { ops.data_commit(); },
      },
   };

   for (const name of Object.keys(modules)) Object.freeze(modules[name]);

   const tanaImport = function (spec) {
      const key = typeof spec === "string" && spec.startsWith("tana:") ? "tana/" + spec.slice(5) : spec;
      const m = modules[key];
      if (!m) throw new Error("unknown tana module: " + spec);
      return m;
   };

   Object.defineProperty(globalThis, "__tanaImport", { value: tanaImport, enumerable: false });
   Object.defineProperty(globalThis, "console", { value: console, writable: true, configurable: true, enumerable: false });
})(globalThis.__tanaCore, )js";

constexpr const char* bootstrap_epilogue = R"js();

delete globalThis.__tanaCore;
)js";

std::string bootstrap_config()
{
   return std::string( "{ version: \"" ) + constants::tana_version + "\", engine: \"" + constants::engine_version + "\", limits: {"
      + " maxKeySize: " + std::to_string( store::max_key_size )
      + ", maxValueSize: " + std::to_string( store::max_value_size )
      + ", maxTotalSize: " + std::to_string( store::max_total_size )
      + ", maxKeys: " + std::to_string( store::max_keys )
      + " } }";
}

} // detail

const std::string& bootstrap_script()
{
   static const std::string script = detail::bootstrap_prologue + detail::bootstrap_config() + detail::bootstrap_epilogue;
   return script;
}

} // tana::runtime
