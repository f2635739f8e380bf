/**
 * @file CKvDbConfig.hpp
 * @brief Engine tuning configuration of the KVDB module
 * @version 0.1
 * @date 2026-10-16
 *
 * The configuration lives in the "kvdb" module of core::ConfigManager:
 *
 *     "kvdb": {
 *         "journalMode":   "WAL",
 *         "synchronous":   "NORMAL",
 *         "cacheSize":     -10000,
 *         "busyTimeoutMs": 0
 *     }
 *
 * Every key is optional, missing keys keep their defaults.
 */
#ifndef LAP_KVDB_KVDBCONFIG_HPP
#define LAP_KVDB_KVDBCONFIG_HPP

#include <lap/core/CResult.hpp>
#include <nlohmann/json.hpp>

#include "CDataType.hpp"

namespace lap
{
namespace kvdb
{
    /**
     * @brief Load the configuration from core::ConfigManager
     *
     * @return core::Result<KvDbConfig> Defaults when the module is absent
     * @retval KvDbErrc::kInvalidArgument if a present value has the wrong type or is out of range
     */
    core::Result< KvDbConfig >                  LoadKvDbConfig() noexcept;

    /**
     * @brief Build a configuration from an already loaded module object
     *
     * @param moduleConfig JSON object of the "kvdb" module, null for defaults
     */
    core::Result< KvDbConfig >                  ParseKvDbConfig( const nlohmann::json &moduleConfig ) noexcept;

    core::Result< void >                        ValidateKvDbConfig( const KvDbConfig &config ) noexcept;

} // kvdb
} // lap

#endif
