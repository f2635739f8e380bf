/**
 * @file CDataType.hpp
 * @brief Common types, constants and logging macros of the KVDB module
 * @version 0.1
 * @date 2026-10-16
 *
 *
 */
#ifndef LAP_KVDB_DATATYPE_HPP
#define LAP_KVDB_DATATYPE_HPP

#include <utility>

// core
#include <lap/core/CTypedef.hpp>
#include <lap/core/CString.hpp>
#include <lap/log/CLog.hpp>

#include <nlohmann/json.hpp>

// kvdb common
#include "CKvDbErrorDomain.hpp"

namespace lap
{
namespace kvdb
{
    // ========================================================================
    // Logging Configuration
    // ========================================================================
    #define LAP_KVDB_LOG_CONTEXT_ID      "KVDB"
    #define LAP_KVDB_LOG_CONTEXT_DESC    "KVDB log ctx"

#ifdef LAP_DEBUG
    #define LAP_KVDB_LOG                 LAP_LOG( LAP_KVDB_LOG_CONTEXT_ID, LAP_KVDB_LOG_CONTEXT_DESC, ::lap::log::LogLevel::kVerbose )
    #define LAP_KVDB_LOG_VERBOSE         LAP_KVDB_LOG.LogVerbose().WithLocation( __FILE__, __LINE__ )
    #define LAP_KVDB_LOG_DEBUG           LAP_KVDB_LOG.LogDebug().WithLocation( __FILE__, __LINE__ )
    #define LAP_KVDB_LOG_INFO            LAP_KVDB_LOG.LogInfo().WithLocation( __FILE__, __LINE__ )
#else
    #define LAP_KVDB_LOG                 LAP_LOG( LAP_KVDB_LOG_CONTEXT_ID, LAP_KVDB_LOG_CONTEXT_DESC, ::lap::log::LogLevel::kWarn )
    #define LAP_KVDB_LOG_VERBOSE         LAP_KVDB_LOG.LogOff()
    #define LAP_KVDB_LOG_DEBUG           LAP_KVDB_LOG.LogOff()
    #define LAP_KVDB_LOG_INFO            LAP_KVDB_LOG.LogOff()
#endif
    #define LAP_KVDB_LOG_WARN            LAP_KVDB_LOG.LogWarn().WithLocation( __FILE__, __LINE__ )
    #define LAP_KVDB_LOG_ERROR           LAP_KVDB_LOG.LogError().WithLocation( __FILE__, __LINE__ )
    #define LAP_KVDB_LOG_FATAL           LAP_KVDB_LOG.LogFatal().WithLocation( __FILE__, __LINE__ )

    // ========================================================================
    // Storage Layout
    // ========================================================================
    #define LAP_KVDB_TABLE_NAME                     "data"
    #define LAP_KVDB_MEMORY_PATH                    ":memory:"

    // ========================================================================
    // Configuration Defaults
    // ========================================================================
    #define LAP_KVDB_CONFIG_MODULE                  "kvdb"
    #define LAP_KVDB_DEFAULT_JOURNAL_MODE           "WAL"
    #define LAP_KVDB_DEFAULT_SYNCHRONOUS            "NORMAL"
    #define LAP_KVDB_DEFAULT_CACHE_SIZE             (-10000)
    #define LAP_KVDB_DEFAULT_BUSY_TIMEOUT_MS        0

    /**
     * @brief A JSON-serializable value as stored through the JSON view
     */
    using JsonValue = nlohmann::json;

    /**
     * @brief One row of the store, key first
     */
    template< class V >
    using KvDbEntry = ::std::pair< core::String, V >;

    enum class KvDbBackingKind : core::UInt8
    {
        kMemory     = 0,        // ephemeral, discarded on close
        kFile       = 1
    };

    enum class KvDbState : core::UInt8
    {
        kOpen       = 0,
        kClosed     = 1
    };

    /**
     * @brief Selects the backing of a store
     *
     * An empty path with memory == false, a path of ":memory:" and
     * memory == true all select an in-memory backing. Any other path selects
     * a file. Setting memory together with a non-empty path is rejected by
     * OpenKeyValueDb with KvDbErrc::kInvalidArgument.
     */
    struct KvDbOptions
    {
        core::String                    path;
        core::Bool                      memory{ false };

        static KvDbOptions Memory() noexcept
        {
            KvDbOptions options;
            options.memory = true;
            return options;
        }

        static KvDbOptions Path( core::StringView strPath )
        {
            KvDbOptions options;
            options.path = core::String( strPath );
            return options;
        }
    };

    /**
     * @brief Engine tuning, loaded from the "kvdb" module of core::ConfigManager
     */
    struct KvDbConfig
    {
        core::String                    journalMode{ LAP_KVDB_DEFAULT_JOURNAL_MODE };
        core::String                    synchronous{ LAP_KVDB_DEFAULT_SYNCHRONOUS };
        core::Int32                     cacheSize{ LAP_KVDB_DEFAULT_CACHE_SIZE };
        core::Int32                     busyTimeoutMs{ LAP_KVDB_DEFAULT_BUSY_TIMEOUT_MS };
    };

} // kvdb
} // lap

#endif
