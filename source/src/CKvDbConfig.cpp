#include <lap/core/CConfig.hpp>
#include "CKvDbConfig.hpp"

namespace lap
{
namespace kvdb
{
    namespace
    {
        const core::Char* const s_journalModes[] = { "DELETE", "TRUNCATE", "PERSIST", "MEMORY", "WAL", "OFF" };
        const core::Char* const s_synchronousLevels[] = { "OFF", "NORMAL", "FULL", "EXTRA" };

        template< core::Size N >
        core::Bool isOneOf( const core::String &value, const core::Char* const ( &candidates )[N] ) noexcept
        {
            for ( auto&& candidate : candidates ) {
                if ( value == candidate ) return true;
            }

            return false;
        }
    }

    core::Result< KvDbConfig > LoadKvDbConfig() noexcept
    {
        using result = core::Result< KvDbConfig >;

        try {
            auto& configMgr = core::ConfigManager::getInstance();
            auto moduleConfig = configMgr.getModuleConfigJson( LAP_KVDB_CONFIG_MODULE );

            if ( moduleConfig.is_null() || moduleConfig.empty() ) {
                LAP_KVDB_LOG_WARN << "KVDB module config not found, using defaults";
                return result::FromValue( KvDbConfig{} );
            }

            return ParseKvDbConfig( moduleConfig );
        } catch ( const std::exception& e ) {
            LAP_KVDB_LOG_ERROR << "Failed to load kvdb config: " << e.what();
            return result::FromError( MakeErrorCode( KvDbErrc::kInvalidArgument, 0 ) );
        }
    }

    core::Result< KvDbConfig > ParseKvDbConfig( const nlohmann::json &moduleConfig ) noexcept
    {
        using result = core::Result< KvDbConfig >;

        KvDbConfig config;

        if ( moduleConfig.is_null() ) return result::FromValue( config );

        if ( !moduleConfig.is_object() ) {
            LAP_KVDB_LOG_ERROR << "KVDB module config must be a JSON object";
            return result::FromError( MakeErrorCode( KvDbErrc::kInvalidArgument, 0 ) );
        }

        try {
            config.journalMode      = moduleConfig.value( "journalMode", core::String( LAP_KVDB_DEFAULT_JOURNAL_MODE ) );
            config.synchronous      = moduleConfig.value( "synchronous", core::String( LAP_KVDB_DEFAULT_SYNCHRONOUS ) );
            config.cacheSize        = moduleConfig.value( "cacheSize", core::Int32( LAP_KVDB_DEFAULT_CACHE_SIZE ) );
            config.busyTimeoutMs    = moduleConfig.value( "busyTimeoutMs", core::Int32( LAP_KVDB_DEFAULT_BUSY_TIMEOUT_MS ) );
        } catch ( const nlohmann::json::exception& e ) {
            LAP_KVDB_LOG_ERROR << "Malformed kvdb config: " << e.what();
            return result::FromError( MakeErrorCode( KvDbErrc::kInvalidArgument, 0 ) );
        }

        auto validateResult = ValidateKvDbConfig( config );
        if ( !validateResult.HasValue() ) {
            return result::FromError( validateResult.Error() );
        }

        return result::FromValue( config );
    }

    core::Result< void > ValidateKvDbConfig( const KvDbConfig &config ) noexcept
    {
        using result = core::Result< void >;

        if ( !isOneOf( config.journalMode, s_journalModes ) ) {
            LAP_KVDB_LOG_ERROR << "Invalid journalMode: " << config.journalMode;
            return result::FromError( MakeErrorCode( KvDbErrc::kInvalidArgument, 0 ) );
        }

        if ( !isOneOf( config.synchronous, s_synchronousLevels ) ) {
            LAP_KVDB_LOG_ERROR << "Invalid synchronous level: " << config.synchronous;
            return result::FromError( MakeErrorCode( KvDbErrc::kInvalidArgument, 0 ) );
        }

        if ( config.busyTimeoutMs < 0 ) {
            LAP_KVDB_LOG_ERROR << "busyTimeoutMs cannot be negative: " << config.busyTimeoutMs;
            return result::FromError( MakeErrorCode( KvDbErrc::kInvalidArgument, 0 ) );
        }

        return result::FromValue();
    }

} // kvdb
} // lap
