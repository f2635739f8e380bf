#include "CKeyValueDb.hpp"
#include "CKvDbConfig.hpp"

namespace lap
{
namespace kvdb
{
    core::Result< core::SharedHandle< KeyValueDb > > OpenKeyValueDb() noexcept
    {
        return OpenKeyValueDb( KvDbOptions() );
    }

    core::Result< core::SharedHandle< KeyValueDb > > OpenKeyValueDb( core::StringView path ) noexcept
    {
        return OpenKeyValueDb( KvDbOptions::Path( path ) );
    }

    core::Result< core::SharedHandle< KeyValueDb > > OpenKeyValueDb( const KvDbOptions &options ) noexcept
    {
        KvDbConfig config;

        auto configResult = LoadKvDbConfig();
        if ( configResult.HasValue() ) {
            config = configResult.Value();
        } else {
            LAP_KVDB_LOG_WARN << "Using default configuration";
        }

        return OpenKeyValueDb( options, config );
    }

    core::Result< core::SharedHandle< KeyValueDb > > OpenKeyValueDb( const KvDbOptions &options, const KvDbConfig &config ) noexcept
    {
        using result = core::Result< core::SharedHandle< KeyValueDb > >;

        auto session = KvDbSession::open( options, config );
        if ( !session.HasValue() ) {
            return result::FromError( session.Error() );
        }

        auto db = ::std::make_shared< KeyValueDb >( ::std::move( session ).Value() );
        LAP_KVDB_LOG_INFO << "Key-value database opened: " << db->GetPath();

        return result::FromValue( ::std::move( db ) );
    }

} // kvdb
} // lap
