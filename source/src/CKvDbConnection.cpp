#include <sys/stat.h>
#include <unistd.h>
#include "CKvDbConnection.hpp"
#include "CKvDbConfig.hpp"

namespace lap
{
namespace kvdb
{
    // ==================== Constructor/Destructor ====================

    KvDbConnection::KvDbConnection( ConstructionToken, KvDbBackingKind kind, core::StringView file ) noexcept
        : m_eKind( kind )
        , m_strFile( file )
    {
        ;
    }

    KvDbConnection::~KvDbConnection() noexcept
    {
        close( false );
    }

    // ==================== Open ====================

    core::Result< KvDbBackingKind > KvDbConnection::resolveBacking( const KvDbOptions &options ) noexcept
    {
        using result = core::Result< KvDbBackingKind >;

        if ( options.memory ) {
            if ( !options.path.empty() ) {
                LAP_KVDB_LOG_ERROR << "Options select both an in-memory backing and the path: " << options.path;
                return result::FromError( MakeErrorCode( KvDbErrc::kInvalidArgument, 0 ) );
            }

            return result::FromValue( KvDbBackingKind::kMemory );
        }

        if ( options.path.empty() || options.path == LAP_KVDB_MEMORY_PATH ) {
            return result::FromValue( KvDbBackingKind::kMemory );
        }

        return result::FromValue( KvDbBackingKind::kFile );
    }

    core::Result< core::UniqueHandle< KvDbConnection > > KvDbConnection::open( const KvDbOptions &options, const KvDbConfig &config ) noexcept
    {
        using result = core::Result< core::UniqueHandle< KvDbConnection > >;

        auto kind = resolveBacking( options );
        if ( !kind.HasValue() ) {
            return result::FromError( kind.Error() );
        }

        auto validateResult = ValidateKvDbConfig( config );
        if ( !validateResult.HasValue() ) {
            return result::FromError( validateResult.Error() );
        }

        core::StringView file = ( kind.Value() == KvDbBackingKind::kMemory ) ? core::StringView( LAP_KVDB_MEMORY_PATH ) : core::StringView( options.path );
        auto connection = ::std::make_unique< KvDbConnection >( ConstructionToken(), kind.Value(), file );

        auto initResult = connection->initializeDatabase( config );
        if ( !initResult.HasValue() ) {
            return result::FromError( initResult.Error() );
        }

        LAP_KVDB_LOG_INFO << "SQLite backing opened: " << connection->path();
        return result::FromValue( ::std::move( connection ) );
    }

    // ==================== Database Initialization ====================

    core::Result< void > KvDbConnection::initializeDatabase( const KvDbConfig &config ) noexcept
    {
        core::Int32 flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
        if ( m_eKind == KvDbBackingKind::kMemory ) {
            flags |= SQLITE_OPEN_MEMORY;
        }

        core::Int32 rc = sqlite3_open_v2( m_strFile.c_str(), &m_pDB, flags, nullptr );

        if ( rc != SQLITE_OK )
        {
            // the error has to be captured before the handle is released
            core::ErrorCode error = makeErrorCode( rc );
            LAP_KVDB_LOG_ERROR << "Failed to open SQLite database '" << m_strFile << "': "
                               << ( m_pDB ? sqlite3_errmsg( m_pDB ) : sqlite3_errstr( rc ) );
            if ( m_pDB )
            {
                sqlite3_close( m_pDB );
                m_pDB = nullptr;
            }
            return core::Result< void >::FromError( error );
        }

        sqlite3_extended_result_codes( m_pDB, 1 );

        applyPragmas( config );

        const char* createTableSQL =
            "CREATE TABLE IF NOT EXISTS " LAP_KVDB_TABLE_NAME " ("
            "    key TEXT PRIMARY KEY,"
            "    value TEXT NOT NULL"
            ");";

        auto createResult = execute( createTableSQL );
        if ( !createResult.HasValue() )
        {
            LAP_KVDB_LOG_ERROR << "Failed to create table in: " << m_strFile;
            sqlite3_close( m_pDB );
            m_pDB = nullptr;
            return createResult;
        }

        return core::Result< void >::FromValue();
    }

    void KvDbConnection::applyPragmas( const KvDbConfig &config ) noexcept
    {
        if ( config.busyTimeoutMs > 0 ) {
            sqlite3_busy_timeout( m_pDB, config.busyTimeoutMs );
        }

        core::String pragmas[] = {
            // an in-memory database only knows the MEMORY and OFF journals
            ( m_eKind == KvDbBackingKind::kFile ) ? "PRAGMA journal_mode=" + config.journalMode + ";" : core::String(),
            "PRAGMA synchronous=" + config.synchronous + ";",
            "PRAGMA cache_size=" + ::std::to_string( config.cacheSize ) + ";"
        };

        for ( auto&& pragma : pragmas )
        {
            if ( pragma.empty() ) continue;

            char* errMsg = nullptr;
            core::Int32 rc = sqlite3_exec( m_pDB, pragma.c_str(), nullptr, nullptr, &errMsg );
            if ( rc != SQLITE_OK )
            {
                LAP_KVDB_LOG_WARN << "Failed to apply '" << pragma << "': " << ( errMsg ? errMsg : "unknown error" );
            }
            if ( errMsg ) sqlite3_free( errMsg );
        }
    }

    // ==================== Statement Execution ====================

    core::Result< void > KvDbConnection::execute( const core::Char* sql ) noexcept
    {
        if ( !m_pDB ) return core::Result< void >::FromError( MakeErrorCode( KvDbErrc::kDatabaseClosed, 0 ) );

        char* errMsg = nullptr;
        core::Int32 rc = sqlite3_exec( m_pDB, sql, nullptr, nullptr, &errMsg );

        if ( rc != SQLITE_OK )
        {
            LAP_KVDB_LOG_ERROR << "Failed to execute statement: " << ( errMsg ? errMsg : "unknown error" );
            if ( errMsg ) sqlite3_free( errMsg );
            return core::Result< void >::FromError( makeErrorCode( rc ) );
        }

        return core::Result< void >::FromValue();
    }

    core::Result< sqlite3_stmt* > KvDbConnection::prepare( const core::Char* sql ) noexcept
    {
        using result = core::Result< sqlite3_stmt* >;

        if ( !m_pDB ) return result::FromError( MakeErrorCode( KvDbErrc::kDatabaseClosed, 0 ) );

        sqlite3_stmt* stmt = nullptr;
        core::Int32 rc = sqlite3_prepare_v3( m_pDB, sql, -1, SQLITE_PREPARE_PERSISTENT, &stmt, nullptr );
        if ( rc != SQLITE_OK )
        {
            LAP_KVDB_LOG_ERROR << "Failed to prepare statement: " << sqlite3_errmsg( m_pDB );
            return result::FromError( makeErrorCode( rc ) );
        }

        return result::FromValue( stmt );
    }

    // ==================== Close ====================

    void KvDbConnection::close( core::Bool bForce ) noexcept
    {
        if ( !m_pDB ) return;

        if ( bForce )
        {
            sqlite3_interrupt( m_pDB );

            sqlite3_stmt* stmt = nullptr;
            while ( ( stmt = sqlite3_next_stmt( m_pDB, nullptr ) ) != nullptr )
            {
                sqlite3_finalize( stmt );
            }
        }

        core::Int32 rc = sqlite3_close( m_pDB );
        if ( rc == SQLITE_BUSY )
        {
            LAP_KVDB_LOG_WARN << "Statements still attached to '" << m_strFile << "', closing once they are finalized";
            sqlite3_close_v2( m_pDB );
        }

        m_pDB = nullptr;
        LAP_KVDB_LOG_DEBUG << "SQLite database closed: " << m_strFile;
    }

    // ==================== Error Handling ====================

    core::Bool KvDbConnection::isParentUnwritable() const noexcept
    {
        if ( m_eKind != KvDbBackingKind::kFile ) return false;

        core::String::size_type pos = m_strFile.find_last_of( '/' );
        core::String parent = ( pos == core::String::npos ) ? core::String( "." )
                            : ( pos == 0 ) ? core::String( "/" )
                            : m_strFile.substr( 0, pos );

        struct stat st;
        if ( ::stat( parent.c_str(), &st ) != 0 || !S_ISDIR( st.st_mode ) ) return false;

        return ::access( parent.c_str(), W_OK ) != 0;
    }

    core::ErrorCode KvDbConnection::makeErrorCode( core::Int32 sqliteCode ) const noexcept
    {
        core::Int32 extended = m_pDB ? sqlite3_extended_errcode( m_pDB ) : sqliteCode;
        if ( ( extended & 0xff ) != ( sqliteCode & 0xff ) ) extended = sqliteCode;

        KvDbErrc errc = KvDbErrc::kPhysicalStorageFailure;

        switch ( sqliteCode & 0xff )
        {
            case SQLITE_FULL:
            case SQLITE_TOOBIG:
                errc = KvDbErrc::kOutOfStorageSpace;
                break;
            case SQLITE_CORRUPT:
            case SQLITE_FORMAT:
            case SQLITE_NOTADB:
                errc = KvDbErrc::kIntegrityCorrupted;
                break;
            case SQLITE_BUSY:
            case SQLITE_LOCKED:
                errc = KvDbErrc::kResourceBusy;
                break;
            case SQLITE_PERM:
            case SQLITE_AUTH:
            case SQLITE_READONLY:
                errc = KvDbErrc::kPermissionDenied;
                break;
            case SQLITE_CANTOPEN:
            {
                core::Int32 sysErr = m_pDB ? sqlite3_system_errno( m_pDB ) : 0;
                if ( sysErr == EACCES || sysErr == EPERM || sysErr == EROFS ) {
                    errc = KvDbErrc::kPermissionDenied;
                } else if ( sysErr == ENOENT && isParentUnwritable() ) {
                    // the engine retries read-only after EACCES, which leaves ENOENT behind
                    errc = KvDbErrc::kPermissionDenied;
                } else if ( sysErr == ENOENT || sysErr == ENOTDIR ) {
                    errc = KvDbErrc::kStorageNotFound;
                }
                break;
            }
            default:
                break;
        }

        return MakeErrorCode( errc, static_cast< core::ErrorDomain::SupportDataType >( extended ) );
    }

} // kvdb
} // lap
