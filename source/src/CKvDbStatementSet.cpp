#include <algorithm>
#include "CKvDbStatementSet.hpp"
#include "CKvDbConnection.hpp"

namespace lap
{
namespace kvdb
{
    namespace
    {
        // indexed by KvDbQuery
        const core::Char* const s_querySql[] = {
            // kClear
            "DELETE FROM " LAP_KVDB_TABLE_NAME ";",
            // kDelete
            "DELETE FROM " LAP_KVDB_TABLE_NAME " WHERE key = ?;",
            // kEntries
            "SELECT key, value FROM " LAP_KVDB_TABLE_NAME " ORDER BY key ASC;",
            // kGet
            "SELECT value FROM " LAP_KVDB_TABLE_NAME " WHERE key = ?;",
            // kHas
            "SELECT COUNT (key) FROM " LAP_KVDB_TABLE_NAME " WHERE key = ?;",
            // kKeys
            "SELECT key FROM " LAP_KVDB_TABLE_NAME " ORDER BY key ASC;",
            // kSet
            "INSERT INTO " LAP_KVDB_TABLE_NAME " (key, value) VALUES (?, ?) "
            "ON CONFLICT (key) DO UPDATE SET value = excluded.value;",
            // kSize
            "SELECT COUNT (key) FROM " LAP_KVDB_TABLE_NAME ";",
            // kValues
            "SELECT value FROM " LAP_KVDB_TABLE_NAME " ORDER BY key ASC;"
        };

        static_assert( sizeof( s_querySql ) / sizeof( s_querySql[0] ) == static_cast< core::Size >( KvDbQuery::kCount ),
                       "one statement per query" );

        inline void bindText( sqlite3_stmt* stmt, core::Int32 index, core::StringView text ) noexcept
        {
            sqlite3_bind_text( stmt, index, text.data(), static_cast< core::Int32 >( text.size() ), SQLITE_STATIC );
        }

        // reset and drop bindings so no borrowed key outlives the call
        inline void recycle( sqlite3_stmt* stmt ) noexcept
        {
            sqlite3_reset( stmt );
            sqlite3_clear_bindings( stmt );
        }

        inline core::Bool isSequence( KvDbQuery query ) noexcept
        {
            return query == KvDbQuery::kKeys || query == KvDbQuery::kValues || query == KvDbQuery::kEntries;
        }
    }

    // ==================== Constructor/Destructor ====================

    KvDbStatementSet::KvDbStatementSet( ConstructionToken, KvDbConnection &connection ) noexcept
        : m_connection( connection )
    {
        ;
    }

    KvDbStatementSet::~KvDbStatementSet() noexcept
    {
        finalize();
    }

    const core::Char* KvDbStatementSet::sql( KvDbQuery query ) noexcept
    {
        return s_querySql[ static_cast< core::Size >( query ) ];
    }

    // ==================== Prepared Statements ====================

    core::Result< core::UniqueHandle< KvDbStatementSet > > KvDbStatementSet::prepare( KvDbConnection &connection ) noexcept
    {
        using result = core::Result< core::UniqueHandle< KvDbStatementSet > >;

        auto statements = ::std::make_unique< KvDbStatementSet >( ConstructionToken(), connection );

        for ( core::Size i = 0; i < s_queryCount; ++i )
        {
            auto stmt = connection.prepare( s_querySql[i] );
            if ( !stmt.HasValue() )
            {
                LAP_KVDB_LOG_ERROR << "Failed to prepare statement #" << i;
                // the statements prepared so far are finalized by the destructor
                return result::FromError( stmt.Error() );
            }

            statements->m_pStmts[i] = stmt.Value();
        }

        return result::FromValue( ::std::move( statements ) );
    }

    void KvDbStatementSet::finalize() noexcept
    {
        if ( m_bFinalized ) return;

        for ( core::Size i = 0; i < s_queryCount; ++i )
        {
            if ( m_pStmts[i] ) { sqlite3_finalize( m_pStmts[i] ); m_pStmts[i] = nullptr; }
            m_bLeased[i] = false;
        }

        for ( auto&& stmt : m_privateStmts )
        {
            sqlite3_finalize( stmt );
        }
        m_privateStmts.clear();

        m_bFinalized = true;
    }

    // ==================== Helpers ====================

    core::Result< void > KvDbStatementSet::runToCompletion( sqlite3_stmt* stmt ) noexcept
    {
        core::Int32 rc = sqlite3_step( stmt );
        core::Result< void > ret = core::Result< void >::FromValue();

        if ( rc != SQLITE_DONE )
        {
            LAP_KVDB_LOG_ERROR << "Failed to execute '" << sqlite3_sql( stmt ) << "': " << sqlite3_errmsg( m_connection.handle() );
            ret = core::Result< void >::FromError( m_connection.makeErrorCode( rc ) );
        }

        recycle( stmt );
        return ret;
    }

    core::Result< core::UInt64 > KvDbStatementSet::fetchCount( sqlite3_stmt* stmt ) noexcept
    {
        using result = core::Result< core::UInt64 >;

        core::Int32 rc = sqlite3_step( stmt );

        if ( rc != SQLITE_ROW )
        {
            LAP_KVDB_LOG_ERROR << "Failed to execute '" << sqlite3_sql( stmt ) << "': " << sqlite3_errmsg( m_connection.handle() );
            auto error = m_connection.makeErrorCode( rc );
            recycle( stmt );
            return result::FromError( error );
        }

        core::UInt64 count = static_cast< core::UInt64 >( sqlite3_column_int64( stmt, 0 ) );
        recycle( stmt );
        return result::FromValue( count );
    }

    // ==================== Operations ====================

    core::Result< void > KvDbStatementSet::Clear() noexcept
    {
        if ( m_bFinalized ) return core::Result< void >::FromError( MakeErrorCode( KvDbErrc::kDatabaseClosed, 0 ) );

        sqlite3_stmt* stmt = statement( KvDbQuery::kClear );
        sqlite3_reset( stmt );

        return runToCompletion( stmt );
    }

    core::Result< void > KvDbStatementSet::Delete( core::StringView key ) noexcept
    {
        if ( m_bFinalized ) return core::Result< void >::FromError( MakeErrorCode( KvDbErrc::kDatabaseClosed, 0 ) );

        sqlite3_stmt* stmt = statement( KvDbQuery::kDelete );
        sqlite3_reset( stmt );
        bindText( stmt, 1, key );

        return runToCompletion( stmt );
    }

    core::Result< ::std::optional< core::String > > KvDbStatementSet::Get( core::StringView key ) noexcept
    {
        using result = core::Result< ::std::optional< core::String > >;

        if ( m_bFinalized ) return result::FromError( MakeErrorCode( KvDbErrc::kDatabaseClosed, 0 ) );

        sqlite3_stmt* stmt = statement( KvDbQuery::kGet );
        sqlite3_reset( stmt );
        bindText( stmt, 1, key );

        core::Int32 rc = sqlite3_step( stmt );

        if ( rc == SQLITE_ROW )
        {
            const char* text = reinterpret_cast< const char* >( sqlite3_column_text( stmt, 0 ) );
            core::String value( text ? text : "", static_cast< core::Size >( sqlite3_column_bytes( stmt, 0 ) ) );
            recycle( stmt );
            return result::FromValue( ::std::optional< core::String >( ::std::move( value ) ) );
        }
        else if ( rc == SQLITE_DONE )
        {
            recycle( stmt );
            return result::FromValue( ::std::optional< core::String >() );
        }
        else
        {
            LAP_KVDB_LOG_ERROR << "Failed to get value for key '" << key << "': " << sqlite3_errmsg( m_connection.handle() );
            auto error = m_connection.makeErrorCode( rc );
            recycle( stmt );
            return result::FromError( error );
        }
    }

    core::Result< core::Bool > KvDbStatementSet::Has( core::StringView key ) noexcept
    {
        using result = core::Result< core::Bool >;

        if ( m_bFinalized ) return result::FromError( MakeErrorCode( KvDbErrc::kDatabaseClosed, 0 ) );

        sqlite3_stmt* stmt = statement( KvDbQuery::kHas );
        sqlite3_reset( stmt );
        bindText( stmt, 1, key );

        auto count = fetchCount( stmt );
        if ( !count.HasValue() ) {
            return result::FromError( count.Error() );
        }

        return result::FromValue( count.Value() == 1 );
    }

    core::Result< void > KvDbStatementSet::Set( core::StringView key, core::StringView value ) noexcept
    {
        if ( m_bFinalized ) return core::Result< void >::FromError( MakeErrorCode( KvDbErrc::kDatabaseClosed, 0 ) );

        sqlite3_stmt* stmt = statement( KvDbQuery::kSet );
        sqlite3_reset( stmt );
        bindText( stmt, 1, key );
        bindText( stmt, 2, value );

        return runToCompletion( stmt );
    }

    core::Result< core::UInt64 > KvDbStatementSet::Size() noexcept
    {
        if ( m_bFinalized ) return core::Result< core::UInt64 >::FromError( MakeErrorCode( KvDbErrc::kDatabaseClosed, 0 ) );

        sqlite3_stmt* stmt = statement( KvDbQuery::kSize );
        sqlite3_reset( stmt );

        return fetchCount( stmt );
    }

    // ==================== Sequence Cursors ====================

    core::Result< sqlite3_stmt* > KvDbStatementSet::acquireCursor( KvDbQuery query, core::Bool &bLeased ) noexcept
    {
        using result = core::Result< sqlite3_stmt* >;

        if ( !isSequence( query ) ) {
            return result::FromError( MakeErrorCode( KvDbErrc::kInvalidArgument, 0 ) );
        }

        if ( m_bFinalized ) {
            return result::FromError( MakeErrorCode( KvDbErrc::kDatabaseClosed, 0 ) );
        }

        const core::Size index = static_cast< core::Size >( query );

        if ( !m_bLeased[index] )
        {
            m_bLeased[index] = true;
            bLeased = true;
            sqlite3_reset( m_pStmts[index] );
            return result::FromValue( m_pStmts[index] );
        }

        auto stmt = m_connection.prepare( s_querySql[index] );
        if ( !stmt.HasValue() ) {
            return result::FromError( stmt.Error() );
        }

        m_privateStmts.push_back( stmt.Value() );
        bLeased = false;
        return result::FromValue( stmt.Value() );
    }

    void KvDbStatementSet::releaseCursor( KvDbQuery query, sqlite3_stmt* stmt, core::Bool bLeased ) noexcept
    {
        if ( m_bFinalized || stmt == nullptr ) return;

        if ( bLeased )
        {
            const core::Size index = static_cast< core::Size >( query );
            sqlite3_reset( m_pStmts[index] );
            m_bLeased[index] = false;
            return;
        }

        auto it = ::std::find( m_privateStmts.begin(), m_privateStmts.end(), stmt );
        if ( it != m_privateStmts.end() )
        {
            sqlite3_finalize( *it );
            m_privateStmts.erase( it );
        }
    }

} // kvdb
} // lap
