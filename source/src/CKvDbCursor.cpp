#include "CKvDbCursor.hpp"
#include "CKvDbSession.hpp"

namespace lap
{
namespace kvdb
{
    KvDbCursor::KvDbCursor( ConstructionToken, core::SharedHandle< KvDbSession > session, KvDbQuery query, sqlite3_stmt* stmt, core::Bool bLeased ) noexcept
        : m_pSession( ::std::move( session ) )
        , m_eQuery( query )
        , m_pStmt( stmt )
        , m_bLeased( bLeased )
    {
        ;
    }

    KvDbCursor::~KvDbCursor() noexcept
    {
        release();
    }

    core::Result< core::UniqueHandle< KvDbCursor > > KvDbCursor::open( core::SharedHandle< KvDbSession > session, KvDbQuery query ) noexcept
    {
        using result = core::Result< core::UniqueHandle< KvDbCursor > >;

        auto statements = session->statements();
        if ( !statements.HasValue() ) {
            return result::FromError( statements.Error() );
        }

        core::Bool bLeased = false;
        auto stmt = statements.Value()->acquireCursor( query, bLeased );
        if ( !stmt.HasValue() ) {
            return result::FromError( stmt.Error() );
        }

        auto cursor = ::std::make_unique< KvDbCursor >( ConstructionToken(), ::std::move( session ), query, stmt.Value(), bLeased );
        return result::FromValue( ::std::move( cursor ) );
    }

    void KvDbCursor::release() noexcept
    {
        if ( !m_pStmt ) return;

        // a closed session has already finalized the statement
        auto statements = m_pSession->statements();
        if ( statements.HasValue() ) {
            statements.Value()->releaseCursor( m_eQuery, m_pStmt, m_bLeased );
        }

        m_pStmt = nullptr;
    }

    core::Result< core::Bool > KvDbCursor::step() noexcept
    {
        using result = core::Result< core::Bool >;

        auto statements = m_pSession->statements();
        if ( !statements.HasValue() ) {
            m_pStmt = nullptr;
            return result::FromError( statements.Error() );
        }

        if ( m_bDone ) return result::FromValue( false );

        core::Int32 rc = sqlite3_step( m_pStmt );

        if ( rc == SQLITE_ROW ) {
            return result::FromValue( true );
        }

        m_bDone = true;

        if ( rc == SQLITE_DONE ) {
            release();
            return result::FromValue( false );
        }

        auto error = statements.Value()->connection().makeErrorCode( rc );
        LAP_KVDB_LOG_ERROR << "Failed to step '" << KvDbStatementSet::sql( m_eQuery ) << "': "
                           << sqlite3_errmsg( statements.Value()->connection().handle() );
        release();
        return result::FromError( error );
    }

    core::String KvDbCursor::columnText( core::Int32 column ) const
    {
        const char* text = reinterpret_cast< const char* >( sqlite3_column_text( m_pStmt, column ) );
        if ( !text ) return core::String();

        return core::String( text, static_cast< core::Size >( sqlite3_column_bytes( m_pStmt, column ) ) );
    }

} // kvdb
} // lap
