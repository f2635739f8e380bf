#include "CKvDbSession.hpp"

namespace lap
{
namespace kvdb
{
    KvDbSession::KvDbSession( ConstructionToken, core::UniqueHandle< KvDbConnection > connection, core::UniqueHandle< KvDbStatementSet > statements ) noexcept
        : m_pConnection( ::std::move( connection ) )
        , m_pStatements( ::std::move( statements ) )
    {
        ;
    }

    KvDbSession::~KvDbSession() noexcept
    {
        if ( isOpen() ) {
            LAP_KVDB_LOG_DEBUG << "Session released without close: " << path();
            close( false );
        }
    }

    core::Result< core::SharedHandle< KvDbSession > > KvDbSession::open( const KvDbOptions &options, const KvDbConfig &config ) noexcept
    {
        using result = core::Result< core::SharedHandle< KvDbSession > >;

        auto connection = KvDbConnection::open( options, config );
        if ( !connection.HasValue() ) {
            return result::FromError( connection.Error() );
        }

        core::UniqueHandle< KvDbConnection > pConnection = ::std::move( connection ).Value();

        auto statements = KvDbStatementSet::prepare( *pConnection );
        if ( !statements.HasValue() ) {
            return result::FromError( statements.Error() );
        }

        auto session = ::std::make_shared< KvDbSession >( ConstructionToken(), ::std::move( pConnection ), ::std::move( statements ).Value() );
        return result::FromValue( ::std::move( session ) );
    }

    core::Result< KvDbStatementSet* > KvDbSession::statements() noexcept
    {
        using result = core::Result< KvDbStatementSet* >;

        if ( !isOpen() ) return result::FromError( MakeErrorCode( KvDbErrc::kDatabaseClosed, 0 ) );

        return result::FromValue( m_pStatements.get() );
    }

    void KvDbSession::close( core::Bool bForce ) noexcept
    {
        if ( !isOpen() ) return;

        if ( m_pStatements->privateCursorCount() > 0 ) {
            LAP_KVDB_LOG_DEBUG << "Closing with " << m_pStatements->privateCursorCount() << " private cursor(s) still alive";
        }

        m_pStatements->finalize();
        m_pConnection->close( bForce );
        m_eState = KvDbState::kClosed;

        LAP_KVDB_LOG_INFO << "Key-value database closed: " << path();
    }

} // kvdb
} // lap
