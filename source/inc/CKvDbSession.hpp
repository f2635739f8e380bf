/**
 * @file CKvDbSession.hpp
 * @brief Lifecycle of an opened key-value database
 * @version 0.1
 * @date 2026-10-16
 *
 * A session owns the SQLite connection and the prepared statements of one
 * opened database. Views, sequences and cursors share the session and ask it
 * for the statements on every call, so a close is observed by handles that
 * were obtained before it.
 *
 *      kOpen  --close()-->  kClosed
 *
 * kClosed is terminal.
 */
#ifndef LAP_KVDB_KVDBSESSION_HPP
#define LAP_KVDB_KVDBSESSION_HPP

#include <lap/core/CResult.hpp>
#include <lap/core/CMemory.hpp>

#include "CDataType.hpp"
#include "CKvDbConnection.hpp"
#include "CKvDbStatementSet.hpp"

namespace lap
{
namespace kvdb
{
    class KvDbSession final
    {
    private:
        // only the factory can build one
        struct ConstructionToken { explicit ConstructionToken() = default; };

    public:
        IMP_OPERATOR_NEW(KvDbSession)

    public:
        static core::Result< core::SharedHandle< KvDbSession > >        open( const KvDbOptions &options, const KvDbConfig &config ) noexcept;

        inline KvDbState                                                state() const noexcept                  { return m_eState; }
        inline core::Bool                                               isOpen() const noexcept                 { return m_eState == KvDbState::kOpen; }
        inline KvDbBackingKind                                          backingKind() const noexcept            { return m_pConnection->backingKind(); }
        inline const core::String&                                      path() const noexcept                   { return m_pConnection->path(); }

        /**
         * @brief Statements of the open database
         *
         * @retval KvDbErrc::kDatabaseClosed once the session is closed
         */
        core::Result< KvDbStatementSet* >                               statements() noexcept;

        /**
         * @brief Finalize every statement, release the connection and enter kClosed
         *
         * @param bForce passed through to the connection, discards in-flight work
         * @note Closing a closed session does nothing
         */
        void                                                            close( core::Bool bForce = false ) noexcept;

        KvDbSession( ConstructionToken, core::UniqueHandle< KvDbConnection > connection, core::UniqueHandle< KvDbStatementSet > statements ) noexcept;
        ~KvDbSession() noexcept;

    private:

        KvDbSession( const KvDbSession& ) = delete;
        KvDbSession& operator=( const KvDbSession& ) = delete;

    private:
        // destroyed in reverse order: statements go before their connection
        core::UniqueHandle< KvDbConnection >        m_pConnection;
        core::UniqueHandle< KvDbStatementSet >      m_pStatements;
        KvDbState                                   m_eState{ KvDbState::kOpen };
    };
} // kvdb
} // lap

#endif
