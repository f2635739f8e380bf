/**
 * @file CKvDbCursor.hpp
 * @brief Forward-only cursor over the rows of one sequence query
 * @version 0.1
 * @date 2026-10-16
 *
 *
 */
#ifndef LAP_KVDB_KVDBCURSOR_HPP
#define LAP_KVDB_KVDBCURSOR_HPP

#include <sqlite3.h>
#include <lap/core/CResult.hpp>
#include <lap/core/CMemory.hpp>

#include "CDataType.hpp"
#include "CKvDbStatementSet.hpp"

namespace lap
{
namespace kvdb
{
    class KvDbSession;

    /**
     * @brief One execution of a keys/values/entries query
     *
     * The cursor checks the session on every step, so stepping a cursor of a
     * closed session fails with KvDbErrc::kDatabaseClosed even when the
     * cursor was opened before the close. The statement goes back to the
     * statement set as soon as the last row has been read.
     */
    class KvDbCursor final
    {
    private:
        // only the factory can build one
        struct ConstructionToken { explicit ConstructionToken() = default; };

    public:
        IMP_OPERATOR_NEW(KvDbCursor)

    public:
        static core::Result< core::UniqueHandle< KvDbCursor > >         open( core::SharedHandle< KvDbSession > session, KvDbQuery query ) noexcept;

        /**
         * @brief Advance to the next row
         *
         * @return core::Result<core::Bool> true when a row is available, false at the end
         */
        core::Result< core::Bool >                                      step() noexcept;

        /**
         * @brief Text of a column of the current row
         */
        core::String                                                    columnText( core::Int32 column ) const;

        inline core::Bool                                               exhausted() const noexcept              { return m_bDone; }

        KvDbCursor( ConstructionToken, core::SharedHandle< KvDbSession > session, KvDbQuery query, sqlite3_stmt* stmt, core::Bool bLeased ) noexcept;
        ~KvDbCursor() noexcept;

    private:

        KvDbCursor( const KvDbCursor& ) = delete;
        KvDbCursor& operator=( const KvDbCursor& ) = delete;

        void                                release() noexcept;

    private:
        core::SharedHandle< KvDbSession >   m_pSession;
        KvDbQuery                           m_eQuery;
        sqlite3_stmt*                       m_pStmt{ nullptr };
        core::Bool                          m_bLeased{ false };
        core::Bool                          m_bDone{ false };
    };
} // kvdb
} // lap

#endif
