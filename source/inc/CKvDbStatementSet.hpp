/**
 * @file CKvDbStatementSet.hpp
 * @brief The prepared statements of a key-value database
 * @version 0.1
 * @date 2026-10-16
 *
 * Every operation of the store is one parameterized statement against the
 * "data" table, prepared once when the database is opened and reused until it
 * is closed.
 */
#ifndef LAP_KVDB_KVDBSTATEMENTSET_HPP
#define LAP_KVDB_KVDBSTATEMENTSET_HPP

#include <optional>
#include <sqlite3.h>
#include <lap/core/CResult.hpp>
#include <lap/core/CMemory.hpp>

#include "CDataType.hpp"

namespace lap
{
namespace kvdb
{
    class KvDbConnection;

    enum class KvDbQuery : core::UInt8
    {
        kClear      = 0,
        kDelete     = 1,
        kEntries    = 2,
        kGet        = 3,
        kHas        = 4,
        kKeys       = 5,
        kSet        = 6,
        kSize       = 7,
        kValues     = 8,

        kCount
    };

    class KvDbStatementSet final
    {
    private:
        // only the factory can build one
        struct ConstructionToken { explicit ConstructionToken() = default; };

    public:
        IMP_OPERATOR_NEW(KvDbStatementSet)

    public:
        static core::Result< core::UniqueHandle< KvDbStatementSet > >   prepare( KvDbConnection &connection ) noexcept;

        static const core::Char*                                        sql( KvDbQuery query ) noexcept;

        core::Result< void >                                            Clear() noexcept;
        core::Result< void >                                            Delete( core::StringView key ) noexcept;
        core::Result< ::std::optional< core::String > >                 Get( core::StringView key ) noexcept;
        core::Result< core::Bool >                                      Has( core::StringView key ) noexcept;
        core::Result< void >                                            Set( core::StringView key, core::StringView value ) noexcept;
        core::Result< core::UInt64 >                                    Size() noexcept;

        /**
         * @brief Get a statement to run a sequence query on
         *
         * The shared prepared statement is leased when no other sequence holds
         * it, otherwise a private statement is prepared so that sequences stay
         * independent of each other.
         *
         * @param query one of kKeys, kValues or kEntries
         * @param bLeased set to true when the shared statement was leased
         */
        core::Result< sqlite3_stmt* >                                   acquireCursor( KvDbQuery query, core::Bool &bLeased ) noexcept;
        void                                                            releaseCursor( KvDbQuery query, sqlite3_stmt* stmt, core::Bool bLeased ) noexcept;

        /**
         * @brief Finalize the prepared statements and every private cursor statement
         */
        void                                                            finalize() noexcept;
        core::Bool                                                      isFinalized() const noexcept            { return m_bFinalized; }

        KvDbConnection&                                                 connection() const noexcept             { return m_connection; }
        core::Size                                                      privateCursorCount() const noexcept     { return m_privateStmts.size(); }

        KvDbStatementSet( ConstructionToken, KvDbConnection &connection ) noexcept;
        ~KvDbStatementSet() noexcept;

    private:

        KvDbStatementSet( const KvDbStatementSet& ) = delete;
        KvDbStatementSet& operator=( const KvDbStatementSet& ) = delete;

        sqlite3_stmt*                       statement( KvDbQuery query ) const noexcept     { return m_pStmts[ static_cast< core::Size >( query ) ]; }
        core::Result< void >                runToCompletion( sqlite3_stmt* stmt ) noexcept;
        core::Result< core::UInt64 >        fetchCount( sqlite3_stmt* stmt ) noexcept;

    private:
        static constexpr core::Size         s_queryCount = static_cast< core::Size >( KvDbQuery::kCount );

        KvDbConnection&                     m_connection;
        sqlite3_stmt*                       m_pStmts[ s_queryCount ]{};
        core::Bool                          m_bLeased[ s_queryCount ]{};
        core::Vector< sqlite3_stmt* >       m_privateStmts;
        core::Bool                          m_bFinalized{ false };
    };
} // kvdb
} // lap

#endif
