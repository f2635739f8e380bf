/**
 * @file CKvDbConnection.hpp
 * @brief SQLite connection backing a key-value database
 * @version 0.1
 * @date 2026-10-16
 *
 * Opens an in-memory or file backed SQLite handle, applies the engine tuning
 * of KvDbConfig and makes sure the single "data" table exists.
 */
#ifndef LAP_KVDB_KVDBCONNECTION_HPP
#define LAP_KVDB_KVDBCONNECTION_HPP

#include <sqlite3.h>
#include <lap/core/CResult.hpp>
#include <lap/core/CMemory.hpp>

#include "CDataType.hpp"

namespace lap
{
namespace kvdb
{
    class KvDbConnection final
    {
    private:
        // only the factory can build one
        struct ConstructionToken { explicit ConstructionToken() = default; };

    public:
        IMP_OPERATOR_NEW(KvDbConnection)

    public:
        /**
         * @brief Open the backing selected by options
         *
         * @retval KvDbErrc::kInvalidArgument if options select both memory and a path, or config is invalid
         * @retval KvDbErrc::kPermissionDenied, kStorageNotFound, kPhysicalStorageFailure if the engine cannot open the path
         *
         * @note Backing store errors carry the SQLite extended result code as support data
         */
        static core::Result< core::UniqueHandle< KvDbConnection > >     open( const KvDbOptions &options, const KvDbConfig &config ) noexcept;

        /**
         * @brief Resolve which backing the options select, without opening anything
         */
        static core::Result< KvDbBackingKind >                          resolveBacking( const KvDbOptions &options ) noexcept;

        core::Bool                                                      isOpen() const noexcept                 { return m_pDB != nullptr; }
        sqlite3*                                                        handle() const noexcept                 { return m_pDB; }
        KvDbBackingKind                                                 backingKind() const noexcept            { return m_eKind; }
        const core::String&                                             path() const noexcept                   { return m_strFile; }

        core::Result< void >                                            execute( const core::Char* sql ) noexcept;
        core::Result< sqlite3_stmt* >                                   prepare( const core::Char* sql ) noexcept;

        /**
         * @brief Release the handle
         *
         * @param bForce interrupt running statements and finalize every statement
         *               still attached to the handle instead of deferring the close
         */
        void                                                            close( core::Bool bForce = false ) noexcept;

        /**
         * @brief Map a SQLite result code into the KVDB error domain
         */
        core::ErrorCode                                                 makeErrorCode( core::Int32 sqliteCode ) const noexcept;

        KvDbConnection( ConstructionToken, KvDbBackingKind kind, core::StringView file ) noexcept;
        ~KvDbConnection() noexcept;

    private:

        KvDbConnection() = delete;
        KvDbConnection( const KvDbConnection& ) = delete;
        KvDbConnection( KvDbConnection&& ) = delete;
        KvDbConnection& operator=( const KvDbConnection& ) = delete;
        KvDbConnection& operator=( KvDbConnection&& ) = delete;

        core::Result< void >                initializeDatabase( const KvDbConfig &config ) noexcept;
        void                                applyPragmas( const KvDbConfig &config ) noexcept;
        core::Bool                          isParentUnwritable() const noexcept;

    private:
        KvDbBackingKind                     m_eKind{ KvDbBackingKind::kMemory };
        core::String                        m_strFile;
        sqlite3*                            m_pDB{ nullptr };
    };
} // kvdb
} // lap

#endif
