/**
 * @file CKvDbErrorDomain.hpp
 * @brief Error domain of the KVDB module
 * @version 0.1
 * @date 2026-10-16
 *
 *
 */
#ifndef LAP_KVDB_KVDBERRORDOMAIN_HPP
#define LAP_KVDB_KVDBERRORDOMAIN_HPP

#include <exception>
#include <cerrno>
#include <cstring>
#include <lap/core/CTypedef.hpp>
#include <lap/core/CErrorCode.hpp>
#include <lap/core/CException.hpp>
#include <lap/core/CMemory.hpp>

namespace lap
{
namespace kvdb
{
    enum class KvDbErrc : core::ErrorDomain::CodeType
    {
        kDatabaseClosed             = 1,
        kPhysicalStorageFailure     = 2,
        kPermissionDenied           = 3,
        kStorageNotFound            = 4,
        kIntegrityCorrupted         = 5,
        kResourceBusy               = 6,
        kOutOfStorageSpace          = 7,
        kInvalidArgument            = 8,
        kDataTypeMismatch           = 9
    };

    inline constexpr const core::Char* KvDbErrMessage( KvDbErrc errCode )
    {
        switch ( errCode ) {
        case KvDbErrc::kDatabaseClosed:
            return "Database is closed";
        case KvDbErrc::kPhysicalStorageFailure:
            return "Access to the backing store fails.";
        case KvDbErrc::kPermissionDenied:
            return std::strerror( EACCES );
        case KvDbErrc::kStorageNotFound:
            return "The backing store cannot be found or created at the given path.";
        case KvDbErrc::kIntegrityCorrupted:
            return "Stored data cannot be read because the structural integrity is corrupted.";
        case KvDbErrc::kResourceBusy:
            return "The backing store is locked by another connection.";
        case KvDbErrc::kOutOfStorageSpace:
            return "The available storage space is insufficient for the added/updated values.";
        case KvDbErrc::kInvalidArgument:
            return "Invalid argument provided to the function.";
        case KvDbErrc::kDataTypeMismatch:
            return "The stored value is not valid JSON text.";
        default:
            return "Unknown error";
        }
    }

    class KvDbException : public core::Exception
    {
    public:
        IMP_OPERATOR_NEW(KvDbException)

        explicit KvDbException ( core::ErrorCode errorCode ) noexcept
            : core::Exception( errorCode )
        {
            ;
        }

        ~KvDbException() noexcept
        {
            ;
        }

        const core::Char* what() const noexcept
        {
            return KvDbErrMessage( static_cast< KvDbErrc > ( Error().Value() ) );
        }
    };

    class KvDbErrorDomain final : public core::ErrorDomain
    {
    public:
        IMP_OPERATOR_NEW(KvDbErrorDomain)

        using Errc          = KvDbErrc;
        using Exception     = KvDbException;

    public:
        const core::Char*                       Name () const noexcept override                                             { return "KvDbErrorDomain"; }
        const core::Char*                       Message ( CodeType errorCode ) const noexcept override                      { return KvDbErrMessage( static_cast< Errc >( errorCode ) ); }
        void                                    ThrowAsException ( const core::ErrorCode &errorCode ) const override        { throw KvDbException( errorCode ); }

        constexpr KvDbErrorDomain () noexcept
            : core::ErrorDomain( 0x8000000000000201 )
        {
            ;
        }
    };

    static constexpr KvDbErrorDomain g_kvdbErrorDomain;

    constexpr const core::ErrorDomain& GetKvDbDomain () noexcept
    {
        return g_kvdbErrorDomain;
    }

    constexpr core::ErrorCode MakeErrorCode ( KvDbErrc code, core::ErrorDomain::SupportDataType data ) noexcept
    {
        return { static_cast< core::ErrorDomain::CodeType >( code ), GetKvDbDomain(), data };
    }

    /**
     * @brief True for errors raised by the storage engine or the file system
     *
     * The closed-handle error, caller-contract violations and JSON decode
     * failures are not backing store errors.
     */
    inline core::Bool IsBackingStoreError( const core::ErrorCode &errorCode ) noexcept
    {
        if ( errorCode.Domain() != GetKvDbDomain() ) return false;

        switch ( static_cast< KvDbErrc >( errorCode.Value() ) ) {
        case KvDbErrc::kPhysicalStorageFailure:
        case KvDbErrc::kPermissionDenied:
        case KvDbErrc::kStorageNotFound:
        case KvDbErrc::kIntegrityCorrupted:
        case KvDbErrc::kResourceBusy:
        case KvDbErrc::kOutOfStorageSpace:
            return true;
        default:
            return false;
        }
    }
} // kvdb
} // lap

#endif
