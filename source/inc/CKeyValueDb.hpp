/**
 * @file CKeyValueDb.hpp
 * @brief Handle of an opened key-value database
 * @version 0.1
 * @date 2026-10-16
 *
 *
 */
#ifndef LAP_KVDB_KEYVALUEDB_HPP
#define LAP_KVDB_KEYVALUEDB_HPP

#include <lap/core/CResult.hpp>
#include <lap/core/CMemory.hpp>

#include "CDataType.hpp"
#include "CKvDbView.hpp"

namespace lap
{
namespace kvdb
{
    /**
     * @brief The string view of a database, with its JSON view attached
     *
     * Values set with the string view are stored as given. Values set with
     * json() are stored as their JSON text.
     */
    class KeyValueDb final : public KvDbTextView
    {
    public:
        IMP_OPERATOR_NEW(KeyValueDb)

    public:
        explicit KeyValueDb( core::SharedHandle< KvDbSession > session ) noexcept
            : KvDbTextView( session )
            , m_jsonView( ::std::move( session ) )
        {
            ;
        }

        ~KeyValueDb() noexcept override = default;

        inline KvDbJsonView&                                json() noexcept                         { return m_jsonView; }
        inline const KvDbJsonView&                          json() const noexcept                   { return m_jsonView; }

        inline KvDbBackingKind                              GetBackingKind() const noexcept         { return session()->backingKind(); }
        inline const core::String&                          GetPath() const noexcept                { return session()->path(); }
        inline KvDbState                                    GetState() const noexcept               { return session()->state(); }

    private:
        KvDbJsonView                                        m_jsonView;
    };

    /**
     * @brief Open an in-memory database
     */
    core::Result< core::SharedHandle< KeyValueDb > >        OpenKeyValueDb() noexcept;

    /**
     * @brief Open a database file, ":memory:" opens an in-memory database
     */
    core::Result< core::SharedHandle< KeyValueDb > >        OpenKeyValueDb( core::StringView path ) noexcept;
    core::Result< core::SharedHandle< KeyValueDb > >        OpenKeyValueDb( const KvDbOptions &options ) noexcept;

    /**
     * @brief Open a database with explicit engine tuning
     *
     * @retval KvDbErrc::kInvalidArgument for memory together with a path, or an invalid config
     * @retval a backing store error when the file cannot be opened or created
     */
    core::Result< core::SharedHandle< KeyValueDb > >        OpenKeyValueDb( const KvDbOptions &options, const KvDbConfig &config ) noexcept;
} // kvdb
} // lap

#endif
