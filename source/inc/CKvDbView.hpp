/**
 * @file CKvDbView.hpp
 * @brief Typed views over the rows of a key-value database
 * @version 0.1
 * @date 2026-10-16
 *
 * The string view and the JSON view read and write the same rows. A value
 * written through one of them is visible through the other on the next call.
 * Views are cheap to copy; every copy shares the session, and a close through
 * any of them closes the database for all.
 */
#ifndef LAP_KVDB_KVDBVIEW_HPP
#define LAP_KVDB_KVDBVIEW_HPP

#include <lap/core/CResult.hpp>
#include <lap/core/CMemory.hpp>

#include "CDataType.hpp"
#include "CKvDbCodec.hpp"
#include "CKvDbSequence.hpp"
#include "CKvDbSession.hpp"

namespace lap
{
namespace kvdb
{
    /**
     * @brief Operations that do not depend on the value type
     */
    class KvDbBaseView
    {
    public:
        IMP_OPERATOR_NEW(KvDbBaseView)

    public:
        explicit KvDbBaseView( core::SharedHandle< KvDbSession > session ) noexcept
            : m_pSession( ::std::move( session ) )
        {
            ;
        }

        virtual ~KvDbBaseView() noexcept = default;

        core::Result< void >                                Clear() noexcept;

        /**
         * @brief Remove a key, removing an absent key is not an error
         */
        core::Result< void >                                Delete( core::StringView key ) noexcept;
        core::Result< core::Bool >                          Has( core::StringView key ) noexcept;
        core::Result< core::UInt64 >                        Size() noexcept;

        /**
         * @brief The keys in ascending order
         */
        core::Result< KvDbSequence< core::String > >        Keys() noexcept;

        /**
         * @brief Close the database behind every view of it
         *
         * @param bForce interrupt running statements and finalize unfinished sequences
         */
        void                                                Close( core::Bool bForce = false ) noexcept     { m_pSession->close( bForce ); }
        core::Bool                                          IsOpen() const noexcept                         { return m_pSession->isOpen(); }

    protected:
        core::Result< KvDbStatementSet* >                   statements() const noexcept                     { return m_pSession->statements(); }
        const core::SharedHandle< KvDbSession >&            session() const noexcept                        { return m_pSession; }

    private:
        core::SharedHandle< KvDbSession >                   m_pSession;
    };

    template< class TCodec >
    class KvDbView : public KvDbBaseView
    {
    public:
        using Codec             = TCodec;
        using ValueType         = typename TCodec::ValueType;
        using LookupType        = typename TCodec::LookupType;
        using EntryType         = KvDbEntry< ValueType >;
        using Iterator          = typename KvDbSequence< EntryType >::Iterator;

    public:
        explicit KvDbView( core::SharedHandle< KvDbSession > session ) noexcept
            : KvDbBaseView( ::std::move( session ) )
        {
            ;
        }

        ~KvDbView() noexcept override = default;

        core::Result< LookupType >                          Get( core::StringView key ) noexcept;

        /**
         * @brief Insert the key or replace its value
         */
        core::Result< void >                                Set( core::StringView key, const ValueType &value ) noexcept;

        core::Result< KvDbSequence< ValueType > >           Values() noexcept;
        core::Result< KvDbSequence< EntryType > >           Entries() noexcept;

        /**
         * @brief Range-for over the entries
         *
         * @throw KvDbException when the database is closed or a row cannot be read
         */
        Iterator                                            begin();
        Iterator                                            end() noexcept                                  { return Iterator(); }
    };

    extern template class KvDbView< KvDbTextCodec >;
    extern template class KvDbView< KvDbJsonCodec >;

    using KvDbTextView  = KvDbView< KvDbTextCodec >;
    using KvDbJsonView  = KvDbView< KvDbJsonCodec >;
} // kvdb
} // lap

#endif
