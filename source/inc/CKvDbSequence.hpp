/**
 * @file CKvDbSequence.hpp
 * @brief Lazy, single-pass sequences over the keys, values or entries
 * @version 0.1
 * @date 2026-10-16
 *
 *
 */
#ifndef LAP_KVDB_KVDBSEQUENCE_HPP
#define LAP_KVDB_KVDBSEQUENCE_HPP

#include <functional>
#include <iterator>
#include <lap/core/CResult.hpp>
#include <lap/core/CMemory.hpp>

#include "CDataType.hpp"
#include "CKvDbCursor.hpp"
#include "CKvDbSession.hpp"

namespace lap
{
namespace kvdb
{
    /**
     * @brief A forward-only sequence of decoded rows
     *
     * No statement is executed before the first call to Next(). Copies of a
     * sequence, and iterators obtained from it, share the same position.
     *
     * @tparam T element type, a key, a value or a KvDbEntry
     */
    template< class T >
    class KvDbSequence final
    {
    public:
        using ValueType     = T;
        using Decoder       = ::std::function< core::Result< T >( const KvDbCursor& ) >;

    private:
        struct State
        {
            core::SharedHandle< KvDbSession >       pSession;
            KvDbQuery                               eQuery;
            Decoder                                 decoder;
            core::UniqueHandle< KvDbCursor >        pCursor;
            T                                       current{};
            core::Bool                              bStarted{ false };
            core::Bool                              bFinished{ false };
        };

    public:
        /**
         * @brief Input iterator for range-for loops
         *
         * Iteration has no result channel, errors are thrown as KvDbException.
         */
        class Iterator
        {
        public:
            using iterator_category     = ::std::input_iterator_tag;
            using value_type            = T;
            using difference_type       = ::std::ptrdiff_t;
            using pointer               = const T*;
            using reference             = const T&;

            Iterator() noexcept = default;

            reference operator*() const noexcept                { return m_pState->current; }
            pointer operator->() const noexcept                 { return &m_pState->current; }

            Iterator& operator++()
            {
                advance();
                return *this;
            }

            void operator++( int )
            {
                advance();
            }

            friend core::Bool operator==( const Iterator &lhs, const Iterator &rhs ) noexcept     { return lhs.m_pState == rhs.m_pState; }
            friend core::Bool operator!=( const Iterator &lhs, const Iterator &rhs ) noexcept     { return lhs.m_pState != rhs.m_pState; }

        private:
            friend class KvDbSequence;

            explicit Iterator( core::SharedHandle< State > pState )
                : m_pState( ::std::move( pState ) )
            {
                advance();
            }

            void advance()
            {
                auto next = KvDbSequence::step( *m_pState );
                if ( !next.HasValue() ) {
                    m_pState.reset();
                    throw KvDbException( next.Error() );
                }

                if ( !next.Value() ) m_pState.reset();
            }

        private:
            core::SharedHandle< State >         m_pState;
        };

    public:
        KvDbSequence( core::SharedHandle< KvDbSession > session, KvDbQuery query, Decoder decoder )
            : m_pState( ::std::make_shared< State >() )
        {
            m_pState->pSession  = ::std::move( session );
            m_pState->eQuery    = query;
            m_pState->decoder   = ::std::move( decoder );
        }

        /**
         * @brief Move to the next element
         *
         * The first call executes the query.
         *
         * @return core::Result<core::Bool> false once the sequence is exhausted
         * @retval KvDbErrc::kDatabaseClosed when the database was closed meanwhile
         */
        core::Result< core::Bool >  Next() noexcept                         { return step( *m_pState ); }

        /**
         * @brief Element the last successful Next() moved to
         */
        const T&                    Current() const noexcept                { return m_pState->current; }

        /**
         * @brief Drain the remaining elements into a vector
         */
        core::Result< core::Vector< T > > Collect() noexcept
        {
            using result = core::Result< core::Vector< T > >;

            core::Vector< T > items;
            for ( ;; ) {
                auto next = Next();
                if ( !next.HasValue() ) return result::FromError( next.Error() );
                if ( !next.Value() ) break;

                items.push_back( Current() );
            }

            return result::FromValue( ::std::move( items ) );
        }

        Iterator                    begin()                                 { return Iterator( m_pState ); }
        Iterator                    end() noexcept                          { return Iterator(); }

    private:
        static core::Result< core::Bool > step( State &state ) noexcept
        {
            using result = core::Result< core::Bool >;

            if ( !state.pSession->isOpen() ) {
                state.pCursor.reset();
                return result::FromError( MakeErrorCode( KvDbErrc::kDatabaseClosed, 0 ) );
            }

            if ( state.bFinished ) return result::FromValue( false );

            if ( !state.bStarted ) {
                state.bStarted = true;

                auto cursor = KvDbCursor::open( state.pSession, state.eQuery );
                if ( !cursor.HasValue() ) {
                    state.bFinished = true;
                    return result::FromError( cursor.Error() );
                }
                state.pCursor = ::std::move( cursor ).Value();
            }

            auto row = state.pCursor->step();
            if ( !row.HasValue() || !row.Value() ) {
                state.bFinished = true;
                state.pCursor.reset();
                return row;
            }

            auto decoded = state.decoder( *state.pCursor );
            if ( !decoded.HasValue() ) {
                state.bFinished = true;
                state.pCursor.reset();
                return result::FromError( decoded.Error() );
            }

            state.current = ::std::move( decoded ).Value();
            return result::FromValue( true );
        }

    private:
        core::SharedHandle< State >         m_pState;
    };
} // kvdb
} // lap

#endif
