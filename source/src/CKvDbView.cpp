#include "CKvDbView.hpp"

namespace lap
{
namespace kvdb
{
    // ==================== Shared Operations ====================

    core::Result< void > KvDbBaseView::Clear() noexcept
    {
        auto stmts = statements();
        if ( !stmts.HasValue() ) return core::Result< void >::FromError( stmts.Error() );

        return stmts.Value()->Clear();
    }

    core::Result< void > KvDbBaseView::Delete( core::StringView key ) noexcept
    {
        auto stmts = statements();
        if ( !stmts.HasValue() ) return core::Result< void >::FromError( stmts.Error() );

        return stmts.Value()->Delete( key );
    }

    core::Result< core::Bool > KvDbBaseView::Has( core::StringView key ) noexcept
    {
        auto stmts = statements();
        if ( !stmts.HasValue() ) return core::Result< core::Bool >::FromError( stmts.Error() );

        return stmts.Value()->Has( key );
    }

    core::Result< core::UInt64 > KvDbBaseView::Size() noexcept
    {
        auto stmts = statements();
        if ( !stmts.HasValue() ) return core::Result< core::UInt64 >::FromError( stmts.Error() );

        return stmts.Value()->Size();
    }

    core::Result< KvDbSequence< core::String > > KvDbBaseView::Keys() noexcept
    {
        using result = core::Result< KvDbSequence< core::String > >;

        auto stmts = statements();
        if ( !stmts.HasValue() ) return result::FromError( stmts.Error() );

        return result::FromValue( KvDbSequence< core::String >( session(), KvDbQuery::kKeys,
            []( const KvDbCursor &cursor ) {
                return core::Result< core::String >::FromValue( cursor.columnText( 0 ) );
            } ) );
    }

    // ==================== Typed Operations ====================

    template< class TCodec >
    core::Result< typename KvDbView< TCodec >::LookupType > KvDbView< TCodec >::Get( core::StringView key ) noexcept
    {
        using result = core::Result< LookupType >;

        auto stmts = statements();
        if ( !stmts.HasValue() ) return result::FromError( stmts.Error() );

        auto text = stmts.Value()->Get( key );
        if ( !text.HasValue() ) return result::FromError( text.Error() );

        auto stored = ::std::move( text ).Value();
        if ( !stored.has_value() ) return result::FromValue( TCodec::absent() );

        auto decoded = TCodec::decode( ::std::move( *stored ) );
        if ( !decoded.HasValue() ) return result::FromError( decoded.Error() );

        return result::FromValue( TCodec::present( ::std::move( decoded ).Value() ) );
    }

    template< class TCodec >
    core::Result< void > KvDbView< TCodec >::Set( core::StringView key, const ValueType &value ) noexcept
    {
        auto stmts = statements();
        if ( !stmts.HasValue() ) return core::Result< void >::FromError( stmts.Error() );

        auto encoded = TCodec::encode( value );
        if ( !encoded.HasValue() ) return core::Result< void >::FromError( encoded.Error() );

        return stmts.Value()->Set( key, encoded.Value() );
    }

    template< class TCodec >
    core::Result< KvDbSequence< typename KvDbView< TCodec >::ValueType > > KvDbView< TCodec >::Values() noexcept
    {
        using result = core::Result< KvDbSequence< ValueType > >;

        auto stmts = statements();
        if ( !stmts.HasValue() ) return result::FromError( stmts.Error() );

        return result::FromValue( KvDbSequence< ValueType >( session(), KvDbQuery::kValues,
            []( const KvDbCursor &cursor ) {
                return TCodec::decode( cursor.columnText( 0 ) );
            } ) );
    }

    template< class TCodec >
    core::Result< KvDbSequence< typename KvDbView< TCodec >::EntryType > > KvDbView< TCodec >::Entries() noexcept
    {
        using result = core::Result< KvDbSequence< EntryType > >;

        auto stmts = statements();
        if ( !stmts.HasValue() ) return result::FromError( stmts.Error() );

        return result::FromValue( KvDbSequence< EntryType >( session(), KvDbQuery::kEntries,
            []( const KvDbCursor &cursor ) {
                auto value = TCodec::decode( cursor.columnText( 1 ) );
                if ( !value.HasValue() ) return core::Result< EntryType >::FromError( value.Error() );

                return core::Result< EntryType >::FromValue( EntryType( cursor.columnText( 0 ), ::std::move( value ).Value() ) );
            } ) );
    }

    template< class TCodec >
    typename KvDbView< TCodec >::Iterator KvDbView< TCodec >::begin()
    {
        auto entries = Entries();
        if ( !entries.HasValue() ) throw KvDbException( entries.Error() );

        // the iterator keeps the sequence state alive
        auto sequence = ::std::move( entries ).Value();
        return sequence.begin();
    }

    template class KvDbView< KvDbTextCodec >;
    template class KvDbView< KvDbJsonCodec >;

} // kvdb
} // lap
