#include "CKvDbCodec.hpp"

namespace lap
{
namespace kvdb
{
    core::Result< core::String > KvDbTextCodec::encode( const core::String &value ) noexcept
    {
        return core::Result< core::String >::FromValue( value );
    }

    core::Result< core::String > KvDbTextCodec::decode( core::String text ) noexcept
    {
        return core::Result< core::String >::FromValue( ::std::move( text ) );
    }

    core::Result< core::String > KvDbJsonCodec::encode( const JsonValue &value ) noexcept
    {
        try {
            return core::Result< core::String >::FromValue( value.dump() );
        } catch ( const nlohmann::json::exception &e ) {
            // invalid UTF-8 in a string value
            LAP_KVDB_LOG_ERROR << "Failed to serialize JSON value: " << e.what();
            return core::Result< core::String >::FromError( MakeErrorCode( KvDbErrc::kInvalidArgument, e.id ) );
        } catch ( const ::std::exception &e ) {
            LAP_KVDB_LOG_ERROR << "Failed to serialize JSON value: " << e.what();
            return core::Result< core::String >::FromError( MakeErrorCode( KvDbErrc::kInvalidArgument, 0 ) );
        }
    }

    core::Result< JsonValue > KvDbJsonCodec::decode( core::String text ) noexcept
    {
        try {
            return core::Result< JsonValue >::FromValue( JsonValue::parse( text ) );
        } catch ( const nlohmann::json::exception &e ) {
            LAP_KVDB_LOG_WARN << "Stored value is not JSON text: " << e.what();
            return core::Result< JsonValue >::FromError( MakeErrorCode( KvDbErrc::kDataTypeMismatch, e.id ) );
        } catch ( const ::std::exception &e ) {
            LAP_KVDB_LOG_WARN << "Stored value is not JSON text: " << e.what();
            return core::Result< JsonValue >::FromError( MakeErrorCode( KvDbErrc::kDataTypeMismatch, 0 ) );
        }
    }

} // kvdb
} // lap
