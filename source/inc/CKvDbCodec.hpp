/**
 * @file CKvDbCodec.hpp
 * @brief Value codecs of the string view and the JSON view
 * @version 0.1
 * @date 2026-10-16
 *
 * A codec turns the stored text into the value type of a view and back.
 * Absent keys are reported as a LookupType built by absent().
 */
#ifndef LAP_KVDB_KVDBCODEC_HPP
#define LAP_KVDB_KVDBCODEC_HPP

#include <optional>
#include <lap/core/CResult.hpp>

#include "CDataType.hpp"

namespace lap
{
namespace kvdb
{
    struct KvDbTextCodec
    {
        using ValueType     = core::String;
        using LookupType    = ::std::optional< core::String >;

        static core::Result< core::String >     encode( const core::String &value ) noexcept;
        static core::Result< core::String >     decode( core::String text ) noexcept;

        static LookupType                       present( core::String value ) noexcept     { return LookupType( ::std::move( value ) ); }
        static LookupType                       absent() noexcept                          { return ::std::nullopt; }
    };

    /**
     * @brief JSON text on disk, nlohmann::json in memory
     *
     * An absent key looks up as JSON null, the same as a stored null.
     */
    struct KvDbJsonCodec
    {
        using ValueType     = JsonValue;
        using LookupType    = JsonValue;

        static core::Result< core::String >     encode( const JsonValue &value ) noexcept;

        /**
         * @retval KvDbErrc::kDataTypeMismatch when the text is not valid JSON
         */
        static core::Result< JsonValue >        decode( core::String text ) noexcept;

        static LookupType                       present( JsonValue value ) noexcept        { return value; }
        static LookupType                       absent() noexcept                          { return JsonValue(); }
    };
} // kvdb
} // lap

#endif
