#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

#include <json/json.h>


namespace quizpager
{
/**
 * @param errors Receives the parser messages on failure if not null.
 * @return The parsed document or nothing if @p text is not valid JSON.
 */
[[nodiscard]] inline std::optional<Json::Value>
parseJson( std::string_view text,
           std::string*     errors = nullptr )
{
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    const std::unique_ptr<Json::CharReader> reader( builder.newCharReader() );

    Json::Value root;
    std::string parseErrors;
    if ( !reader->parse( text.data(), text.data() + text.size(), &root, &parseErrors ) ) {
        if ( errors != nullptr ) {
            *errors = std::move( parseErrors );
        }
        return std::nullopt;
    }
    return root;
}


/**
 * @param indentation An empty string writes everything in one line.
 */
[[nodiscard]] inline std::string
toJsonString( const Json::Value& value,
              const std::string& indentation = "  " )
{
    Json::StreamWriterBuilder builder;
    builder["indentation"] = indentation;
    builder["emitUTF8"] = true;
    return Json::writeString( builder, value );
}


/**
 * @return The member as unsigned integer or nothing if it is missing or not a non-negative integer.
 *         Integral floating point values like 120.0 are accepted.
 */
[[nodiscard]] inline std::optional<size_t>
getUnsigned( const Json::Value& object,
             const char*        key )
{
    if ( !object.isObject() || !object.isMember( key ) ) {
        return std::nullopt;
    }
    const auto& value = object[key];
    if ( value.isUInt64() ) {
        return static_cast<size_t>( value.asUInt64() );
    }
    return std::nullopt;
}
}  // namespace quizpager
