#ifndef BEAMPROTO_JSON_UTIL_HPP
#define BEAMPROTO_JSON_UTIL_HPP

#include <json/json.h>

#include <memory>
#include <string>

namespace BeamProto {
namespace detail {

    // Single-line JSON without trailing newline.
    inline std::string write_compact_json(const Json::Value& value) {
        Json::StreamWriterBuilder builder;
        builder["indentation"] = "";
        return Json::writeString(builder, value);
    }

    inline bool parse_json(const char* begin, const char* end, Json::Value& out, std::string& errors) {
        Json::CharReaderBuilder builder;
        builder["collectComments"] = false;
        std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
        return reader->parse(begin, end, &out, &errors);
    }

    inline bool parse_json(const std::string& text, Json::Value& out, std::string& errors) {
        return parse_json(text.data(), text.data() + text.size(), out, errors);
    }

} // namespace detail
} // namespace BeamProto

#endif // BEAMPROTO_JSON_UTIL_HPP
