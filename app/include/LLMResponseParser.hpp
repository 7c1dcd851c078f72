#ifndef LLM_RESPONSE_PARSER_HPP
#define LLM_RESPONSE_PARSER_HPP

#include <json/json.h>

#include <optional>
#include <string>

struct JsonParseResult {
    std::optional<Json::Value> value;
    std::string error;

    bool ok() const { return value.has_value(); }
};

namespace LLMResponseParser {

// Removes a leading ```json / ``` fence and the matching closing fence.
std::string strip_markdown_fences(const std::string& response);

// Parses the first JSON object in a model reply. Failure is reported in the result, never thrown.
JsonParseResult parse_json_object(const std::string& response);

// First non-empty line with surrounding quotes, list markers and punctuation removed.
std::string clean_single_line(const std::string& response);

} // namespace LLMResponseParser

#endif
