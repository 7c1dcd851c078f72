#include "LLMResponseParser.hpp"
#include "Utils.hpp"

#include <cctype>
#include <memory>
#include <sstream>

namespace {

std::string strip_list_prefix(std::string line) {
    line = Utils::trim_copy(std::move(line));
    if (line.empty()) {
        return line;
    }
    if ((line.front() == '-' || line.front() == '*') && line.size() > 1 &&
        std::isspace(static_cast<unsigned char>(line[1]))) {
        return Utils::trim_copy(line.substr(1));
    }
    size_t idx = 0;
    while (idx < line.size() && std::isdigit(static_cast<unsigned char>(line[idx]))) {
        ++idx;
    }
    if (idx > 0 && idx + 1 < line.size() &&
        (line[idx] == '.' || line[idx] == ')') &&
        std::isspace(static_cast<unsigned char>(line[idx + 1]))) {
        return Utils::trim_copy(line.substr(idx + 1));
    }
    return line;
}

bool is_quote(char ch) {
    return ch == '"' || ch == '\'' || ch == '`';
}

} // namespace

namespace LLMResponseParser {

std::string strip_markdown_fences(const std::string& response)
{
    std::string text = Utils::trim_copy(response);
    if (text.rfind("```", 0) != 0) {
        return text;
    }
    const auto first_newline = text.find('\n');
    if (first_newline == std::string::npos) {
        return Utils::trim_copy(text.substr(3));
    }
    text = text.substr(first_newline + 1);
    const auto closing = text.rfind("```");
    if (closing != std::string::npos) {
        text = text.substr(0, closing);
    }
    return Utils::trim_copy(text);
}

JsonParseResult parse_json_object(const std::string& response)
{
    std::string text = strip_markdown_fences(response);
    if (text.empty()) {
        return {std::nullopt, "Empty response"};
    }

    // Models sometimes wrap the object in prose; keep the outermost braces.
    const auto open = text.find('{');
    const auto close = text.rfind('}');
    if (open == std::string::npos || close == std::string::npos || close < open) {
        return {std::nullopt, "Response does not contain a JSON object"};
    }
    text = text.substr(open, close - open + 1);

    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
        return {std::nullopt, "Invalid JSON: " + Utils::trim_copy(errors)};
    }
    if (!root.isObject()) {
        return {std::nullopt, "JSON response is not an object"};
    }
    return {root, std::string()};
}

std::string clean_single_line(const std::string& response)
{
    std::istringstream iss(strip_markdown_fences(response));
    std::string line;
    while (std::getline(iss, line)) {
        line = strip_list_prefix(std::move(line));
        while (!line.empty() && is_quote(line.front())) {
            line.erase(line.begin());
        }
        while (!line.empty() && (is_quote(line.back()) || line.back() == '.')) {
            line.pop_back();
        }
        line = Utils::trim_copy(std::move(line));
        if (!line.empty()) {
            return line;
        }
    }
    return std::string();
}

} // namespace LLMResponseParser
