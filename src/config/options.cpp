#include "derkit/options.hpp"

#include <algorithm>
#include <cctype>

#include <nlohmann/json.hpp>

namespace derkit {

namespace {

constexpr const char* OPTIONS_SCHEMA = "derkit.decode.options.v1";

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

} // namespace

std::optional<OptionalPolicy> parse_optional_policy(const std::string& s) {
    std::string key = to_lower(trim(s));
    if (key == "catch_all") return OptionalPolicy::CatchAll;
    if (key == "mismatch_only") return OptionalPolicy::MismatchOnly;
    return std::nullopt;
}

bool is_recoverable(ErrorCode error, OptionalPolicy policy) {
    if (policy == OptionalPolicy::CatchAll) return true;
    switch (error) {
        case ErrorCode::Cast:
        case ErrorCode::UnexpectedTag:
        case ErrorCode::NoMatchingVariant:
            return true;
        default:
            return false;
    }
}

const DecodeOptions& default_decode_options() {
    static const DecodeOptions options;
    return options;
}

DecodeOptionsParseResult parse_decode_options(const std::string& json_str) {
    DecodeOptionsParseResult result;

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_object()) {
            result.error = "JSON must be an object";
            return result;
        }

        // $schema (optional, must match when present)
        if (j.contains("$schema")) {
            if (!j["$schema"].is_string() || trim(j["$schema"].get<std::string>()) != OPTIONS_SCHEMA) {
                result.error = std::string("$schema mismatch: expected ") + OPTIONS_SCHEMA;
                return result;
            }
        }

        for (auto& [key, val] : j.items()) {
            if (key == "$schema") continue;

            if (key == "max_depth") {
                if (val.is_number_unsigned() && val.get<uint64_t>() > 0) {
                    result.options.max_depth = static_cast<size_t>(val.get<uint64_t>());
                } else {
                    result.warnings.push_back("invalid_configuration:invalid_max_depth");
                }
            } else if (key == "optional_policy") {
                std::optional<OptionalPolicy> policy;
                if (val.is_string()) policy = parse_optional_policy(val.get<std::string>());
                if (policy) {
                    result.options.optional_policy = *policy;
                } else {
                    result.warnings.push_back("invalid_configuration:invalid_optional_policy");
                }
            } else {
                result.warnings.push_back("invalid_configuration:unknown_key:" + key);
            }
        }

        result.ok = true;
        return result;

    } catch (const nlohmann::json::parse_error& e) {
        result.error = std::string("parse error: ") + e.what();
        return result;
    } catch (const nlohmann::json::exception& e) {
        result.error = std::string("JSON error: ") + e.what();
        return result;
    }
}

} // namespace derkit
