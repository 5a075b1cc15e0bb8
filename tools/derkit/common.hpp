/**
 * derkit CLI - Common utilities and types
 */

#pragma once

#include <derkit/derkit.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cctype>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

namespace derkit::cli {

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

// Verbose shows debug diagnostics, quiet only errors
inline void init_logging(const GlobalOptions& opts) {
    spdlog::set_pattern("[%l] %v");
    if (opts.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (opts.quiet) {
        spdlog::set_level(spdlog::level::err);
    } else {
        spdlog::set_level(spdlog::level::warn);
    }
}

/**
 * File helpers.
 */
inline std::optional<std::vector<uint8_t>> read_binary_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) return std::nullopt;
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

inline std::optional<std::string> read_text_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) return std::nullopt;
    return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

// Decode hex text, ignoring whitespace and an optional "0x" prefix per token
inline std::optional<std::vector<uint8_t>> parse_hex(const std::string& text) {
    std::vector<uint8_t> out;
    int high = -1;
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (std::isspace(static_cast<unsigned char>(c))) continue;
        if (c == '0' && i + 1 < text.size() && (text[i + 1] == 'x' || text[i + 1] == 'X') && high < 0) {
            ++i;
            continue;
        }
        int nibble;
        if (c >= '0' && c <= '9') nibble = c - '0';
        else if (c >= 'a' && c <= 'f') nibble = c - 'a' + 10;
        else if (c >= 'A' && c <= 'F') nibble = c - 'A' + 10;
        else return std::nullopt;

        if (high < 0) {
            high = nibble;
        } else {
            out.push_back(static_cast<uint8_t>((high << 4) | nibble));
            high = -1;
        }
    }
    if (high >= 0) return std::nullopt;
    return out;
}

/**
 * Dump settings: values from the options file, then command-line flags.
 * A max_depth flag of 0 keeps the file's (or default) depth.
 */
inline DumpOptions make_dump_options(const std::optional<DecodeOptions>& file_options,
                                     size_t max_depth_flag, bool expand) {
    DumpOptions options;
    if (file_options) options.max_depth = file_options->max_depth;
    if (max_depth_flag > 0) options.max_depth = max_depth_flag;
    options.expand_encapsulated = expand;
    return options;
}

// Print a dump result; returns the process exit code
inline int write_dump(const DumpResult& result, bool json_mode, std::ostream& out) {
    if (json_mode) {
        out << dump_to_json(result).dump(2) << std::endl;
    } else {
        out << dump_to_text(result);
    }
    return result.ok ? 0 : 1;
}

/**
 * Output utilities.
 */
inline void print_error(const std::string& msg, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

} // namespace derkit::cli
