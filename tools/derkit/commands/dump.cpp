/**
 * derkit CLI - dump command
 *
 * Print the TLV tree of a DER/BER file without a schema.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

#include <cstdlib>
#include <optional>

namespace derkit::cli::commands {

namespace {

struct DumpCommandOptions {
    std::string input;
    std::string options_file;
    size_t max_depth = 0;   // 0 keeps the configured value
    bool hex = false;
    bool expand = false;
};

int cmd_dump(const GlobalOptions& opts, const DumpCommandOptions& dump_opts) {
    init_logging(opts);

    std::optional<DecodeOptions> file_options;
    if (!dump_opts.options_file.empty()) {
        auto content = read_text_file(dump_opts.options_file);
        if (!content) {
            print_error("Failed to read options file: " + dump_opts.options_file, opts.json);
            return 1;
        }
        auto parsed = parse_decode_options(*content);
        if (!parsed.ok) {
            print_error("Invalid options file: " + parsed.error, opts.json);
            return 1;
        }
        for (const auto& warning : parsed.warnings) {
            spdlog::warn("{}: {}", dump_opts.options_file, warning);
        }
        spdlog::debug("Loaded options from {}", dump_opts.options_file);
        spdlog::debug("optional_policy={} is not used by dump",
                      optional_policy_to_string(parsed.options.optional_policy));
        file_options = parsed.options;
    }
    DumpOptions options = make_dump_options(file_options, dump_opts.max_depth, dump_opts.expand);

    std::vector<uint8_t> bytes;
    if (dump_opts.hex) {
        auto text = read_text_file(dump_opts.input);
        if (!text) {
            print_error("Failed to read file: " + dump_opts.input, opts.json);
            return 1;
        }
        auto decoded = parse_hex(*text);
        if (!decoded) {
            print_error("Invalid hex input: " + dump_opts.input, opts.json);
            return 1;
        }
        bytes = std::move(*decoded);
    } else {
        auto content = read_binary_file(dump_opts.input);
        if (!content) {
            print_error("Failed to read file: " + dump_opts.input, opts.json);
            return 1;
        }
        bytes = std::move(*content);
    }

    spdlog::debug("Read {} bytes from {}", bytes.size(), dump_opts.input);
    spdlog::debug("max_depth={} expand_encapsulated={}", options.max_depth, options.expand_encapsulated);

    auto result = dump_der(ByteView(bytes), options);
    if (!result.ok) {
        spdlog::error("{}: {}", dump_opts.input, result.error);
    }

    return write_dump(result, opts.json, std::cout);
}

} // anonymous namespace

void setup_dump(CLI::App* app, GlobalOptions& opts) {
    static DumpCommandOptions dump_opts;

    app->add_option("file", dump_opts.input, "DER file to inspect")->required();
    app->add_flag("--hex", dump_opts.hex, "Input file holds hex text");
    app->add_flag("--expand", dump_opts.expand, "Show DER nested in OCTET/BIT STRINGs");
    app->add_option("--max-depth", dump_opts.max_depth, "Maximum nesting depth");
    app->add_option("--options", dump_opts.options_file, "Decode options JSON file (only max_depth applies)");

    app->callback([&opts]() {
        std::exit(cmd_dump(opts, dump_opts));
    });
}

} // namespace derkit::cli::commands
