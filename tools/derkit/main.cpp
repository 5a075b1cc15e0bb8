/**
 * derkit CLI - Entry Point
 *
 * Inspect DER/BER encoded ASN.1 data.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

// Forward declarations for commands
namespace derkit::cli::commands {
    void setup_dump(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace derkit::cli;

    CLI::App app{"derkit - DER/BER ASN.1 inspection"};
    app.set_version_flag("-V,--version", DERKIT_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Debug diagnostics on stderr");
    app.add_flag("-q,--quiet", opts.quiet, "Errors only");

    auto* dump_cmd = app.add_subcommand("dump", "Print the TLV structure of a DER file");
    commands::setup_dump(dump_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
