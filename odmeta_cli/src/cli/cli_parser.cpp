#include "cli_parser.hpp"
#include <CLI/CLI.hpp>

void setup_cli_parser(CLI::App& app, Settings& settings) {
    app.set_help_flag("-h,--help", "Show this help message and exit.");
    app.set_version_flag("--version", "0.1");

    // --- Fields to write ---
    app.add_option("--title", settings.title, "Set the document title.");
    app.add_option("--description", settings.description, "Set the document description.");
    app.add_option("--subject", settings.subject, "Set the document subject.");
    app.add_option("--author", settings.author, "Set the initial creator.");
    auto* keywords = app.add_option("--keywords", settings.keywords,
                                    "Replace the keywords with a comma-separated list.");
    app.add_flag("--remove-keywords", settings.remove_keywords,
                 "Delete every keyword.")
        ->excludes(keywords);

    // --- Flags ---
    app.add_flag("--dry-run", settings.dry_run,
                 "Apply edits in memory and print the result without writing anything.");

    app.add_flag("-q,--quiet", settings.quiet,
                 "Suppress the field listing and console logging.");

    app.add_option("-o,--output", settings.output_path,
                   "Write the edited document to PATH instead of modifying it in place.");

    app.add_option("--log-level", settings.log_level,
                   "Log level: ERROR, WARNING, INFO, DEBUG, NONE.")
        ->default_val("ERROR")
        ->check(CLI::IsMember({"ERROR", "WARNING", "INFO", "DEBUG", "NONE"}, CLI::ignore_case));

    app.add_option("--log-file", settings.log_file,
                   "Write logs to a specific file (default: no file logging).");

    // --- Positional Arguments ---
    app.add_option("input", settings.input, "ODT document to read or edit.")
        ->required()
        ->check(CLI::ExistingFile);

    // --- Cross-validation logic ---
    app.callback([&settings]() {
        if (settings.dry_run && !settings.output_path.empty()) {
            throw CLI::ValidationError("--dry-run and -o, --output cannot be used together.");
        }
        if (!settings.output_path.empty() && std::filesystem::is_directory(settings.output_path)) {
            throw CLI::ValidationError("Output path ('-o') must be a file, not a directory.");
        }
    });
}
