#include <iostream>
#include <filesystem>
#include <memory>
#include <string>
#include <CLI/CLI.hpp>
#include "cli/cli_parser.hpp"
#include "utils/console_log_sink.hpp"
#include "utils/file_log_sink.hpp"
#include "../../libodmeta/include/errors.hpp"
#include "../../libodmeta/include/logger.hpp"
#include "../../libodmeta/include/mime_detector.hpp"
#include "../../libodmeta/include/odt_session.hpp"

using namespace odmeta;
namespace fs = std::filesystem;

namespace {

constexpr int kExitFailure = 1;
constexpr int kExitParseError = 2;

void setup_logging(const Settings& settings) {
    Logger::clear_sinks();

    if (!settings.log_file.empty()) {
        auto fileSink = std::make_unique<FileLogSink>(settings.log_file.string(), false);
        if (!fileSink->is_open()) {
            std::cerr << "Warning: can't open log file " << settings.log_file.string() << std::endl;
        }
        Logger::add_sink(std::move(fileSink));
    }

    if (!settings.quiet && settings.log_level != "NONE") {
        auto consoleSink = std::make_unique<ConsoleLogSink>();
        consoleSink->log_level = Logger::string_to_level(settings.log_level);
        Logger::add_sink(std::move(consoleSink));
    }
}

void apply_edits(MetadataMapper& metadata, const Settings& settings) {
    metadata.set_title(settings.title)
            .set_description(settings.description)
            .set_subject(settings.subject)
            .set_author(settings.author)
            .set_keywords(settings.keywords);
    if (settings.remove_keywords) {
        metadata.remove_all(tags::kKeyword);
    }
}

void print_fields(const OdtSession& session) {
    for (const auto& [name, value] : session.snapshot()) {
        std::cout << name << ": " << value << "\n";
    }
    std::cout.flush();
}

} // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"odmeta: read and edit the metadata of OpenDocument text files."};
    Settings settings;
    setup_cli_parser(app, settings);

    try {
        app.parse(argc, argv);
    }
    catch (const CLI::ParseError &e) {
        return app.exit(e);
    }

    setup_logging(settings);

    const std::string mime = MimeDetector::detect(settings.input);
    if (mime.empty()) {
        Logger::log(LogLevel::Debug, "MIME detection unavailable for " + settings.input.string(), "main");
    } else if (!MimeDetector::is_opendocument(mime)) {
        Logger::log(LogLevel::Warning,
                    settings.input.filename().string() + " does not look like an OpenDocument file (" + mime + ")",
                    "main");
    }

    try {
        OdtSession session(settings.input);
        apply_edits(session.metadata(), settings);

        if (!settings.quiet) {
            print_fields(session);
        }

        if (!settings.dry_run && (settings.has_edits() || !settings.output_path.empty())) {
            const fs::path target = settings.output_path.empty() ? settings.input : settings.output_path;
            session.commit(target);
        }
    } catch (const ParseError& e) {
        Logger::log(LogLevel::Error, e.what(), "main");
        std::cerr << "Error: " << e.what() << std::endl;
        return kExitParseError;
    } catch (const Error& e) {
        Logger::log(LogLevel::Error, e.what(), "main");
        std::cerr << "Error: " << e.what() << std::endl;
        return kExitFailure;
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, std::string("Unexpected error: ") + e.what(), "main");
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return kExitFailure;
    }

    return 0;
}
