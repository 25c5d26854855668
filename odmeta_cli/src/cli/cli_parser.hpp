#ifndef ODMETA_CLI_PARSER_HPP
#define ODMETA_CLI_PARSER_HPP

#include <filesystem>
#include <optional>
#include <string>

// forward declaration
namespace CLI { class App; }

struct Settings {
    bool dry_run = false;
    bool quiet = false;
    bool remove_keywords = false;

    std::string log_level = "ERROR";
    std::filesystem::path log_file;
    std::filesystem::path output_path;
    std::filesystem::path input;

    // absent means "leave the field alone"
    std::optional<std::string> title;
    std::optional<std::string> description;
    std::optional<std::string> subject;
    std::optional<std::string> author;
    std::optional<std::string> keywords;

    [[nodiscard]] bool has_edits() const {
        return title || description || subject || author || keywords || remove_keywords;
    }
};

/**
 * @brief Configures the CLI11 parser with all options, flags, and arguments.
 * @param app The CLI::App instance to configure.
 * @param settings The Settings struct to map the options to.
 */
void setup_cli_parser(CLI::App& app, Settings& settings);

#endif // ODMETA_CLI_PARSER_HPP
