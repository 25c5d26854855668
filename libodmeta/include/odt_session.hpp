/**
 * @file odt_session.hpp
 * @brief One metadata edit round-trip over an ODT package.
 */

#ifndef ODMETA_ODT_SESSION_HPP
#define ODMETA_ODT_SESSION_HPP

#include "metadata_mapper.hpp"
#include "parsed_document.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace odmeta {

/**
 * @brief Unpacks an ODT, exposes its meta.xml, and repacks it on commit.
 *
 * @details The constructor extracts the package into a private staging
 * directory under the system temp path and loads meta.xml from it. Edits
 * go through metadata(). commit() writes meta.xml back and rebuilds the
 * package. The staging directory is removed when the session ends.
 *
 * content.xml, when present, is loaded read-only: hyperlink targets live
 * in the document body, not in meta.xml.
 *
 * Usage:
 * @code
 * OdtSession session("report.odt");
 * session.metadata().set_title("Quarterly report").set_keywords("finance,q3");
 * session.commit("report.odt");
 * @endcode
 */
class OdtSession {
public:
    /// Location of the metadata document inside the package.
    static constexpr std::string_view kMetaEntry = "meta.xml";
    static constexpr std::string_view kContentEntry = "content.xml";

    /**
     * @brief Opens an ODT package.
     * @param odt_path Package to edit.
     * @throws IoError if the package cannot be unpacked or meta.xml read.
     * @throws ParseError if meta.xml or content.xml is malformed.
     * @throws StructuralError if the package has no meta.xml.
     */
    explicit OdtSession(const std::filesystem::path& odt_path);
    ~OdtSession();

    OdtSession(const OdtSession&) = delete;
    OdtSession& operator=(const OdtSession&) = delete;
    OdtSession(OdtSession&&) = delete;
    OdtSession& operator=(OdtSession&&) = delete;

    [[nodiscard]] MetadataMapper& metadata() noexcept { return mapper_; }
    [[nodiscard]] const MetadataMapper& metadata() const noexcept { return mapper_; }
    [[nodiscard]] ParsedDocument& document() noexcept { return document_; }

    /// Targets of every text:a in content.xml, empty if the package has none.
    [[nodiscard]] std::string hyperlinks() const;

    /**
     * @brief Every field of kFields with its current value, in table order.
     *
     * Same as metadata().snapshot(), except that "hyperlinks" is read
     * from content.xml.
     */
    [[nodiscard]] std::vector<std::pair<std::string, std::string>> snapshot() const;

    [[nodiscard]] const std::filesystem::path& source_path() const noexcept { return source_path_; }
    [[nodiscard]] const std::filesystem::path& staging_dir() const noexcept { return staging_dir_; }

    /**
     * @brief Writes meta.xml back and rebuilds the package at @p output_path.
     *
     * The package is built in a temporary file next to @p output_path and
     * then moved over it, so @p output_path may be the source package.
     *
     * @throws IoError if any step fails; @p output_path is left untouched.
     */
    void commit(const std::filesystem::path& output_path);

private:
    std::filesystem::path source_path_;
    std::filesystem::path staging_dir_;
    ParsedDocument document_;
    std::optional<ParsedDocument> content_;
    MetadataMapper mapper_;
    std::optional<MetadataMapper> content_mapper_;
};

} // namespace odmeta

#endif // ODMETA_ODT_SESSION_HPP
