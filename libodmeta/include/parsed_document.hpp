/**
 * @file parsed_document.hpp
 * @brief Owned, mutable XML tree loaded from one file.
 */

#ifndef ODMETA_PARSED_DOCUMENT_HPP
#define ODMETA_PARSED_DOCUMENT_HPP

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <libxml/tree.h>

namespace odmeta {

/**
 * @brief Owns a libxml2 document tree.
 *
 * @details A ParsedDocument always holds a valid tree: the factories throw
 * instead of producing an empty object. The tree is mutated in place by
 * MetadataMapper and written back with save(). Not thread-safe.
 */
class ParsedDocument {
public:
    struct XmlDocDeleter {
        void operator()(xmlDoc* doc) const {
            if (doc) xmlFreeDoc(doc);
        }
    };
    using XmlDocPtr = std::unique_ptr<xmlDoc, XmlDocDeleter>;

    /**
     * @brief Reads and parses an XML file.
     * @param file_path File to load.
     * @throws IoError if the file cannot be read.
     * @throws ParseError if its content is not well-formed XML.
     */
    [[nodiscard]] static ParsedDocument load(const std::filesystem::path& file_path);

    /**
     * @brief Parses an in-memory XML buffer.
     * @param xml Document bytes.
     * @param source_name Name used in error messages.
     * @throws ParseError if the buffer is not well-formed XML.
     */
    [[nodiscard]] static ParsedDocument parse(std::string_view xml,
                                              std::string_view source_name = "memory");

    explicit ParsedDocument(XmlDocPtr tree);

    ParsedDocument(const ParsedDocument&) = delete;
    ParsedDocument& operator=(const ParsedDocument&) = delete;
    ParsedDocument(ParsedDocument&&) noexcept = default;
    ParsedDocument& operator=(ParsedDocument&&) noexcept = default;
    ~ParsedDocument() = default;

    /// @return The backing tree, never null.
    [[nodiscard]] xmlDoc* tree() const noexcept { return tree_.get(); }

    /**
     * @brief Replaces the backing tree, taking ownership of @p tree.
     * @throws std::invalid_argument if @p tree is null.
     */
    void replace_tree(XmlDocPtr tree);

    /**
     * @brief Serializes the tree to UTF-8, XML declaration included.
     */
    [[nodiscard]] std::string serialize() const;

    /**
     * @brief Writes serialize() to a file, replacing its content.
     * @throws IoError if the file cannot be written.
     */
    void save(const std::filesystem::path& file_path) const;

private:
    XmlDocPtr tree_;
};

} // namespace odmeta

#endif // ODMETA_PARSED_DOCUMENT_HPP
