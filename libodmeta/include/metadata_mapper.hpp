/**
 * @file metadata_mapper.hpp
 * @brief Typed access to the metadata fields of a meta.xml tree.
 */

#ifndef ODMETA_METADATA_MAPPER_HPP
#define ODMETA_METADATA_MAPPER_HPP

#include "metadata_fields.hpp"
#include "parsed_document.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace odmeta {

/**
 * @brief Reads and writes metadata fields of a ParsedDocument in place.
 *
 * @details The mapper is a view: every call walks the current tree, so
 * changes made to the document between calls are visible. It keeps a
 * reference to the document and must not outlive it. Not thread-safe and
 * not reentrant.
 *
 * Elements and attributes are matched by their qualified name as written
 * in the document (e.g. "dc:title").
 */
class MetadataMapper {
public:
    /// Separator placed between the values of a multi-valued read.
    static constexpr std::string_view kSeparator = ", ";

    explicit MetadataMapper(ParsedDocument& document) noexcept : document_(document) {}

    // --- generic access ---

    /**
     * @brief Text content of every element named @p tag, in document order,
     * joined with kSeparator. Empty if there is none.
     */
    [[nodiscard]] std::string read_single(std::string_view tag) const;

    /**
     * @brief Value of @p attribute_name on every element named
     * @p container_tag, joined with kSeparator.
     *
     * Elements without the attribute contribute neither a value nor a
     * separator, so three matches with two attributes give "a, b".
     */
    [[nodiscard]] std::string read_attribute(std::string_view container_tag,
                                             std::string_view attribute_name) const;

    /**
     * @brief Sets the text of the first element named @p tag.
     *
     * Does nothing when @p value is std::nullopt; an empty string is written.
     * When no such element exists, one is appended to the office:meta
     * container.
     *
     * @throws StructuralError if the element must be created and the
     * document has no office:meta element.
     */
    MetadataMapper& write_single(std::string_view tag, const std::optional<std::string>& value);

    /**
     * @brief Replaces every element named @p tag by one element per
     * comma-separated token of @p value.
     *
     * Does nothing when @p value is std::nullopt. Tokens are not trimmed.
     * A value with no comma yields one token, even when empty; otherwise
     * trailing empty tokens are dropped.
     *
     * @throws StructuralError if the document has no office:meta element.
     * @throws std::invalid_argument if @p tag names office:meta or one of
     * its ancestors.
     * The tree is not modified in either case.
     */
    MetadataMapper& write_multi_valued(std::string_view tag, const std::optional<std::string>& value);

    /**
     * @brief Detaches and frees every element named @p tag. Idempotent.
     */
    MetadataMapper& remove_all(std::string_view tag);

    // --- table-driven access ---

    /**
     * @brief Reads a field according to its descriptor.
     */
    [[nodiscard]] std::string read_field(const FieldDescriptor& field) const;

    /**
     * @brief Writes a field according to its descriptor.
     * @throws std::invalid_argument if the field is read-only.
     * @throws StructuralError as write_single / write_multi_valued.
     */
    MetadataMapper& write_field(const FieldDescriptor& field, const std::optional<std::string>& value);

    /**
     * @brief Every field of kFields with its current value, in table order.
     */
    [[nodiscard]] std::vector<std::pair<std::string, std::string>> snapshot() const;

    // --- named fields ---

    [[nodiscard]] std::string title() const { return read_single(tags::kTitle); }
    [[nodiscard]] std::string description() const { return read_single(tags::kDescription); }
    [[nodiscard]] std::string subject() const { return read_single(tags::kSubject); }
    [[nodiscard]] std::string author() const { return read_single(tags::kAuthor); }
    [[nodiscard]] std::string keywords() const { return read_single(tags::kKeyword); }

    /**
     * @brief Creation date as "dd/MM/yyyy HH:mm".
     *
     * If the stored value is not an ISO-8601 local date-time it is
     * returned unchanged. Never throws on bad input.
     */
    [[nodiscard]] std::string creation_date() const;

    [[nodiscard]] std::string table_count() const { return read_attribute(tags::kStatistics, tags::kTableCount); }
    [[nodiscard]] std::string image_count() const { return read_attribute(tags::kStatistics, tags::kImageCount); }
    [[nodiscard]] std::string page_count() const { return read_attribute(tags::kStatistics, tags::kPageCount); }
    [[nodiscard]] std::string paragraph_count() const { return read_attribute(tags::kStatistics, tags::kParagraphCount); }
    [[nodiscard]] std::string word_count() const { return read_attribute(tags::kStatistics, tags::kWordCount); }
    [[nodiscard]] std::string character_count() const { return read_attribute(tags::kStatistics, tags::kCharacterCount); }
    [[nodiscard]] std::string non_whitespace_character_count() const {
        return read_attribute(tags::kStatistics, tags::kNonWhitespaceCharacterCount);
    }
    [[nodiscard]] std::string hyperlinks() const { return read_attribute(tags::kHyperlink, tags::kHyperlinkTarget); }

    MetadataMapper& set_title(const std::optional<std::string>& v) { return write_single(tags::kTitle, v); }
    MetadataMapper& set_description(const std::optional<std::string>& v) { return write_single(tags::kDescription, v); }
    MetadataMapper& set_subject(const std::optional<std::string>& v) { return write_single(tags::kSubject, v); }
    MetadataMapper& set_author(const std::optional<std::string>& v) { return write_single(tags::kAuthor, v); }
    MetadataMapper& set_keywords(const std::optional<std::string>& v) { return write_multi_valued(tags::kKeyword, v); }

private:
    [[nodiscard]] std::vector<xmlNode*> find_all(std::string_view tag) const;
    [[nodiscard]] xmlNode* find_first(std::string_view tag) const;
    [[nodiscard]] xmlNode* require_container() const;
    [[nodiscard]] xmlNode* new_element(xmlNode* container, std::string_view tag,
                                       const std::string& text) const;

    ParsedDocument& document_;
};

/**
 * @brief Reformats an ISO-8601 local date-time to "dd/MM/yyyy HH:mm".
 * @return std::nullopt if @p raw is not a valid local date-time.
 */
[[nodiscard]] std::optional<std::string> format_creation_date(std::string_view raw);

/**
 * @brief Splits @p value on ',' the way write_multi_valued does.
 */
[[nodiscard]] std::vector<std::string> split_multi_value(std::string_view value);

} // namespace odmeta

#endif // ODMETA_METADATA_MAPPER_HPP
