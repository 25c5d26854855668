/**
 * @file metadata_fields.hpp
 * @brief The fixed table of ODT metadata fields and their XML names.
 */

#ifndef ODMETA_METADATA_FIELDS_HPP
#define ODMETA_METADATA_FIELDS_HPP

#include <array>
#include <optional>
#include <string_view>

namespace odmeta {

/**
 * @brief Qualified XML names used by meta.xml.
 */
namespace tags {
    inline constexpr std::string_view kMeta = "office:meta";
    inline constexpr std::string_view kTitle = "dc:title";
    inline constexpr std::string_view kDescription = "dc:description";
    inline constexpr std::string_view kSubject = "dc:subject";
    inline constexpr std::string_view kKeyword = "meta:keyword";
    inline constexpr std::string_view kAuthor = "meta:initial-creator";
    inline constexpr std::string_view kCreationDate = "meta:creation-date";
    inline constexpr std::string_view kStatistics = "meta:document-statistic";
    inline constexpr std::string_view kTableCount = "meta:table-count";
    inline constexpr std::string_view kImageCount = "meta:image-count";
    inline constexpr std::string_view kPageCount = "meta:page-count";
    inline constexpr std::string_view kParagraphCount = "meta:paragraph-count";
    inline constexpr std::string_view kWordCount = "meta:word-count";
    inline constexpr std::string_view kCharacterCount = "meta:character-count";
    inline constexpr std::string_view kNonWhitespaceCharacterCount = "meta:non-whitespace-character-count";
    inline constexpr std::string_view kHyperlink = "text:a";
    inline constexpr std::string_view kHyperlinkTarget = "xlink:href";
} // namespace tags

/**
 * @brief How a field is stored in the XML tree.
 */
enum class FieldRepresentation {
    Text,      ///< Text content of the element
    Date,      ///< Text content, reformatted on read
    Attribute  ///< Attribute of the element
};

enum class FieldMultiplicity {
    Single,
    Multi
};

/**
 * @brief Describes one logical metadata field.
 */
struct FieldDescriptor {
    std::string_view name;       ///< Logical name (e.g. "title")
    std::string_view tag;        ///< Element holding the value
    std::string_view attribute;  ///< Attribute name, empty for text fields
    FieldRepresentation representation;
    FieldMultiplicity multiplicity;
    bool writable;
};

inline constexpr std::array<FieldDescriptor, 14> kFields = {{
    {"title", tags::kTitle, {}, FieldRepresentation::Text, FieldMultiplicity::Single, true},
    {"description", tags::kDescription, {}, FieldRepresentation::Text, FieldMultiplicity::Single, true},
    {"subject", tags::kSubject, {}, FieldRepresentation::Text, FieldMultiplicity::Single, true},
    {"keywords", tags::kKeyword, {}, FieldRepresentation::Text, FieldMultiplicity::Multi, true},
    {"author", tags::kAuthor, {}, FieldRepresentation::Text, FieldMultiplicity::Single, true},
    {"creation-date", tags::kCreationDate, {}, FieldRepresentation::Date, FieldMultiplicity::Single, false},
    {"table-count", tags::kStatistics, tags::kTableCount, FieldRepresentation::Attribute, FieldMultiplicity::Single, false},
    {"image-count", tags::kStatistics, tags::kImageCount, FieldRepresentation::Attribute, FieldMultiplicity::Single, false},
    {"page-count", tags::kStatistics, tags::kPageCount, FieldRepresentation::Attribute, FieldMultiplicity::Single, false},
    {"paragraph-count", tags::kStatistics, tags::kParagraphCount, FieldRepresentation::Attribute, FieldMultiplicity::Single, false},
    {"word-count", tags::kStatistics, tags::kWordCount, FieldRepresentation::Attribute, FieldMultiplicity::Single, false},
    {"character-count", tags::kStatistics, tags::kCharacterCount, FieldRepresentation::Attribute, FieldMultiplicity::Single, false},
    {"non-whitespace-character-count", tags::kStatistics, tags::kNonWhitespaceCharacterCount, FieldRepresentation::Attribute, FieldMultiplicity::Single, false},
    {"hyperlinks", tags::kHyperlink, tags::kHyperlinkTarget, FieldRepresentation::Attribute, FieldMultiplicity::Multi, false},
}};

/**
 * @brief Looks up a field by its logical name.
 * @return The descriptor, or std::nullopt for an unknown name.
 */
[[nodiscard]] std::optional<FieldDescriptor> find_field(std::string_view name) noexcept;

} // namespace odmeta

#endif // ODMETA_METADATA_FIELDS_HPP
