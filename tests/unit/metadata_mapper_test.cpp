#include <gtest/gtest.h>

#include <libxml/parser.h>

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "errors.hpp"
#include "metadata_mapper.hpp"
#include "parsed_document.hpp"
#include "test_utils/test_helpers.hpp"

using namespace odmeta;
using namespace odmeta::test;

namespace {

constexpr const char* kNamespaces =
    R"(xmlns:office="urn:oasis:names:tc:opendocument:xmlns:office:1.0" )"
    R"(xmlns:xlink="http://www.w3.org/1999/xlink" )"
    R"(xmlns:dc="http://purl.org/dc/elements/1.1/" )"
    R"(xmlns:meta="urn:oasis:names:tc:opendocument:xmlns:meta:1.0" )"
    R"(xmlns:text="urn:oasis:names:tc:opendocument:xmlns:text:1.0")";

/// Wraps @p body in an office:document-meta root carrying the usual prefixes.
std::string metaDocument(const std::string& body) {
    return std::string("<office:document-meta ") + kNamespaces + ">" + body + "</office:document-meta>";
}

std::size_t countOccurrences(const std::string& haystack, const std::string& needle) {
    std::size_t count = 0;
    for (auto pos = haystack.find(needle); pos != std::string::npos; pos = haystack.find(needle, pos + 1)) {
        ++count;
    }
    return count;
}

class MetadataMapperTest : public ::testing::Test {
protected:
    ParsedDocument doc = ParsedDocument::parse(kSampleMetaXml);
    MetadataMapper mapper{doc};
};

} // namespace

// --- reads ---

TEST_F(MetadataMapperTest, ReadsTextFields) {
    EXPECT_EQ(mapper.title(), "Annual Report");
    EXPECT_EQ(mapper.description(), "Numbers and prose");
    EXPECT_EQ(mapper.subject(), "Finance");
    EXPECT_EQ(mapper.author(), "Ada Lovelace");
}

TEST_F(MetadataMapperTest, JoinsRepeatedElementsInDocumentOrder) {
    EXPECT_EQ(mapper.keywords(), "alpha, beta");
}

TEST_F(MetadataMapperTest, ReadsStatisticsAttributes) {
    EXPECT_EQ(mapper.table_count(), "2");
    EXPECT_EQ(mapper.image_count(), "1");
    EXPECT_EQ(mapper.page_count(), "5");
    EXPECT_EQ(mapper.paragraph_count(), "40");
    EXPECT_EQ(mapper.word_count(), "1200");
    EXPECT_EQ(mapper.character_count(), "7000");
    EXPECT_EQ(mapper.non_whitespace_character_count(), "5800");
}

TEST_F(MetadataMapperTest, MissingFieldsReadAsEmpty) {
    EXPECT_EQ(mapper.hyperlinks(), "");
    EXPECT_EQ(mapper.read_single("dc:language"), "");
    EXPECT_EQ(mapper.read_attribute(tags::kStatistics, "meta:frame-count"), "");
}

TEST_F(MetadataMapperTest, CreationDateDropsSecondsAndFraction) {
    EXPECT_EQ(mapper.creation_date(), "01/05/2023 10:00");
}

TEST(MetadataMapperStandaloneTest, AttributeReadSkipsElementsWithoutTheAttribute) {
    auto doc = ParsedDocument::parse(metaDocument(
        R"(<office:meta>)"
        R"(<text:a xlink:href="http://a.example">A</text:a>)"
        R"(<text:a>no target</text:a>)"
        R"(<text:a xlink:href="http://c.example">C</text:a>)"
        R"(</office:meta>)"));

    EXPECT_EQ(MetadataMapper(doc).hyperlinks(), "http://a.example, http://c.example");
}

TEST(MetadataMapperStandaloneTest, AttributeReadKeepsEmptyValues) {
    auto doc = ParsedDocument::parse(metaDocument(
        R"(<office:meta><text:a xlink:href="">x</text:a><text:a xlink:href="b">y</text:a></office:meta>)"));

    EXPECT_EQ(MetadataMapper(doc).hyperlinks(), ", b");
}

TEST(MetadataMapperStandaloneTest, MatchesQualifiedNamesAsWritten) {
    auto doc = ParsedDocument::parse(
        R"(<root xmlns:other="http://purl.org/dc/elements/1.1/"><other:title>hidden</other:title></root>)");

    EXPECT_EQ(MetadataMapper(doc).title(), "");
    EXPECT_EQ(MetadataMapper(doc).read_single("other:title"), "hidden");
}

// --- creation date formatting ---

TEST(FormatCreationDateTest, AcceptsLocalDateTimes) {
    EXPECT_EQ(format_creation_date("2023-05-01T10:00:00"), "01/05/2023 10:00");
    EXPECT_EQ(format_creation_date("2023-05-01T10:00"), "01/05/2023 10:00");
    EXPECT_EQ(format_creation_date("1999-12-31T23:59:59.5"), "31/12/1999 23:59");
    EXPECT_EQ(format_creation_date("2024-02-29T07:05:00.123456789"), "29/02/2024 07:05");
}

TEST(FormatCreationDateTest, RejectsEverythingElse) {
    EXPECT_EQ(format_creation_date(""), std::nullopt);
    EXPECT_EQ(format_creation_date("yesterday"), std::nullopt);
    EXPECT_EQ(format_creation_date("2023-05-01"), std::nullopt);
    EXPECT_EQ(format_creation_date("2023-05-01T10:00:00Z"), std::nullopt);
    EXPECT_EQ(format_creation_date("2023-05-01T10:00:00+02:00"), std::nullopt);
    EXPECT_EQ(format_creation_date("2023-02-30T10:00:00"), std::nullopt);
    EXPECT_EQ(format_creation_date("2023-13-01T10:00:00"), std::nullopt);
    EXPECT_EQ(format_creation_date("2023-05-01T24:00:00"), std::nullopt);
}

TEST(MetadataMapperStandaloneTest, UnparseableCreationDateIsReturnedVerbatim) {
    auto doc = ParsedDocument::parse(metaDocument(
        "<office:meta><meta:creation-date>last tuesday</meta:creation-date></office:meta>"));

    EXPECT_EQ(MetadataMapper(doc).creation_date(), "last tuesday");
}

// --- single-valued writes ---

TEST_F(MetadataMapperTest, WriteSingleOverwritesExistingElement) {
    mapper.set_title("Quarterly Report");

    EXPECT_EQ(mapper.title(), "Quarterly Report");
    EXPECT_EQ(countOccurrences(doc.serialize(), "<dc:title>"), 1u);
}

TEST_F(MetadataMapperTest, WriteSingleWithNulloptLeavesTreeUnchanged) {
    const std::string before = doc.serialize();

    mapper.set_title(std::nullopt).set_subject(std::nullopt);

    EXPECT_EQ(doc.serialize(), before);
}

TEST_F(MetadataMapperTest, WriteSingleEmptyStringClearsTextButKeepsElement) {
    mapper.set_subject("");

    EXPECT_EQ(mapper.subject(), "");
    const std::string out = doc.serialize();
    EXPECT_EQ(countOccurrences(out, "Finance"), 0u);
    EXPECT_EQ(countOccurrences(out, "<dc:subject"), 1u);
}

TEST_F(MetadataMapperTest, WriteSingleEscapesMarkup) {
    mapper.set_title("R&D <2024>");

    EXPECT_EQ(mapper.title(), "R&D <2024>");
    EXPECT_NE(doc.serialize().find("R&amp;D &lt;2024&gt;"), std::string::npos);
}

TEST_F(MetadataMapperTest, WriteSingleOnlyTouchesFirstOfDuplicates) {
    mapper.write_single(tags::kKeyword, std::string("gamma"));

    EXPECT_EQ(mapper.keywords(), "gamma, beta");
}

TEST(MetadataMapperStandaloneTest, WriteSingleCreatesElementUnderContainer) {
    auto doc = ParsedDocument::parse(metaDocument("<office:meta/>"));
    MetadataMapper mapper(doc);

    mapper.set_title("Fresh");

    EXPECT_EQ(mapper.title(), "Fresh");
    const std::string out = doc.serialize();
    EXPECT_NE(out.find("<office:meta><dc:title>Fresh</dc:title></office:meta>"), std::string::npos);

    // the new element must survive a reparse under its declared namespace
    auto reparsed = ParsedDocument::parse(out);
    EXPECT_EQ(MetadataMapper(reparsed).title(), "Fresh");
}

TEST(MetadataMapperStandaloneTest, WriteSingleWithoutContainerThrowsStructuralError) {
    auto doc = ParsedDocument::parse(metaDocument(""));
    const std::string before = doc.serialize();

    EXPECT_THROW(MetadataMapper(doc).set_title("x"), StructuralError);
    EXPECT_EQ(doc.serialize(), before);
}

TEST(MetadataMapperStandaloneTest, WriteSingleUpdatesExistingElementEvenWithoutContainer) {
    auto doc = ParsedDocument::parse(metaDocument("<dc:title>Old</dc:title>"));
    MetadataMapper mapper(doc);

    mapper.set_title("New");

    EXPECT_EQ(mapper.title(), "New");
}

// --- multi-valued writes ---

TEST_F(MetadataMapperTest, WriteMultiValuedReplacesAllElements) {
    mapper.set_keywords("a,b,c");

    EXPECT_EQ(mapper.keywords(), "a, b, c");
    EXPECT_EQ(countOccurrences(doc.serialize(), "<meta:keyword>"), 3u);
}

TEST_F(MetadataMapperTest, WriteMultiValuedKeepsSurroundingWhitespace) {
    mapper.set_keywords("a, b,c");

    EXPECT_EQ(mapper.keywords(), "a,  b, c");
}

TEST_F(MetadataMapperTest, WriteMultiValuedEmptyValueLeavesOneEmptyElement) {
    mapper.set_keywords("");

    EXPECT_EQ(mapper.keywords(), "");
    EXPECT_EQ(countOccurrences(doc.serialize(), "<meta:keyword"), 1u);
}

TEST_F(MetadataMapperTest, WriteMultiValuedOnlyCommasRemovesEverything) {
    mapper.set_keywords(",,");

    EXPECT_EQ(countOccurrences(doc.serialize(), "<meta:keyword"), 0u);
}

TEST_F(MetadataMapperTest, WriteMultiValuedWithNulloptLeavesTreeUnchanged) {
    const std::string before = doc.serialize();

    mapper.set_keywords(std::nullopt);

    EXPECT_EQ(doc.serialize(), before);
}

TEST(MetadataMapperStandaloneTest, WriteMultiValuedWithoutContainerLeavesTreeUntouched) {
    auto doc = ParsedDocument::parse(metaDocument("<meta:keyword>keep</meta:keyword>"));
    const std::string before = doc.serialize();

    EXPECT_THROW(MetadataMapper(doc).set_keywords("x,y"), StructuralError);
    EXPECT_EQ(doc.serialize(), before);
}

TEST_F(MetadataMapperTest, WriteMultiValuedRefusesTheContainerTag) {
    const std::string before = doc.serialize();

    EXPECT_THROW(mapper.write_multi_valued(tags::kMeta, std::string("x")), std::invalid_argument);
    EXPECT_THROW(mapper.write_multi_valued("office:document-meta", std::string("x")), std::invalid_argument);
    EXPECT_EQ(doc.serialize(), before);
    EXPECT_EQ(mapper.title(), "Annual Report");
}

TEST(SplitMultiValueTest, FollowsCommaRules) {
    using V = std::vector<std::string>;
    EXPECT_EQ(split_multi_value(""), V{""});
    EXPECT_EQ(split_multi_value("solo"), V{"solo"});
    EXPECT_EQ(split_multi_value("a,b"), (V{"a", "b"}));
    EXPECT_EQ(split_multi_value("a,"), V{"a"});
    EXPECT_EQ(split_multi_value("a,,b,,"), (V{"a", "", "b"}));
    EXPECT_EQ(split_multi_value(",a"), (V{"", "a"}));
    EXPECT_EQ(split_multi_value(",,"), V{});
}

// --- removal ---

TEST_F(MetadataMapperTest, RemoveAllIsIdempotent) {
    mapper.remove_all(tags::kKeyword);
    const std::string once = doc.serialize();
    mapper.remove_all(tags::kKeyword);

    EXPECT_EQ(doc.serialize(), once);
    EXPECT_EQ(mapper.keywords(), "");
    EXPECT_EQ(countOccurrences(once, "meta:keyword"), 0u);
}

TEST_F(MetadataMapperTest, RemoveAllOfAbsentTagIsNoOp) {
    const std::string before = doc.serialize();

    mapper.remove_all("dc:language");

    EXPECT_EQ(doc.serialize(), before);
}

// --- view semantics ---

TEST_F(MetadataMapperTest, SeesChangesMadeThroughAnotherMapper) {
    MetadataMapper other(doc);

    other.set_title("Changed elsewhere");

    EXPECT_EQ(mapper.title(), "Changed elsewhere");
}

TEST_F(MetadataMapperTest, FollowsReplacedTree) {
    const std::string xml = metaDocument("<office:meta><dc:title>Swapped</dc:title></office:meta>");
    doc.replace_tree(ParsedDocument::XmlDocPtr(
        xmlReadMemory(xml.data(), static_cast<int>(xml.size()), "swapped.xml", nullptr, 0)));

    EXPECT_EQ(mapper.title(), "Swapped");
}

// --- field table ---

TEST(FieldTableTest, FindFieldByName) {
    const auto field = find_field("page-count");
    ASSERT_TRUE(field.has_value());
    EXPECT_EQ(field->tag, tags::kStatistics);
    EXPECT_EQ(field->attribute, tags::kPageCount);
    EXPECT_FALSE(field->writable);

    EXPECT_FALSE(find_field("no-such-field").has_value());
}

TEST_F(MetadataMapperTest, SnapshotCoversEveryFieldInTableOrder) {
    const auto fields = mapper.snapshot();

    ASSERT_EQ(fields.size(), kFields.size());
    for (std::size_t i = 0; i < kFields.size(); ++i) {
        EXPECT_EQ(fields[i].first, kFields[i].name);
    }
    EXPECT_EQ(fields.front().second, "Annual Report");
}

TEST_F(MetadataMapperTest, WriteFieldDispatchesOnMultiplicity) {
    mapper.write_field(*find_field("keywords"), std::string("x,y"));
    mapper.write_field(*find_field("author"), std::string("Grace Hopper"));

    EXPECT_EQ(mapper.read_field(*find_field("keywords")), "x, y");
    EXPECT_EQ(mapper.read_field(*find_field("author")), "Grace Hopper");
}

TEST_F(MetadataMapperTest, WriteFieldRejectsReadOnlyFields) {
    EXPECT_THROW(mapper.write_field(*find_field("page-count"), std::string("9")), std::invalid_argument);
    EXPECT_THROW(mapper.write_field(*find_field("creation-date"), std::string("x")), std::invalid_argument);
    EXPECT_EQ(mapper.page_count(), "5");
}
