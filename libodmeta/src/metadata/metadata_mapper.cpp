#include "../../include/metadata_mapper.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <chrono>
#include <format>
#include <memory>
#include <new>
#include <regex>
#include <stdexcept>

namespace odmeta {

namespace {

const char* mapper_tag() {
    return "MetadataMapper";
}

struct XmlCharDeleter {
    void operator()(xmlChar* p) const {
        if (p) xmlFree(p);
    }
};
using XmlCharPtr = std::unique_ptr<xmlChar, XmlCharDeleter>;

const xmlChar* to_xml(const std::string& s) {
    return reinterpret_cast<const xmlChar*>(s.c_str());
}

std::string to_string(XmlCharPtr value) {
    return value ? std::string(reinterpret_cast<const char*>(value.get())) : std::string();
}

// name as written in the document: "prefix:local" or "local"
bool has_qualified_name(const xmlChar* name, const xmlNs* ns, const std::string_view expected) {
    const std::string_view local = name ? reinterpret_cast<const char*>(name) : "";
    if (ns && ns->prefix) {
        const std::string_view prefix = reinterpret_cast<const char*>(ns->prefix);
        return expected.size() == prefix.size() + 1 + local.size()
               && expected.starts_with(prefix)
               && expected[prefix.size()] == ':'
               && expected.ends_with(local);
    }
    return expected == local;
}

void collect_elements(xmlNode* node, const std::string_view tag, std::vector<xmlNode*>& out) {
    for (xmlNode* cur = node; cur; cur = cur->next) {
        if (cur->type != XML_ELEMENT_NODE) continue;
        if (has_qualified_name(cur->name, cur->ns, tag)) {
            out.push_back(cur);
        }
        collect_elements(cur->children, tag, out);
    }
}

xmlAttr* find_attribute(xmlNode* element, const std::string_view attribute_name) {
    for (xmlAttr* attr = element->properties; attr; attr = attr->next) {
        if (has_qualified_name(attr->name, attr->ns, attribute_name)) {
            return attr;
        }
    }
    return nullptr;
}

void set_text(xmlNode* element, const std::string& text) {
    xmlNode* child = element->children;
    while (child) {
        xmlNode* next = child->next;
        xmlUnlinkNode(child);
        xmlFreeNode(child);
        child = next;
    }
    if (text.empty()) return;

    xmlNode* text_node = xmlNewDocTextLen(element->doc, to_xml(text), static_cast<int>(text.size()));
    if (!text_node) {
        throw std::bad_alloc();
    }
    xmlAddChild(element, text_node);
}

std::string join(const std::vector<std::string>& values) {
    std::string output;
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i > 0) output += MetadataMapper::kSeparator;
        output += values[i];
    }
    return output;
}

} // namespace

std::optional<FieldDescriptor> find_field(const std::string_view name) noexcept {
    for (const auto& field : kFields) {
        if (field.name == name) return field;
    }
    return std::nullopt;
}

std::optional<std::string> format_creation_date(const std::string_view raw) {
    // yyyy-MM-ddTHH:mm[:ss[.fffffffff]], no zone offset
    static const std::regex kLocalDateTime(
        R"((\d{4})-(\d{2})-(\d{2})[Tt](\d{2}):(\d{2})(?::(\d{2})(?:\.\d{1,9})?)?)");

    std::match_results<std::string_view::const_iterator> m;
    if (!std::regex_match(raw.begin(), raw.end(), m, kLocalDateTime)) {
        return std::nullopt;
    }

    const int y = std::stoi(m[1].str());
    const unsigned mo = static_cast<unsigned>(std::stoi(m[2].str()));
    const unsigned d = static_cast<unsigned>(std::stoi(m[3].str()));
    const int hh = std::stoi(m[4].str());
    const int mm = std::stoi(m[5].str());
    const int ss = m[6].matched ? std::stoi(m[6].str()) : 0;

    const std::chrono::year_month_day date{std::chrono::year{y}, std::chrono::month{mo}, std::chrono::day{d}};
    if (!date.ok() || hh > 23 || mm > 59 || ss > 59) {
        return std::nullopt;
    }
    return std::format("{:02}/{:02}/{:04} {:02}:{:02}", d, mo, y, hh, mm);
}

std::vector<std::string> split_multi_value(const std::string_view value) {
    std::vector<std::string> tokens;
    std::size_t start = 0;
    for (;;) {
        const auto pos = value.find(',', start);
        if (pos == std::string_view::npos) {
            tokens.emplace_back(value.substr(start));
            break;
        }
        tokens.emplace_back(value.substr(start, pos - start));
        start = pos + 1;
    }
    if (tokens.size() > 1) {
        while (!tokens.empty() && tokens.back().empty()) {
            tokens.pop_back();
        }
    }
    return tokens;
}

std::vector<xmlNode*> MetadataMapper::find_all(const std::string_view tag) const {
    std::vector<xmlNode*> out;
    collect_elements(xmlDocGetRootElement(document_.tree()), tag, out);
    return out;
}

xmlNode* MetadataMapper::find_first(const std::string_view tag) const {
    const auto all = find_all(tag);
    return all.empty() ? nullptr : all.front();
}

xmlNode* MetadataMapper::require_container() const {
    xmlNode* meta = find_first(tags::kMeta);
    if (!meta) {
        Logger::log(LogLevel::Error, "Document has no " + std::string(tags::kMeta) + " element", mapper_tag());
        throw StructuralError("Document has no " + std::string(tags::kMeta) + " element");
    }
    return meta;
}

xmlNode* MetadataMapper::new_element(xmlNode* container, const std::string_view tag,
                                     const std::string& text) const {
    xmlDoc* doc = document_.tree();
    xmlNode* element = nullptr;

    const auto colon = tag.find(':');
    if (colon != std::string_view::npos) {
        const std::string prefix(tag.substr(0, colon));
        const std::string local(tag.substr(colon + 1));
        if (xmlNs* ns = xmlSearchNs(doc, container, to_xml(prefix))) {
            element = xmlNewDocNode(doc, ns, to_xml(local), nullptr);
        } else {
            Logger::log(LogLevel::Warning,
                        "Namespace prefix '" + prefix + "' is not declared, creating <" + std::string(tag) + "> verbatim",
                        mapper_tag());
        }
    }
    if (!element) {
        element = xmlNewDocNode(doc, nullptr, to_xml(std::string(tag)), nullptr);
    }
    if (!element) {
        throw std::bad_alloc();
    }

    try {
        set_text(element, text);
    } catch (...) {
        xmlFreeNode(element);
        throw;
    }
    xmlAddChild(container, element);
    return element;
}

std::string MetadataMapper::read_single(const std::string_view tag) const {
    std::vector<std::string> values;
    for (xmlNode* element : find_all(tag)) {
        values.push_back(to_string(XmlCharPtr(xmlNodeGetContent(element))));
    }
    return join(values);
}

std::string MetadataMapper::read_attribute(const std::string_view container_tag,
                                           const std::string_view attribute_name) const {
    std::vector<std::string> values;
    for (xmlNode* element : find_all(container_tag)) {
        if (xmlAttr* attr = find_attribute(element, attribute_name)) {
            values.push_back(to_string(XmlCharPtr(xmlNodeListGetString(element->doc, attr->children, 1))));
        }
    }
    return join(values);
}

MetadataMapper& MetadataMapper::write_single(const std::string_view tag, const std::optional<std::string>& value) {
    if (!value) {
        return *this;
    }

    if (xmlNode* element = find_first(tag)) {
        set_text(element, *value);
        Logger::log(LogLevel::Debug, "Updated <" + std::string(tag) + ">", mapper_tag());
        return *this;
    }

    new_element(require_container(), tag, *value);
    Logger::log(LogLevel::Debug, "Created <" + std::string(tag) + ">", mapper_tag());
    return *this;
}

MetadataMapper& MetadataMapper::write_multi_valued(const std::string_view tag, const std::optional<std::string>& value) {
    if (!value) {
        return *this;
    }

    // fail before touching the tree
    xmlNode* container = require_container();
    for (const xmlNode* n = container; n && n->type == XML_ELEMENT_NODE; n = n->parent) {
        if (has_qualified_name(n->name, n->ns, tag)) {
            throw std::invalid_argument("Cannot rewrite <" + std::string(tag) + ">, it holds the metadata container");
        }
    }
    remove_all(tag);

    const auto tokens = split_multi_value(*value);
    for (const auto& token : tokens) {
        new_element(container, tag, token);
    }
    Logger::log(LogLevel::Debug,
                "Wrote " + std::to_string(tokens.size()) + " <" + std::string(tag) + "> elements",
                mapper_tag());
    return *this;
}

MetadataMapper& MetadataMapper::remove_all(const std::string_view tag) {
    while (xmlNode* element = find_first(tag)) {
        xmlUnlinkNode(element);
        xmlFreeNode(element);
    }
    return *this;
}

std::string MetadataMapper::creation_date() const {
    const std::string raw = read_single(tags::kCreationDate);
    if (auto formatted = format_creation_date(raw)) {
        return *formatted;
    }
    if (!raw.empty()) {
        Logger::log(LogLevel::Debug, "Creation date is not ISO-8601, returned as stored: " + raw, mapper_tag());
    }
    return raw;
}

std::string MetadataMapper::read_field(const FieldDescriptor& field) const {
    switch (field.representation) {
        case FieldRepresentation::Text:
            return read_single(field.tag);
        case FieldRepresentation::Date: {
            const std::string raw = read_single(field.tag);
            return format_creation_date(raw).value_or(raw);
        }
        case FieldRepresentation::Attribute:
            return read_attribute(field.tag, field.attribute);
    }
    return {};
}

MetadataMapper& MetadataMapper::write_field(const FieldDescriptor& field, const std::optional<std::string>& value) {
    if (!field.writable) {
        throw std::invalid_argument("Field is read-only: " + std::string(field.name));
    }
    if (field.multiplicity == FieldMultiplicity::Multi) {
        return write_multi_valued(field.tag, value);
    }
    return write_single(field.tag, value);
}

std::vector<std::pair<std::string, std::string>> MetadataMapper::snapshot() const {
    std::vector<std::pair<std::string, std::string>> fields;
    fields.reserve(kFields.size());
    for (const auto& field : kFields) {
        fields.emplace_back(std::string(field.name), read_field(field));
    }
    return fields;
}

} // namespace odmeta
