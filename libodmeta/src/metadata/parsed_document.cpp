#include "../../include/parsed_document.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <libxml/parser.h>
#include <libxml/xmlerror.h>
#include <fstream>
#include <iterator>
#include <limits>
#include <stdexcept>

namespace odmeta {

namespace {

const char* document_tag() {
    return "ParsedDocument";
}

struct ParserCtxtDeleter {
    void operator()(xmlParserCtxt* ctxt) const {
        if (ctxt) xmlFreeParserCtxt(ctxt);
    }
};

struct XmlCharDeleter {
    void operator()(xmlChar* p) const {
        if (p) xmlFree(p);
    }
};

std::string trim_message(std::string msg) {
    while (!msg.empty() && (msg.back() == '\n' || msg.back() == '\r' || msg.back() == ' ')) {
        msg.pop_back();
    }
    return msg;
}

} // namespace

ParsedDocument::ParsedDocument(XmlDocPtr tree) : tree_(std::move(tree)) {
    if (!tree_) {
        throw std::invalid_argument("ParsedDocument: null tree");
    }
}

ParsedDocument ParsedDocument::load(const std::filesystem::path& file_path) {
    Logger::log(LogLevel::Debug, "Loading XML: " + file_path.string(), document_tag());

    std::ifstream ifs(file_path, std::ios::binary);
    if (!ifs) {
        Logger::log(LogLevel::Error, "Failed to open XML for reading: " + file_path.string(), document_tag());
        throw IoError("Failed to open XML for reading: " + file_path.string());
    }
    const std::string bytes((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    if (ifs.bad()) {
        Logger::log(LogLevel::Error, "Failed to read XML: " + file_path.string(), document_tag());
        throw IoError("Failed to read XML: " + file_path.string());
    }

    return parse(bytes, file_path.string());
}

ParsedDocument ParsedDocument::parse(const std::string_view xml, const std::string_view source_name) {
    const std::string name(source_name);
    if (xml.size() > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
        throw ParseError("XML document too large: " + name);
    }

    xmlInitParser();
    std::unique_ptr<xmlParserCtxt, ParserCtxtDeleter> ctxt(xmlNewParserCtxt());
    if (!ctxt) {
        throw ParseError("xmlNewParserCtxt failed for " + name);
    }

    XmlDocPtr doc(xmlCtxtReadMemory(ctxt.get(), xml.data(), static_cast<int>(xml.size()),
                                    name.c_str(), nullptr,
                                    XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING));
    if (!doc || !ctxt->wellFormed) {
        std::string reason = "malformed XML";
        if (const xmlError* err = xmlCtxtGetLastError(ctxt.get()); err && err->message) {
            reason = trim_message(err->message) + " (line " + std::to_string(err->line) + ")";
        }
        Logger::log(LogLevel::Error, "Failed to parse " + name + ": " + reason, document_tag());
        throw ParseError("Failed to parse " + name + ": " + reason);
    }
    if (!xmlDocGetRootElement(doc.get())) {
        Logger::log(LogLevel::Error, "Document has no root element: " + name, document_tag());
        throw ParseError("Document has no root element: " + name);
    }

    return ParsedDocument(std::move(doc));
}

void ParsedDocument::replace_tree(XmlDocPtr tree) {
    if (!tree) {
        throw std::invalid_argument("ParsedDocument::replace_tree: null tree");
    }
    tree_ = std::move(tree);
}

std::string ParsedDocument::serialize() const {
    xmlChar* raw = nullptr;
    int size = 0;
    xmlDocDumpMemoryEnc(tree_.get(), &raw, &size, "UTF-8");
    const std::unique_ptr<xmlChar, XmlCharDeleter> mem(raw);
    if (!mem || size < 0) {
        Logger::log(LogLevel::Error, "Failed to serialize XML tree", document_tag());
        throw IoError("Failed to serialize XML tree");
    }
    return {reinterpret_cast<const char*>(mem.get()), static_cast<std::size_t>(size)};
}

void ParsedDocument::save(const std::filesystem::path& file_path) const {
    const std::string bytes = serialize();

    std::ofstream ofs(file_path, std::ios::binary | std::ios::trunc);
    if (!ofs) {
        Logger::log(LogLevel::Error, "Failed to open XML for writing: " + file_path.string(), document_tag());
        throw IoError("Failed to open XML for writing: " + file_path.string());
    }
    ofs.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    ofs.close();
    if (!ofs) {
        Logger::log(LogLevel::Error, "Failed to write XML: " + file_path.string(), document_tag());
        throw IoError("Failed to write XML: " + file_path.string());
    }
    Logger::log(LogLevel::Debug,
                "Saved XML: " + file_path.string() + " (" + std::to_string(bytes.size()) + " bytes)",
                document_tag());
}

} // namespace odmeta
