#include "../../include/odt_session.hpp"
#include "../../include/archive_codec.hpp"
#include "../../include/errors.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/random_utils.hpp"
#include <optional>
#include <system_error>

namespace odmeta {

namespace fs = std::filesystem;

namespace {

const char* session_tag() {
    return "OdtSession";
}

ParsedDocument load_staged(const fs::path& odt_path, const fs::path& staging_dir) {
    try {
        unpack(odt_path, staging_dir);

        const fs::path meta_path = staging_dir / OdtSession::kMetaEntry;
        std::error_code ec;
        if (!fs::is_regular_file(meta_path, ec)) {
            Logger::log(LogLevel::Error, "No meta.xml in package: " + odt_path.string(), session_tag());
            throw StructuralError("No meta.xml in package: " + odt_path.string());
        }
        return ParsedDocument::load(meta_path);
    } catch (...) {
        cleanup_temp_dir(staging_dir, session_tag());
        throw;
    }
}

// content.xml is optional; a malformed one is still an error
std::optional<ParsedDocument> load_content(const fs::path& staging_dir) {
    try {
        const fs::path content_path = staging_dir / OdtSession::kContentEntry;
        std::error_code ec;
        if (!fs::is_regular_file(content_path, ec)) {
            Logger::log(LogLevel::Debug, "No content.xml in package, hyperlinks unavailable", session_tag());
            return std::nullopt;
        }
        return ParsedDocument::load(content_path);
    } catch (...) {
        cleanup_temp_dir(staging_dir, session_tag());
        throw;
    }
}

} // namespace

OdtSession::OdtSession(const fs::path& odt_path)
    : source_path_(odt_path),
      staging_dir_(make_temp_dir_for(odt_path, "odt")),
      document_(load_staged(odt_path, staging_dir_)),
      content_(load_content(staging_dir_)),
      mapper_(document_) {
    if (content_) {
        content_mapper_.emplace(*content_);
    }
    Logger::log(LogLevel::Info, "Opened ODT: " + odt_path.filename().string(), session_tag());
}

OdtSession::~OdtSession() {
    cleanup_temp_dir(staging_dir_, session_tag());
}

std::string OdtSession::hyperlinks() const {
    return content_mapper_ ? content_mapper_->hyperlinks() : std::string();
}

std::vector<std::pair<std::string, std::string>> OdtSession::snapshot() const {
    auto fields = mapper_.snapshot();
    for (auto& [name, value] : fields) {
        if (name == "hyperlinks") {
            value = hyperlinks();
        }
    }
    return fields;
}

void OdtSession::commit(const fs::path& output_path) {
    Logger::log(LogLevel::Info, "Committing ODT: " + output_path.string(), session_tag());

    document_.save(staging_dir_ / kMetaEntry);

    fs::path out_dir = output_path.parent_path();
    if (out_dir.empty()) out_dir = ".";
    const fs::path tmp_path = out_dir / (output_path.stem().string() + "_tmp" +
                                         RandomUtils::random_suffix() + output_path.extension().string());

    std::error_code ec;
    try {
        pack(staging_dir_, tmp_path);
    } catch (...) {
        fs::remove(tmp_path, ec);
        throw;
    }

    fs::rename(tmp_path, output_path, ec);
    if (ec) {
        // fallback to copy if rename fails (e.g., different devices)
        Logger::log(LogLevel::Debug, "Rename failed (" + ec.message() + "), copying instead", session_tag());
        std::error_code ec_copy;
        fs::copy_file(tmp_path, output_path, fs::copy_options::overwrite_existing, ec_copy);
        fs::remove(tmp_path, ec);
        if (ec_copy) {
            Logger::log(LogLevel::Error,
                        "Failed to write final output to: " + output_path.string() + " (" + ec_copy.message() + ")",
                        session_tag());
            throw IoError("Failed to write final output to: " + output_path.string() + " (" + ec_copy.message() + ")");
        }
    }

    Logger::log(LogLevel::Debug, "Wrote ODT: " + output_path.string(), session_tag());
}

} // namespace odmeta
