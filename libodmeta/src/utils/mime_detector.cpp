#ifndef _WIN32
#include <magic.h>
#endif
#include "../../include/mime_detector.hpp"
#include <algorithm>
#include <cctype>
#include <map>
#include <string_view>

std::string odmeta::MimeDetector::detect(const std::filesystem::path& path)
{
#ifndef _WIN32
    const magic_t magic = magic_open(MAGIC_MIME_TYPE | MAGIC_ERROR);
    if (!magic) return {};
    if (magic_load(magic, nullptr) != 0)
    {
        magic_close(magic);
        return {};
    }
    const char* mime = magic_file(magic, path.string().c_str());
    std::string result = mime ? mime : "";
    magic_close(magic);
    return result;
#else
    static const std::map<std::string, std::string> ext_to_mime = {
        {".odt", "application/vnd.oasis.opendocument.text"},
        {".ott", "application/vnd.oasis.opendocument.text-template"},
        {".zip", "application/zip"},
    };
    auto ext = path.extension().string();
    std::ranges::transform(ext, ext.begin(), ::tolower);
    auto it = ext_to_mime.find(ext);
    return it != ext_to_mime.end() ? it->second : "application/octet-stream";
#endif
}

bool odmeta::MimeDetector::is_opendocument(const std::string_view mime)
{
    constexpr std::string_view kPrefix = "application/vnd.oasis.opendocument.";
    return mime.starts_with(kPrefix);
}
