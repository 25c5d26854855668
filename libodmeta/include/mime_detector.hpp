#ifndef ODMETA_MIME_DETECTOR_HPP
#define ODMETA_MIME_DETECTOR_HPP

#include <filesystem>
#include <string>
#include <string_view>

namespace odmeta {

    /**
     * @brief Provides file type detection.
     */
    class MimeDetector {
    public:
        /**
         * @brief Detect the MIME type of a file.
         *
         * @param path The filesystem path to the file.
         * @return The MIME type (e.g. "application/vnd.oasis.opendocument.text"),
         * or an empty string when detection is unavailable.
         *
         * @note On Linux/macOS, this uses libmagic.
         * @note On Windows, this falls back to the file extension.
         */
        static std::string detect(const std::filesystem::path& path);

        /**
         * @brief Checks whether a detected MIME type names an OpenDocument
         * package of any kind.
         */
        static bool is_opendocument(std::string_view mime);
    };

} // namespace odmeta
#endif // ODMETA_MIME_DETECTOR_HPP
