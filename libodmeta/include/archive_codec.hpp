/**
 * @file archive_codec.hpp
 * @brief Streaming conversion between zip archives and directory trees.
 */

#ifndef ODMETA_ARCHIVE_CODEC_HPP
#define ODMETA_ARCHIVE_CODEC_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace odmeta {

/// Size of the buffer every entry payload is streamed through.
inline constexpr std::size_t kCodecBufferSize = 16 * 1024;

/**
 * @brief One item of a zip archive.
 */
struct ArchiveEntry {
    std::string path;           ///< Relative '/'-separated path, no trailing '/'
    bool is_directory = false;  ///< Directory entry (explicit in the archive)
    std::uintmax_t size = 0;    ///< Uncompressed payload size, 0 for directories
};

/**
 * @brief Extracts every entry of a zip archive below an output directory.
 *
 * @details The output directory and any missing parents are created.
 * Directory entries become empty directories; file entries become files
 * whose bytes match the archive payload exactly. Parent directories of
 * file entries are created on demand. Payloads are streamed through a
 * fixed buffer of kCodecBufferSize bytes.
 *
 * Partially extracted output is left in place on failure.
 *
 * @param archive_path Path to an existing zip archive.
 * @param output_dir Directory to extract into.
 * @throws IoError if the archive cannot be read, an entry path escapes
 * the output directory, or an output file cannot be written.
 */
void unpack(const std::filesystem::path& archive_path,
            const std::filesystem::path& output_dir);

/**
 * @brief Builds a zip archive from the contents of a directory.
 *
 * @details Every file and subdirectory below @p source_dir becomes one
 * entry named by its path relative to @p source_dir. Entries are written
 * in lexicographic order of their relative path, except that a top-level
 * "mimetype" file is always written first and stored uncompressed, as
 * OpenDocument packages require. Other files are DEFLATE-compressed;
 * directories are written with a trailing '/'. An empty directory yields
 * a valid archive with no entries.
 *
 * @param source_dir Root of the tree to archive.
 * @param archive_path Destination archive (overwritten if present).
 * @throws IoError if the tree cannot be read or the archive cannot be written.
 */
void pack(const std::filesystem::path& source_dir,
          const std::filesystem::path& archive_path);

/**
 * @brief Lists the entries of a zip archive without extracting them.
 * @param archive_path Path to an existing zip archive.
 * @return Entries in archive order.
 * @throws IoError if the archive cannot be read.
 */
[[nodiscard]] std::vector<ArchiveEntry> list_entries(const std::filesystem::path& archive_path);

} // namespace odmeta

#endif // ODMETA_ARCHIVE_CODEC_HPP
