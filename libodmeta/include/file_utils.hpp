/**
 * @file file_utils.hpp
 * @brief Staging directory helpers.
 */

#ifndef ODMETA_FILE_UTILS_HPP
#define ODMETA_FILE_UTILS_HPP

#include <filesystem>
#include <string>
#include <string_view>

namespace odmeta {

    /**
     * @brief Creates a unique temporary directory for one archive round-trip.
     *
     * The directory is created inside the system temp path following the
     * "odmeta-{prefix}/{prefix}_{filename_stem}_{random_suffix}" pattern.
     *
     * @param input_path The input file path (used for its stem).
     * @param prefix A short prefix (e.g. "odt").
     * @return Path to the newly created directory.
     * @throws IoError if the directory cannot be created.
     */
    std::filesystem::path make_temp_dir_for(const std::filesystem::path &input_path,
                                            const std::string &prefix);

    /**
     * @brief Recursively removes a directory and logs any errors.
     * @param dir The directory to remove.
     * @param tag The logger tag of the caller.
     */
    void cleanup_temp_dir(const std::filesystem::path &dir,
                          std::string_view tag = "file_utils");

} // namespace odmeta

#endif // ODMETA_FILE_UTILS_HPP
