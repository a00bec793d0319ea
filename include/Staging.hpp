#pragma once
#include <filesystem>
#include <string>
#include <vector>

namespace assay {
    // Shell-style match of one path segment: '*' any run, '?' one character.
    [[nodiscard]] bool wildcard_match(const std::string &name, const std::string &pattern);

    /**
     * @brief Expand a '/'-separated glob relative to `root`.
     *
     * Segments may use '*' and '?'; a "**" segment matches any depth, itself
     * included. Plain paths are returned when they exist. The result holds
     * root-relative paths, sorted, without duplicates.
     */
    [[nodiscard]] std::vector<std::filesystem::path> expand_glob(const std::filesystem::path &root,
                                                                 const std::string &pattern);

    // Delete everything each glob matches. Returns the number of removed entries.
    std::size_t remove_globs(const std::filesystem::path &root, const std::vector<std::string> &patterns);

    // Copy `root/rel` to `dest_root/rel`, creating parents. Directories copy recursively.
    void copy_into(const std::filesystem::path &root, const std::filesystem::path &rel,
                   const std::filesystem::path &dest_root);

    // Copy one file to an explicit destination, creating parents.
    void copy_file_to(const std::filesystem::path &from, const std::filesystem::path &to);
} // namespace assay
