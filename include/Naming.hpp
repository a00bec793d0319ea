#pragma once
#include <string>

namespace assay {
    /**
     * @brief Insert the "min" segment after the first dot-separated segment.
     *
     * "infusion-all.js" -> "infusion-all.min.js",
     * "infusion-all.js.map" -> "infusion-all.min.js.map".
     * A name that already has a "min" segment is returned unchanged, so the
     * transform is idempotent. Pure string work, no file system access.
     */
    [[nodiscard]] std::string add_minified_segment(const std::string &name);

    // "<package>-<build>" as used for the bundle in the staging area.
    [[nodiscard]] std::string bundle_base_name(const std::string &package, const std::string &build);

    // Name a staged file gets when published: unchanged when expanded, "min" segment otherwise.
    [[nodiscard]] std::string published_file_name(const std::string &file_name, bool expanded);

    // "<package>-<build>-<version>.zip"
    [[nodiscard]] std::string archive_file_name(const std::string &package, const std::string &build,
                                                const std::string &version);
} // namespace assay
