#pragma once
#include "Distributions.hpp"
#include <ctime>
#include <filesystem>
#include <string>
#include <vector>

namespace assay {
    struct Preamble {
        std::string package;
        std::string version;
        std::string timestamp;
        std::string branch;
        std::string revision;

        // "/*!\n <package> - v<version>\n <timestamp>\n branch: <b> revision: <r>*/\n"
        [[nodiscard]] std::string render() const;
    };

    // "Monday, October 19th, 2026, 7:05:09 PM" in local time.
    [[nodiscard]] std::string format_timestamp(std::time_t when);

    /**
     * @brief Built-in minifier: trims lines and drops blank and comment-only ones.
     *
     * Comments that start a line are removed, others stay. Quote and template
     * literal state is tracked across lines, so literal contents (including
     * indentation and comment-like text) are copied as written.
     * `kept_lines` receives the zero-based source line of every output line.
     */
    [[nodiscard]] std::string strip_script(const std::string &text, std::vector<int> *kept_lines = nullptr);

    // Base64 VLQ, as used by source map v3 "mappings".
    [[nodiscard]] std::string encode_vlq(int value);

    struct BundleRequest {
        std::filesystem::path root; // source files are read from here
        std::vector<std::string> files; // root-relative, bundle order
        std::filesystem::path output; // the .js to write; the map goes beside it as .js.map
        std::string map_url; // name written after sourceMappingURL=
        std::string preamble;
        bool expanded = true;
    };

    /**
     * @brief Concatenate `files` behind the preamble and write bundle + source map.
     *
     * Expanded bundles keep every line as written; the others go through
     * strip_script(). The map has one segment per source line, column 0.
     * Throws std::runtime_error when a source file cannot be read or an output written.
     */
    DistributionOutput write_bundle(const BundleRequest &request);
} // namespace assay
