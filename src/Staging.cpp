#include "../include/Staging.hpp"
#include <algorithm>
#include <regex>
#include <set>
#include <sstream>

namespace fs = std::filesystem;

namespace {
    std::vector<std::string> split_segments(const std::string &pattern) {
        std::vector<std::string> segs;
        std::stringstream ss(pattern);
        std::string seg;
        while (std::getline(ss, seg, '/')) {
            if (seg.empty() || seg == ".") continue;
            segs.push_back(seg);
        }
        return segs;
    }

    bool has_wildcard(const std::string &seg) {
        return seg.find_first_of("*?") != std::string::npos;
    }

    void expand_from(const fs::path &root, const fs::path &rel, const std::vector<std::string> &segs,
                     const std::size_t k, std::set<fs::path> &out) {
        const fs::path here = rel.empty() ? root : root / rel;
        if (k == segs.size()) {
            if (!rel.empty() && fs::exists(here)) out.insert(rel);
            return;
        }
        const std::string &seg = segs[k];
        if (seg == "**") {
            // zero directories
            expand_from(root, rel, segs, k + 1, out);
            std::error_code ec;
            if (!fs::is_directory(here, ec)) return;
            for (const auto &entry: fs::recursive_directory_iterator(here, ec)) {
                if (!entry.is_directory()) continue;
                expand_from(root, entry.path().lexically_relative(root), segs, k + 1, out);
            }
            return;
        }
        if (!has_wildcard(seg)) {
            expand_from(root, rel / seg, segs, k + 1, out);
            return;
        }
        std::error_code ec;
        if (!fs::is_directory(here, ec)) return;
        for (const auto &entry: fs::directory_iterator(here, ec)) {
            const std::string name = entry.path().filename().string();
            if (assay::wildcard_match(name, seg)) {
                expand_from(root, rel / name, segs, k + 1, out);
            }
        }
    }
} // namespace

namespace assay {
    bool wildcard_match(const std::string &name, const std::string &pattern) {
        std::string re;
        re.reserve(pattern.size() * 2);
        for (const char c: pattern) {
            switch (c) {
                case '*': re += "[^/]*";
                    break;
                case '?': re += "[^/]";
                    break;
                case '.': case '+': case '(': case ')': case '[': case ']':
                case '{': case '}': case '^': case '$': case '|': case '\\':
                    re.push_back('\\');
                    re.push_back(c);
                    break;
                default: re.push_back(c);
            }
        }
        return std::regex_match(name, std::regex(re));
    }

    std::vector<fs::path> expand_glob(const fs::path &root, const std::string &pattern) {
        std::set<fs::path> found;
        expand_from(root, fs::path(), split_segments(pattern), 0, found);
        return {found.begin(), found.end()};
    }

    std::size_t remove_globs(const fs::path &root, const std::vector<std::string> &patterns) {
        std::size_t removed = 0;
        for (const auto &pattern: patterns) {
            // deepest first so a parent never disappears under its own match
            auto matches = expand_glob(root, pattern);
            std::sort(matches.rbegin(), matches.rend());
            for (const auto &m: matches) {
                removed += static_cast<std::size_t>(fs::remove_all(root / m));
            }
        }
        return removed;
    }

    void copy_into(const fs::path &root, const fs::path &rel, const fs::path &dest_root) {
        const fs::path from = root / rel;
        const fs::path to = dest_root / rel;
        if (fs::is_directory(from)) {
            fs::create_directories(to);
            fs::copy(from, to, fs::copy_options::recursive | fs::copy_options::overwrite_existing);
            return;
        }
        copy_file_to(from, to);
    }

    void copy_file_to(const fs::path &from, const fs::path &to) {
        if (to.has_parent_path()) fs::create_directories(to.parent_path());
        fs::copy_file(from, to, fs::copy_options::overwrite_existing);
    }
} // namespace assay
