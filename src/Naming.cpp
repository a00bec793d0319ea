#include "../include/Naming.hpp"
#include <algorithm>
#include <sstream>
#include <string>
#include <vector>

namespace assay {
    std::string add_minified_segment(const std::string &name) {
        std::vector<std::string> segs;
        {
            std::stringstream ss(name);
            std::string seg;
            while (std::getline(ss, seg, '.')) segs.push_back(seg);
            // getline drops a trailing empty segment
            if (!name.empty() && name.back() == '.') segs.emplace_back();
        }
        if (segs.empty() || segs.front().empty()) return name;
        if (std::find(segs.begin(), segs.end(), "min") != segs.end()) return name;

        segs.insert(segs.begin() + 1, "min");
        std::string out;
        for (std::size_t i = 0; i < segs.size(); ++i) {
            if (i) out.push_back('.');
            out += segs[i];
        }
        return out;
    }

    std::string bundle_base_name(const std::string &package, const std::string &build) {
        return package + "-" + build;
    }

    std::string published_file_name(const std::string &file_name, const bool expanded) {
        return expanded ? file_name : add_minified_segment(file_name);
    }

    std::string archive_file_name(const std::string &package, const std::string &build, const std::string &version) {
        return package + "-" + build + "-" + version + ".zip";
    }
} // namespace assay
