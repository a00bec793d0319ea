#include "../include/Distributions.hpp"
#include "../include/Naming.hpp"
#include "../include/Status.hpp"
#include <stdexcept>
#include <unordered_set>

using namespace assay;

DistributionMatrix::DistributionMatrix(std::vector<DistributionSpec> specs) : specs_(std::move(specs)) {
    std::unordered_set<std::string> names;
    for (const auto &s: specs_) {
        if (s.name.empty()) {
            throw std::invalid_argument(_("Distribution name must not be empty."));
        }
        if (!names.insert(s.name).second) {
            throw std::invalid_argument(std::string(_("Duplicate distribution name: ")) + s.name);
        }
    }
}

DistributionMatrix DistributionMatrix::standard() {
    const TagSet no_jquery{"jQuery", "jQueryUI"};
    std::vector<DistributionSpec> rows;
    const auto add_family = [&](const std::string &base, const std::optional<TagSet> &include) {
        rows.push_back({base, include, std::nullopt, true});
        rows.push_back({base + ".min", include, std::nullopt, false});
        rows.push_back({base + "-no-jquery", include, no_jquery, true});
        rows.push_back({base + "-no-jquery.min", include, no_jquery, false});
    };
    add_family("all", std::nullopt);
    add_family("framework", TagSet{"framework"});
    add_family("uio", TagSet{"uiOptions"});
    return DistributionMatrix(std::move(rows));
}

const DistributionSpec *DistributionMatrix::find(const std::string &name) const {
    for (const auto &s: specs_) {
        if (s.name == name) return &s;
    }
    return nullptr;
}

std::vector<std::string> DistributionMatrix::expected_files(const std::string &package,
                                                            const std::filesystem::path &dist_dir) const {
    std::vector<std::string> out;
    out.reserve(specs_.size() * 2);
    for (const auto &s: specs_) {
        const std::string js = published_file_name(bundle_base_name(package, s.name) + ".js", s.expanded);
        out.push_back((dist_dir / js).generic_string());
        out.push_back((dist_dir / (js + ".map")).generic_string());
    }
    return out;
}
