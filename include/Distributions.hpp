#pragma once
#include "ModuleGraph.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace assay {
    struct DistributionSpec {
        std::string name;
        std::optional<TagSet> include;
        std::optional<TagSet> exclude;
        bool expanded = true;

        // Rows with a filter run the custom target, the others the all target.
        [[nodiscard]] bool is_custom() const { return include.has_value() || exclude.has_value(); }
    };

    /**
     * @brief Ordered table of distribution rows with unique names.
     *
     * Never mutated after construction; the orchestrator binds one run per row.
     */
    class DistributionMatrix {
    public:
        // Throws std::invalid_argument on a duplicate or empty name.
        explicit DistributionMatrix(std::vector<DistributionSpec> specs);

        // The twelve all/framework/uio rows, each with no-jquery and .min variants.
        [[nodiscard]] static DistributionMatrix standard();

        [[nodiscard]] const std::vector<DistributionSpec> &specs() const { return specs_; }
        [[nodiscard]] std::size_t size() const { return specs_.size(); }
        [[nodiscard]] bool empty() const { return specs_.empty(); }

        [[nodiscard]] const DistributionSpec *find(const std::string &name) const;

        // JS bundle and source map expected in `dist_dir` for every row.
        [[nodiscard]] std::vector<std::string> expected_files(const std::string &package,
                                                              const std::filesystem::path &dist_dir) const;

    private:
        std::vector<DistributionSpec> specs_;
    };

    struct DistributionOutput {
        std::filesystem::path bundle_path;
        std::filesystem::path map_path;
    };
} // namespace assay
