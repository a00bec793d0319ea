#pragma once
#include "Distributions.hpp"
#include "Status.hpp"
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace assay {
    struct CommandSpec {
        std::string task; // shell command, empty = not configured
        std::string default_value; // used when the command gives no value
    };

    struct NecessitySpec {
        std::string pattern; // glob relative to the project root
        std::string to; // explicit destination inside the staging area
        std::string only_if; // staging sub-directory that must exist
    };

    struct DependencySpec {
        std::string pattern; // glob relative to the project root
        std::string to; // directory, files land flattened
    };

    enum class CleanScope {
        Full, // removed by every full clean only
        Dist, // also removed before verifying distributions
        Dev, // development assets, rebuilt by the assets run
        Deps // copied-in dependencies
    };

    struct CleanSpec {
        CleanScope scope = CleanScope::Full;
        std::string pattern;
    };

    // Files under `from` matching `match`, expected again under `to`.
    struct VerifyMapping {
        std::string from;
        std::string match;
        std::string to;
        std::string rename; // "old:new" applied to the file name
    };

    struct VerifySpec {
        std::string target;
        std::vector<std::string> files; // file="..." rows
        std::vector<VerifyMapping> mappings; // from/match/to rows, declaration order
        bool generator = false; // generator=distributions
    };

    /**
     * @brief Typed project description produced by AssayParser::finalize().
     *
     * Strings may still hold run-scoped ${VAR} references (STYLE, CSS_EXT,
     * NAME, STAGING, ARCHIVE, INPUT, OUTPUT, MAP). They are resolved once when
     * a run binds its BuildSettings.
     */
    struct ProjectConfig {
        std::string package_name;
        std::string package_version;
        std::string build_dir = "build";
        std::string products_dir = "products";
        std::string dist_dir = "dist";

        std::vector<std::string> module_patterns;
        std::vector<DistributionSpec> distributions;
        std::vector<NecessitySpec> necessities;
        std::vector<DependencySpec> dependencies;
        std::vector<std::string> stage_dirs;
        std::vector<std::string> asset_dirs;
        std::vector<CleanSpec> cleans;
        std::vector<VerifySpec> verify;

        CommandSpec revision{"git rev-parse --verify --short HEAD", "Unknown revision, not within a git repository"};
        CommandSpec branch{"git rev-parse --abbrev-ref HEAD", "Unknown branch, not within a git repository"};
        std::string assets_dev_task;
        std::string assets_dist_task;
        std::string archiver_task = "cd \"${STAGING}\" && zip -qr \"${ARCHIVE}\" .";
        std::string minifier_task;

        // The declared rows, or DistributionMatrix::standard() when none were declared.
        [[nodiscard]] DistributionMatrix matrix() const;

        [[nodiscard]] std::vector<std::string> clean_patterns(CleanScope scope) const;
    };

    // Replace every ${NAME} found in `vars`; unknown references stay as written.
    [[nodiscard]] std::string expand_template(const std::string &in,
                                              const std::unordered_map<std::string, std::string> &vars);

    class AssayParser {
    public:
        AssayParser();

        // Parsing
        void parse_file(const std::string &path);

        void parse_line(const std::string &line);

        // Validation after the last line: @package present, matrix names unique.
        void finalize();

        [[nodiscard]] const ProjectConfig &config() const { return project; }

        // Dry-run listing of the parsed project
        void print_plan(std::ostream &os = std::cout) const;

        std::string expand_vars(const std::string &in) const; // replaces ${VAR}

        void set_var(const std::string &name, const std::string &value) { vars[name] = value; }

    private:
        static std::string trim(const std::string &x);

        static bool starts_with(const std::string &s, const std::string &p);

        static std::vector<std::string> split_ws(const std::string &line);

        static std::string strip_quotes(std::string x);

        // true/1/yes or false/0/no, anything else is a parse error
        bool parse_flag(const std::string &v) const;

        // First token of `rest`, quoted or not; `after` receives the remainder.
        std::string first_token(const std::string &rest, std::string &after) const;

        // key="..." (expanded), or nullopt
        std::optional<std::string> attribute(const std::string &rest, const std::string &key) const;

        // key=[a,b] or key="a, b"
        std::optional<TagSet> tag_attribute(const std::string &rest, const std::string &key) const;

        [[noreturn]] void bad(const std::string &msg) const;

        void parse_distribution(const std::string &rest);

        void parse_verify(const std::string &rest);

        ProjectConfig project;
        bool have_package = false;

        int currentLine = 0;
        std::unordered_map<std::string, std::string> vars; // @let
        std::vector<std::filesystem::path> file_stack;
        std::unordered_set<std::string> include_guard; // absolute paths being parsed
        int include_depth = 0;
        const int include_depth_max = 32;
    };
} // namespace assay
