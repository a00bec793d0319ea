#pragma once
#include "Assay.hpp"
#include "Distributions.hpp"
#include "ModuleGraph.hpp"
#include "Verify.hpp"
#include <array>
#include <filesystem>
#include <iosfwd>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace assay {
    // Pipeline states, in the only order a run may visit them.
    enum class Stage {
        Clean,
        StageDependencies,
        CompileAssets,
        ResolveModules,
        StageFiles,
        Bundle,
        Package,
        PostBuildClean,
        Verify,
        Done,
        Failed
    };

    [[nodiscard]] const char *stage_name(Stage stage);

    // Which stages a run includes and how its clean scope is chosen.
    enum class RunKind {
        Build, // build:all / build:custom
        Distribution, // one matrix row
        Prepare, // buildDists head: full clean + dependencies
        VerifyDist, // clean for dist, then verify
        VerifyOnly,
        Assets, // rebuild development assets
        LoadDependencies
    };

    enum class BuildTarget { All, Custom };

    // Stage-local fault (copy failure, external command exit code...).
    class StageFailure : public std::runtime_error {
    public:
        StageFailure(Stage stage, const std::string &what);

        [[nodiscard]] Stage stage() const { return stage_; }

    private:
        Stage stage_;
    };

    // Command line input, before anything is resolved.
    struct BuildOptions {
        BuildTarget target = BuildTarget::All;
        std::string name = "custom";
        std::optional<TagSet> include;
        std::optional<TagSet> exclude;
        bool expanded = false; // --source
        std::string verify_target; // empty = every @verify target
    };

    // Looked up once per invocation and shared by every run it binds.
    struct RunMetadata {
        std::string branch;
        std::string revision;
        std::string timestamp;
    };

    /**
     * @brief Fully resolved configuration of one pipeline run.
     *
     * Produced by Make::bind() before the first stage executes and only ever
     * passed by const reference afterwards. Every command string is concrete:
     * no stage expands templates again.
     */
    struct BuildSettings {
        RunKind kind = RunKind::Build;
        BuildTarget target = BuildTarget::All;
        std::string name;
        std::string bundle_name; // <package>-<name>
        std::optional<TagSet> include;
        std::optional<TagSet> exclude;
        bool expanded = false;
        bool publish = false; // copy bundle + assets to the dist directory

        std::string package_name;
        std::string package_version;
        RunMetadata metadata;

        std::filesystem::path root;
        std::filesystem::path staging_dir;
        std::filesystem::path products_dir;
        std::filesystem::path dist_dir;
        std::filesystem::path archive_path;

        std::string assets_command;
        std::string archive_command;
        std::string minifier_command;
        std::filesystem::path minifier_input;

        std::vector<std::string> clean_patterns; // root-relative globs
        std::vector<Stage> stages;
        std::string verify_target;

        [[nodiscard]] bool runs(Stage stage) const;
    };

    struct RunResult {
        Stage state = Stage::Done; // Done or Failed
        Stage failed_stage = Stage::Done;
        std::string message;

        [[nodiscard]] bool ok() const { return state == Stage::Done; }
    };

    /**
     * @brief Sequential pipeline runner.
     *
     * A run walks its BuildSettings::stages in order. The first stage that
     * throws moves the run to Failed; nothing is retried or rolled back. A plan
     * is a list of runs executed one after the other until one fails.
     */
    class Make {
    public:
        Make(ProjectConfig project, std::filesystem::path root, std::ostream &log);

        [[nodiscard]] BuildSettings bind(RunKind kind, const BuildOptions &options) const;

        [[nodiscard]] BuildSettings bind(const DistributionSpec &spec) const;

        RunResult run(const BuildSettings &settings);

        // Returns true when every run reached Done.
        bool run_all(const std::vector<BuildSettings> &plan);

        [[nodiscard]] std::vector<BuildSettings> plan_build(const BuildOptions &options) const;

        // Every matrix row, or only `only` when not empty.
        [[nodiscard]] std::vector<BuildSettings> plan_distributions(const std::string &only) const;

        [[nodiscard]] std::vector<BuildSettings> plan_build_dists(const std::string &only) const;

        [[nodiscard]] std::vector<BuildSettings> plan_verify(const std::string &target) const;

        [[nodiscard]] std::vector<BuildSettings> plan_load_dependencies() const;

        void print_plan(const std::vector<BuildSettings> &plan, std::ostream &os) const;

        [[nodiscard]] const ProjectConfig &project() const { return project_; }

        // Expected files of one @verify target, evaluated now.
        [[nodiscard]] ExpectedFiles expected_files(const VerifySpec &spec) const;

    private:
        // What earlier stages of the same run hand to later ones.
        struct RunState {
            std::optional<ResolvedFileSet> resolved;
            std::optional<DistributionOutput> output;
        };

        using Handler = void (Make::*)(const BuildSettings &, RunState &);

        struct StageEntry {
            Stage stage;
            Handler handle;
        };

        static const std::array<StageEntry, 9> &stage_table();

        const RunMetadata &metadata() const;

        // Declared @verify targets, or a "js" target over the distribution matrix.
        [[nodiscard]] std::vector<VerifySpec> verify_targets() const;

        [[nodiscard]] std::string display(const std::filesystem::path &p) const;

        void clean(const BuildSettings &settings, RunState &state);

        void stage_dependencies(const BuildSettings &settings, RunState &state);

        void compile_assets(const BuildSettings &settings, RunState &state);

        void resolve_modules(const BuildSettings &settings, RunState &state);

        void stage_files(const BuildSettings &settings, RunState &state);

        void bundle(const BuildSettings &settings, RunState &state);

        void package(const BuildSettings &settings, RunState &state);

        void post_build_clean(const BuildSettings &settings, RunState &state);

        void verify(const BuildSettings &settings, RunState &state);

        ProjectConfig project_;
        DistributionMatrix matrix_;
        std::filesystem::path root_;
        std::ostream &log_;
        mutable std::optional<RunMetadata> metadata_;
    };
} // namespace assay
