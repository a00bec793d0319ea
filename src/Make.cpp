#include "../include/Make.hpp"
#include "../include/Bundle.hpp"
#include "../include/Exec.hpp"
#include "../include/Naming.hpp"
#include "../include/Staging.hpp"
#include "../include/Status.hpp"
#include <ctime>
#include <ostream>
#include <unordered_map>

using namespace assay;
using namespace std;
namespace fs = std::filesystem;

namespace {
    vector<string> full_clean(const ProjectConfig &p) {
        vector<string> out{p.build_dir, p.products_dir, p.dist_dir};
        for (const auto scope: {CleanScope::Full, CleanScope::Dist, CleanScope::Dev, CleanScope::Deps}) {
            for (auto &c: p.clean_patterns(scope)) out.push_back(std::move(c));
        }
        return out;
    }

    vector<string> dist_clean(const ProjectConfig &p) {
        vector<string> out{p.build_dir, p.products_dir};
        for (auto &c: p.clean_patterns(CleanScope::Dist)) out.push_back(std::move(c));
        return out;
    }

    // The one template pass of a run: every run-scoped ${VAR} becomes concrete here.
    void resolve_commands(const ProjectConfig &p, BuildSettings &s) {
        const fs::path output = fs::absolute(s.staging_dir / (s.bundle_name + ".js"));
        fs::path map = output;
        map += ".map";
        s.minifier_input = s.staging_dir / (s.bundle_name + ".concat.js");
        const unordered_map<string, string> vars{
            {"PACKAGE", s.package_name},
            {"VERSION", s.package_version},
            {"NAME", s.name},
            {"STYLE", s.expanded ? "expanded" : "compressed"},
            {"CSS_EXT", s.expanded ? ".css" : ".min.css"},
            {"ROOT", fs::absolute(s.root).string()},
            {"STAGING", fs::absolute(s.staging_dir).string()},
            {"ARCHIVE", fs::absolute(s.archive_path).string()},
            {"INPUT", fs::absolute(s.minifier_input).string()},
            {"OUTPUT", output.string()},
            {"MAP", map.string()},
            {"BUILD", p.build_dir},
            {"PRODUCTS", p.products_dir},
            {"DIST", p.dist_dir},
        };
        const string &assets = s.kind == RunKind::Distribution ? p.assets_dist_task : p.assets_dev_task;
        s.assets_command = expand_template(assets, vars);
        s.archive_command = expand_template(p.archiver_task, vars);
        s.minifier_command = s.expanded ? string() : expand_template(p.minifier_task, vars);
    }
} // namespace

namespace assay {
    const char *stage_name(const Stage stage) {
        switch (stage) {
            case Stage::Clean: return "Clean";
            case Stage::StageDependencies: return "StageDependencies";
            case Stage::CompileAssets: return "CompileAssets";
            case Stage::ResolveModules: return "ResolveModules";
            case Stage::StageFiles: return "StageFiles";
            case Stage::Bundle: return "Bundle";
            case Stage::Package: return "Package";
            case Stage::PostBuildClean: return "PostBuildClean";
            case Stage::Verify: return "Verify";
            case Stage::Done: return "Done";
            case Stage::Failed: return "Failed";
        }
        return "?";
    }
} // namespace assay

StageFailure::StageFailure(const Stage stage, const string &what)
    : runtime_error(string(stage_name(stage)) + ": " + what), stage_(stage) {
}

bool BuildSettings::runs(const Stage stage) const {
    for (const Stage s: stages) {
        if (s == stage) return true;
    }
    return false;
}

// ------------ binding ------------

Make::Make(ProjectConfig project, fs::path root, ostream &log)
    : project_(std::move(project)), matrix_(project_.matrix()), root_(std::move(root)), log_(log) {
}

const RunMetadata &Make::metadata() const {
    if (!metadata_) {
        RunMetadata m;
        m.revision = capture_or_default(project_.revision.task, project_.revision.default_value, log_).value;
        m.branch = capture_or_default(project_.branch.task, project_.branch.default_value, log_).value;
        m.timestamp = format_timestamp(std::time(nullptr));
        metadata_ = std::move(m);
    }
    return *metadata_;
}

BuildSettings Make::bind(const RunKind kind, const BuildOptions &options) const {
    if (kind == RunKind::Distribution) {
        throw invalid_argument("distribution runs are bound from their matrix row");
    }
    BuildSettings s;
    s.kind = kind;
    s.target = options.target;
    if (kind == RunKind::Build && (options.include || options.exclude)) s.target = BuildTarget::Custom;
    s.name = s.target == BuildTarget::All ? "all" : options.name;
    if (s.target == BuildTarget::Custom) {
        s.include = options.include;
        s.exclude = options.exclude;
    }
    s.expanded = kind == RunKind::Assets ? true : options.expanded;
    s.package_name = project_.package_name;
    s.package_version = project_.package_version;
    s.bundle_name = bundle_base_name(s.package_name, s.name);
    s.root = root_;
    s.staging_dir = root_ / project_.build_dir;
    s.products_dir = root_ / project_.products_dir;
    s.dist_dir = root_ / project_.dist_dir;
    s.archive_path = s.products_dir / archive_file_name(s.package_name, s.name, s.package_version);
    s.verify_target = options.verify_target;

    switch (kind) {
        case RunKind::Build:
            s.stages = {
                Stage::Clean, Stage::StageDependencies, Stage::CompileAssets, Stage::ResolveModules,
                Stage::StageFiles, Stage::Bundle, Stage::Package, Stage::PostBuildClean
            };
            s.clean_patterns = full_clean(project_);
            s.metadata = metadata();
            break;
        case RunKind::Prepare:
            s.stages = {Stage::Clean, Stage::StageDependencies};
            s.clean_patterns = full_clean(project_);
            break;
        case RunKind::VerifyDist:
            s.stages = {Stage::Clean, Stage::Verify};
            s.clean_patterns = dist_clean(project_);
            break;
        case RunKind::VerifyOnly:
            s.stages = {Stage::Verify};
            break;
        case RunKind::Assets:
            s.stages = {Stage::Clean, Stage::CompileAssets};
            s.clean_patterns = project_.clean_patterns(CleanScope::Dev);
            break;
        case RunKind::LoadDependencies:
            s.stages = {Stage::Clean, Stage::StageDependencies};
            s.clean_patterns = project_.clean_patterns(CleanScope::Deps);
            break;
        case RunKind::Distribution:
            break;
    }
    resolve_commands(project_, s);
    return s;
}

BuildSettings Make::bind(const DistributionSpec &spec) const {
    BuildSettings s;
    s.kind = RunKind::Distribution;
    s.target = spec.is_custom() ? BuildTarget::Custom : BuildTarget::All;
    s.name = spec.name;
    s.include = spec.include;
    s.exclude = spec.exclude;
    s.expanded = spec.expanded;
    s.publish = true;
    s.package_name = project_.package_name;
    s.package_version = project_.package_version;
    s.metadata = metadata();
    s.bundle_name = bundle_base_name(s.package_name, s.name);
    s.root = root_;
    // every row stages on its own so no two rows share intermediate files
    s.staging_dir = root_ / project_.build_dir / spec.name;
    s.products_dir = root_ / project_.products_dir;
    s.dist_dir = root_ / project_.dist_dir;
    s.archive_path = s.products_dir / archive_file_name(s.package_name, s.name, s.package_version);
    s.stages = {Stage::Clean, Stage::CompileAssets, Stage::ResolveModules, Stage::StageFiles, Stage::Bundle};
    s.clean_patterns = {project_.build_dir + "/" + spec.name, project_.products_dir};
    for (auto &c: project_.clean_patterns(CleanScope::Dist)) s.clean_patterns.push_back(std::move(c));
    resolve_commands(project_, s);
    return s;
}

// ------------ plans ------------

vector<BuildSettings> Make::plan_build(const BuildOptions &options) const {
    return {bind(RunKind::Build, options)};
}

vector<BuildSettings> Make::plan_distributions(const string &only) const {
    vector<BuildSettings> plan;
    if (!only.empty()) {
        const auto *spec = matrix_.find(only);
        if (!spec) throw invalid_argument(string(_("Unknown distribution: ")) + only);
        plan.push_back(bind(*spec));
        return plan;
    }
    for (const auto &spec: matrix_.specs()) plan.push_back(bind(spec));
    return plan;
}

vector<BuildSettings> Make::plan_build_dists(const string &only) const {
    vector<BuildSettings> plan{bind(RunKind::Prepare, BuildOptions{})};
    for (auto &s: plan_distributions(only)) plan.push_back(std::move(s));
    plan.push_back(bind(RunKind::VerifyDist, BuildOptions{}));
    plan.push_back(bind(RunKind::Assets, BuildOptions{}));
    return plan;
}

vector<BuildSettings> Make::plan_verify(const string &target) const {
    BuildOptions options;
    options.verify_target = target;
    return {bind(RunKind::VerifyOnly, options)};
}

vector<BuildSettings> Make::plan_load_dependencies() const {
    return {bind(RunKind::LoadDependencies, BuildOptions{})};
}

void Make::print_plan(const vector<BuildSettings> &plan, ostream &os) const {
    for (size_t i = 0; i < plan.size(); ++i) {
        const auto &s = plan[i];
        os << "[assay] Run " << (i + 1) << ": " << s.name
           << " | target=" << (s.target == BuildTarget::All ? "all" : "custom")
           << " | " << (s.expanded ? "expanded" : "minified")
           << " | staging=" << display(s.staging_dir) << "\n       ";
        for (size_t k = 0; k < s.stages.size(); ++k) {
            if (k) os << " -> ";
            os << stage_name(s.stages[k]);
        }
        os << " -> Done\n";
    }
    os << flush;
}

// ------------ execution ------------

const array<Make::StageEntry, 9> &Make::stage_table() {
    static const array<StageEntry, 9> table{
        {
            {Stage::Clean, &Make::clean},
            {Stage::StageDependencies, &Make::stage_dependencies},
            {Stage::CompileAssets, &Make::compile_assets},
            {Stage::ResolveModules, &Make::resolve_modules},
            {Stage::StageFiles, &Make::stage_files},
            {Stage::Bundle, &Make::bundle},
            {Stage::Package, &Make::package},
            {Stage::PostBuildClean, &Make::post_build_clean},
            {Stage::Verify, &Make::verify},
        }
    };
    return table;
}

RunResult Make::run(const BuildSettings &settings) {
    RunState state;
    print_status(log_, string(_("Starting run")) + " \"" + settings.name + "\"", "ok");
    for (const auto &[stage, handle]: stage_table()) {
        if (!settings.runs(stage)) continue;
        try {
            (this->*handle)(settings, state);
        } catch (const StageFailure &e) {
            print_status(log_, e.what(), "!!", true);
            return {Stage::Failed, e.stage(), e.what()};
        } catch (const fs::filesystem_error &e) {
            const StageFailure failure(stage, e.what());
            print_status(log_, failure.what(), "!!", true);
            return {Stage::Failed, stage, failure.what()};
        } catch (const exception &e) {
            print_status(log_, string(stage_name(stage)) + ": " + e.what(), "!!", true);
            return {Stage::Failed, stage, e.what()};
        }
    }
    print_status(log_, string(_("Run completed")) + " \"" + settings.name + "\"", "ok");
    return {};
}

bool Make::run_all(const vector<BuildSettings> &plan) {
    for (const auto &settings: plan) {
        if (const auto result = run(settings); !result.ok()) {
            print_status(log_, string(_("Build failed in stage ")) + stage_name(result.failed_stage), "!!", true);
            return false;
        }
    }
    print_status(log_, _("Build completed successfully"), "ok");
    return true;
}

string Make::display(const fs::path &p) const {
    return p.lexically_normal().generic_string();
}

// ------------ stages ------------

void Make::clean(const BuildSettings &settings, RunState &) {
    const size_t removed = remove_globs(settings.root, settings.clean_patterns);
    print_status(log_, string(_("Cleaned")) + " " + to_string(removed) + " " + _("entries"), "ok");
}

void Make::stage_dependencies(const BuildSettings &settings, RunState &) {
    size_t copied = 0;
    for (const auto &dep: project_.dependencies) {
        const auto matches = expand_glob(settings.root, dep.pattern);
        if (matches.empty()) {
            print_verbose(log_, string(_("no file matches dependency ")) + dep.pattern);
            continue;
        }
        for (const auto &m: matches) {
            copy_file_to(settings.root / m, settings.root / dep.to / m.filename());
            ++copied;
        }
    }
    print_status(log_, string(_("Staged")) + " " + to_string(copied) + " " + _("dependency files"), "ok");
}

void Make::compile_assets(const BuildSettings &settings, RunState &) {
    if (settings.assets_command.empty()) {
        print_verbose(log_, _("no asset command configured"));
        return;
    }
    print_verbose(log_, settings.assets_command);
    if (const int rc = run_shell(settings.assets_command, log_); rc != 0) {
        throw StageFailure(Stage::CompileAssets,
                           string(_("asset command exited with ")) + to_string(rc) + ": " + settings.assets_command);
    }
    print_status(log_, _("Compiled assets"), "ok");
}

void Make::resolve_modules(const BuildSettings &settings, RunState &state) {
    const auto descriptors = load_descriptors(settings.root, project_.module_patterns);
    if (descriptors.empty()) {
        throw StageFailure(Stage::ResolveModules, _("no module descriptors found"));
    }
    auto resolved = settings.target == BuildTarget::All
                        ? resolve(descriptors)
                        : resolve(descriptors, settings.include, settings.exclude);
    if (resolved.files.empty()) {
        throw StageFailure(Stage::ResolveModules, string(_("no module matches the filter of ")) + settings.name);
    }
    for (const auto &m: resolved.modules) print_verbose(log_, "module " + m);
    print_status(log_, string(_("Resolved")) + " " + to_string(resolved.modules.size()) + " " + _("modules") + ", " +
                       to_string(resolved.files.size()) + " " + _("files"), "ok");
    state.resolved = std::move(resolved);
}

void Make::stage_files(const BuildSettings &settings, RunState &state) {
    fs::create_directories(settings.staging_dir);
    size_t copied = 0;
    if (settings.target == BuildTarget::All) {
        for (const auto &dir: project_.stage_dirs) {
            if (!fs::exists(settings.root / dir)) continue;
            copy_into(settings.root, dir, settings.staging_dir);
            ++copied;
        }
    }
    if (state.resolved) {
        for (const auto &f: state.resolved->files) {
            if (!fs::exists(settings.root / f)) {
                throw StageFailure(Stage::StageFiles, string(_("missing source file: ")) + f);
            }
            copy_into(settings.root, f, settings.staging_dir);
            ++copied;
        }
    }
    for (const auto &n: project_.necessities) {
        if (!n.only_if.empty() && !fs::exists(settings.staging_dir / n.only_if)) continue;
        const auto matches = expand_glob(settings.root, n.pattern);
        for (const auto &m: matches) {
            if (n.to.empty()) {
                copy_into(settings.root, m, settings.staging_dir);
            } else if (matches.size() == 1 && n.to.back() != '/') {
                copy_file_to(settings.root / m, settings.staging_dir / n.to);
            } else {
                copy_file_to(settings.root / m, settings.staging_dir / n.to / m.filename());
            }
            ++copied;
        }
    }
    print_status(log_, string(_("Staged")) + " " + to_string(copied) + " " + _("entries into ") +
                       display(settings.staging_dir), "ok");
}

void Make::bundle(const BuildSettings &settings, RunState &state) {
    if (!state.resolved) throw StageFailure(Stage::Bundle, _("nothing resolved"));

    const string js = settings.bundle_name + ".js";
    const string map = js + ".map";
    const string published_js = published_file_name(js, settings.expanded);
    const string published_map = published_file_name(map, settings.expanded);

    Preamble preamble;
    preamble.package = settings.package_name;
    preamble.version = settings.package_version;
    preamble.timestamp = settings.metadata.timestamp;
    preamble.branch = settings.metadata.branch;
    preamble.revision = settings.metadata.revision;

    BundleRequest request;
    request.root = settings.root;
    request.files = state.resolved->files;
    request.output = settings.staging_dir / js;
    request.map_url = settings.publish ? published_map : map;
    request.preamble = preamble.render();
    request.expanded = settings.expanded;

    DistributionOutput out;
    if (!settings.minifier_command.empty()) {
        // external minifier: it reads the expanded concatenation and writes bundle + map
        request.output = settings.minifier_input;
        request.expanded = true;
        (void) write_bundle(request);
        if (const int rc = run_shell(settings.minifier_command, log_); rc != 0) {
            throw StageFailure(Stage::Bundle, string(_("minifier exited with ")) + to_string(rc));
        }
        fs::remove(settings.minifier_input);
        fs::path input_map = settings.minifier_input;
        input_map += ".map";
        fs::remove(input_map);
        out.bundle_path = settings.staging_dir / js;
        out.map_path = settings.staging_dir / map;
        if (!fs::exists(out.bundle_path)) {
            throw StageFailure(Stage::Bundle, string(_("minifier did not write ")) + display(out.bundle_path));
        }
    } else {
        out = write_bundle(request);
    }
    print_status(log_, string(_("Bundled")) + " " + to_string(state.resolved->files.size()) + " " + _("files into ") +
                       display(out.bundle_path), "ok");

    if (settings.publish) {
        fs::create_directories(settings.dist_dir);
        DistributionOutput published{settings.dist_dir / published_js, settings.dist_dir / published_map};
        copy_file_to(out.bundle_path, published.bundle_path);
        if (fs::exists(out.map_path)) copy_file_to(out.map_path, published.map_path);
        size_t assets = 0;
        for (const auto &dir: project_.asset_dirs) {
            for (const auto &m: expand_glob(settings.staging_dir, dir)) {
                copy_into(settings.staging_dir, m, settings.dist_dir / "assets");
                ++assets;
            }
        }
        print_status(log_, string(_("Published")) + " " + display(published.bundle_path) + " (" + to_string(assets) +
                           " " + _("asset entries") + ")", "ok");
        out = published;
    }
    state.output = out;
}

void Make::package(const BuildSettings &settings, RunState &) {
    fs::create_directories(settings.products_dir);
    print_verbose(log_, settings.archive_command);
    if (const int rc = run_shell(settings.archive_command, log_); rc != 0) {
        throw StageFailure(Stage::Package, string(_("archive command exited with ")) + to_string(rc));
    }
    if (!fs::exists(settings.archive_path)) {
        throw StageFailure(Stage::Package, string(_("archive not found: ")) + display(settings.archive_path));
    }
    print_status(log_, string(_("Packaged")) + " " + display(settings.archive_path), "ok");
}

void Make::post_build_clean(const BuildSettings &settings, RunState &state) {
    if (!state.resolved) return;
    size_t removed = 0;
    for (const auto &f: state.resolved->files) {
        if (fs::remove(settings.staging_dir / f)) ++removed;
    }
    print_status(log_, string(_("Removed")) + " " + to_string(removed) + " " + _("bundled sources from ") +
                       display(settings.staging_dir), "ok");
}

vector<VerifySpec> Make::verify_targets() const {
    if (!project_.verify.empty()) return project_.verify;
    // without @verify rows the published bundles still have to be there
    VerifySpec js;
    js.target = "js";
    js.generator = true;
    return {js};
}

ExpectedFiles Make::expected_files(const VerifySpec &spec) const {
    vector<string> files;
    for (const auto &f: spec.files) files.push_back(display(root_ / f));
    for (const auto &mapping: spec.mappings) {
        const auto colon = mapping.rename.find(':');
        const string old_text = colon == string::npos ? string() : mapping.rename.substr(0, colon);
        const string new_text = colon == string::npos ? string() : mapping.rename.substr(colon + 1);
        for (const auto &rel: expand_glob(root_ / mapping.from, mapping.match)) {
            string name = rel.filename().string();
            if (!old_text.empty()) {
                if (const auto pos = name.find(old_text); pos != string::npos) name.replace(pos, old_text.size(), new_text);
            }
            files.push_back(display(root_ / mapping.to / rel.parent_path() / name));
        }
    }
    if (!spec.generator) return files;

    const DistributionMatrix matrix = matrix_;
    const string package = project_.package_name;
    const fs::path dist = (root_ / project_.dist_dir).lexically_normal();
    return FileListGenerator([matrix, package, dist, files] {
        auto out = matrix.expected_files(package, dist);
        out.insert(out.end(), files.begin(), files.end());
        return out;
    });
}

void Make::verify(const BuildSettings &settings, RunState &) {
    const auto targets = verify_targets();
    size_t checked = 0;
    for (const auto &spec: targets) {
        if (!settings.verify_target.empty() && spec.target != settings.verify_target) continue;
        const string message = string(_("Verifying all")) + " \"" + spec.target + "\" " + _("files are in ") +
                               display(settings.dist_dir);
        checked += verify_target(message, expected_files(spec), log_).expected_count();
    }
    if (checked == 0) {
        if (!settings.verify_target.empty()) {
            throw StageFailure(Stage::Verify, string(_("Unknown or empty verification target: ")) + settings.verify_target);
        }
        throw StageFailure(Stage::Verify, _("nothing to verify"));
    }
}
