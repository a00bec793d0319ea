#pragma once
#include <filesystem>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace assay {
    using TagSet = std::set<std::string>;

    /**
     * @brief One module as declared by a descriptor file.
     *
     * `files` are relative to the project root once loaded. `directory` is the
     * folder holding the descriptor (root-relative, may be empty).
     */
    struct ModuleDescriptor {
        std::string name;
        std::vector<std::string> files;
        std::vector<std::string> dependencies;
        TagSet tags;
        std::string directory;
    };

    /**
     * @brief Output of one resolution: files in bundle order, without repeats.
     *
     * `modules` lists the modules that contributed, in the same order, and
     * `directories` their descriptor folders (first occurrence kept).
     */
    struct ResolvedFileSet {
        std::vector<std::string> files;
        std::vector<std::string> modules;
        std::vector<std::string> directories;
    };

    // The dependency graph is not acyclic. `modules()` holds one cycle in
    // dependency order, first module repeated at the end.
    class CycleError : public std::runtime_error {
    public:
        explicit CycleError(std::vector<std::string> cycle);

        [[nodiscard]] const std::vector<std::string> &modules() const { return cycle_; }

    private:
        std::vector<std::string> cycle_;
    };

    // Duplicate module names or a dependency on an undeclared module.
    class ResolveError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    /**
     * @brief Compute the ordered file list for an include/exclude tag filter.
     *
     * A module is selected when it has a tag in `include` (or include is absent)
     * and no tag in `exclude` (or exclude is absent). Selected modules pull in
     * their transitive dependencies whatever their tags, except modules that
     * match `exclude`: those are always dropped. Modules are ordered so every
     * dependency comes first, ties going to declaration order.
     *
     * @throws CycleError if any cycle exists among the descriptors.
     * @throws ResolveError on duplicate names or unknown dependencies.
     */
    [[nodiscard]] ResolvedFileSet resolve(const std::vector<ModuleDescriptor> &descriptors,
                                          const std::optional<TagSet> &include = std::nullopt,
                                          const std::optional<TagSet> &exclude = std::nullopt);

    // Filter predicate used by resolve(), exposed for diagnostics.
    [[nodiscard]] bool is_selected(const ModuleDescriptor &module, const std::optional<TagSet> &include,
                                   const std::optional<TagSet> &exclude);

    [[nodiscard]] bool is_excluded(const ModuleDescriptor &module, const std::optional<TagSet> &exclude);

    // Parse one descriptor file. `root` is the project root the returned paths
    // are made relative to.
    [[nodiscard]] std::vector<ModuleDescriptor> load_descriptor_file(const std::filesystem::path &root,
                                                                     const std::filesystem::path &file);

    // Load every descriptor file matched by `patterns` (globs relative to root),
    // in sorted path order.
    [[nodiscard]] std::vector<ModuleDescriptor> load_descriptors(const std::filesystem::path &root,
                                                                 const std::vector<std::string> &patterns);

    // "a, b ,c" -> {a, b, c}; empty input -> nullopt.
    [[nodiscard]] std::optional<TagSet> parse_tag_list(const std::string &csv);
} // namespace assay
