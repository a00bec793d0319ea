#include "../include/ModuleGraph.hpp"
#include "../include/Staging.hpp"
#include "../include/Status.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <iostream>
#include <set>
#include <sstream>
#include <unordered_map>
#include <unordered_set>

using namespace assay;
namespace fs = std::filesystem;

namespace {
    std::string join(const std::vector<std::string> &items, const std::string &sep) {
        std::string out;
        for (std::size_t i = 0; i < items.size(); ++i) {
            if (i) out += sep;
            out += items[i];
        }
        return out;
    }

    bool has_any_tag(const ModuleDescriptor &module, const TagSet &tags) {
        return std::any_of(module.tags.begin(), module.tags.end(),
                           [&](const std::string &t) { return tags.count(t) != 0; });
    }

    // Depth-first search over the whole graph. Dependencies on undeclared
    // modules are skipped here and reported by the closure walk.
    class CycleFinder {
    public:
        CycleFinder(const std::vector<ModuleDescriptor> &d, const std::unordered_map<std::string, std::size_t> &idx)
            : descs(d), index(idx), color(d.size(), 0) {
        }

        void run() {
            for (std::size_t i = 0; i < descs.size(); ++i) {
                if (color[i] == 0) visit(i);
            }
        }

    private:
        void visit(const std::size_t i) {
            color[i] = 1;
            path.push_back(i);
            for (const auto &dep: descs[i].dependencies) {
                const auto it = index.find(dep);
                if (it == index.end()) continue;
                const std::size_t j = it->second;
                if (color[j] == 1) {
                    std::vector<std::string> cycle;
                    const auto from = std::find(path.begin(), path.end(), j);
                    for (auto p = from; p != path.end(); ++p) cycle.push_back(descs[*p].name);
                    cycle.push_back(descs[j].name);
                    throw CycleError(std::move(cycle));
                }
                if (color[j] == 0) visit(j);
            }
            path.pop_back();
            color[i] = 2;
        }

        const std::vector<ModuleDescriptor> &descs;
        const std::unordered_map<std::string, std::size_t> &index;
        std::vector<int> color; // 0 = new, 1 = on path, 2 = done
        std::vector<std::size_t> path;
    };

    std::vector<std::string> string_array(const nlohmann::ordered_json &node, const char *key, const fs::path &file,
                                          const std::string &module) {
        std::vector<std::string> out;
        if (!node.contains(key)) return out;
        const auto &arr = node.at(key);
        if (!arr.is_array()) {
            throw std::runtime_error("invalid descriptor file '" + file.string() + "': '" + key + "' of module '" +
                                     module + "' must be an array");
        }
        for (const auto &v: arr) {
            if (!v.is_string()) {
                throw std::runtime_error("invalid descriptor file '" + file.string() + "': '" + key + "' of module '" +
                                         module + "' must contain only strings");
            }
            out.push_back(v.get<std::string>());
        }
        return out;
    }

    ModuleDescriptor make_descriptor(const std::string &name, const nlohmann::ordered_json &node, const fs::path &file,
                                     const fs::path &dir_rel) {
        if (name.empty()) {
            throw std::runtime_error("invalid descriptor file '" + file.string() + "': module without a name");
        }
        if (!node.is_object()) {
            throw std::runtime_error("invalid descriptor file '" + file.string() + "': module '" + name +
                                     "' must be an object");
        }
        ModuleDescriptor d;
        d.name = name;
        d.directory = dir_rel.generic_string();
        for (const auto &f: string_array(node, "files", file, name)) {
            d.files.push_back((dir_rel / f).lexically_normal().generic_string());
        }
        if (d.files.empty()) {
            throw std::runtime_error("invalid descriptor file '" + file.string() + "': module '" + name +
                                     "' declares no files");
        }
        d.dependencies = string_array(node, "dependencies", file, name);
        for (auto &t: string_array(node, "tags", file, name)) d.tags.insert(std::move(t));
        if (d.tags.empty()) d.tags.insert(name);
        return d;
    }
} // namespace

CycleError::CycleError(std::vector<std::string> cycle)
    : std::runtime_error(std::string(_("dependency cycle between modules: ")) + join(cycle, " -> ")),
      cycle_(std::move(cycle)) {
}

namespace assay {
    bool is_excluded(const ModuleDescriptor &module, const std::optional<TagSet> &exclude) {
        return exclude.has_value() && has_any_tag(module, *exclude);
    }

    bool is_selected(const ModuleDescriptor &module, const std::optional<TagSet> &include,
                     const std::optional<TagSet> &exclude) {
        if (include.has_value() && !has_any_tag(module, *include)) return false;
        return !is_excluded(module, exclude);
    }

    ResolvedFileSet resolve(const std::vector<ModuleDescriptor> &descriptors, const std::optional<TagSet> &include,
                            const std::optional<TagSet> &exclude) {
        const std::size_t n = descriptors.size();
        std::unordered_map<std::string, std::size_t> index;
        for (std::size_t i = 0; i < n; ++i) {
            if (!index.emplace(descriptors[i].name, i).second) {
                throw ResolveError(std::string(_("duplicate module name: ")) + descriptors[i].name);
            }
        }
        CycleFinder(descriptors, index).run();

        // 1) selection + dependency closure
        std::vector<bool> in_closure(n, false);
        std::vector<std::size_t> pending;
        for (std::size_t i = n; i-- > 0;) {
            if (is_selected(descriptors[i], include, exclude)) pending.push_back(i);
        }
        while (!pending.empty()) {
            const std::size_t i = pending.back();
            pending.pop_back();
            if (in_closure[i]) continue;
            in_closure[i] = true;
            for (const auto &dep: descriptors[i].dependencies) {
                const auto it = index.find(dep);
                if (it == index.end()) {
                    throw ResolveError("module '" + descriptors[i].name + "' " + _("depends on unknown module") +
                                       " '" + dep + "'");
                }
                if (is_excluded(descriptors[it->second], exclude)) continue;
                if (!in_closure[it->second]) pending.push_back(it->second);
            }
        }

        // 2) Kahn, smallest declaration index first
        std::vector<std::size_t> in_degree(n, 0);
        std::vector<std::vector<std::size_t> > dependents(n);
        for (std::size_t i = 0; i < n; ++i) {
            if (!in_closure[i]) continue;
            std::unordered_set<std::size_t> seen;
            for (const auto &dep: descriptors[i].dependencies) {
                const std::size_t j = index.at(dep);
                if (!in_closure[j] || !seen.insert(j).second) continue;
                ++in_degree[i];
                dependents[j].push_back(i);
            }
        }
        std::set<std::size_t> ready;
        for (std::size_t i = 0; i < n; ++i) {
            if (in_closure[i] && in_degree[i] == 0) ready.insert(i);
        }

        // 3) flatten, first occurrence wins
        ResolvedFileSet out;
        std::unordered_set<std::string> seen_files;
        std::unordered_set<std::string> seen_dirs;
        while (!ready.empty()) {
            const std::size_t i = *ready.begin();
            ready.erase(ready.begin());
            const auto &m = descriptors[i];
            out.modules.push_back(m.name);
            if (seen_dirs.insert(m.directory).second) out.directories.push_back(m.directory);
            for (const auto &f: m.files) {
                if (seen_files.insert(f).second) out.files.push_back(f);
            }
            for (const std::size_t d: dependents[i]) {
                if (--in_degree[d] == 0) ready.insert(d);
            }
        }
        return out;
    }

    std::vector<ModuleDescriptor> load_descriptor_file(const fs::path &root, const fs::path &file) {
        nlohmann::ordered_json doc;
        {
            std::ifstream ifs(file);
            if (!ifs) {
                throw std::runtime_error("failed to open descriptor file '" + file.string() + "'");
            }
            try {
                doc = nlohmann::ordered_json::parse(ifs);
            } catch (const nlohmann::ordered_json::parse_error &e) {
                throw std::runtime_error("failed to parse descriptor file '" + file.string() + "': " + e.what());
            }
        }

        const fs::path dir_rel = fs::absolute(file).parent_path().lexically_relative(fs::absolute(root));
        std::vector<ModuleDescriptor> out;
        const auto record = [&](const nlohmann::ordered_json &node) {
            if (!node.is_object() || !node.contains("name") || !node.at("name").is_string()) {
                throw std::runtime_error("invalid descriptor file '" + file.string() + "': record without a name");
            }
            out.push_back(make_descriptor(node.at("name").get<std::string>(), node, file, dir_rel));
        };

        if (doc.is_array()) {
            for (const auto &node: doc) record(node);
        } else if (doc.is_object() && doc.contains("name") && doc.at("name").is_string() && doc.contains("files")) {
            record(doc);
        } else if (doc.is_object()) {
            // keyed shape: { "<module>": { "files": [...], ... } }
            for (const auto &[name, node]: doc.items()) {
                out.push_back(make_descriptor(name, node, file, dir_rel));
            }
        } else {
            throw std::runtime_error("invalid descriptor file '" + file.string() + "': expected an object or array");
        }
        return out;
    }

    std::vector<ModuleDescriptor> load_descriptors(const fs::path &root, const std::vector<std::string> &patterns) {
        std::vector<ModuleDescriptor> out;
        for (const auto &pattern: patterns) {
            for (const auto &file: expand_glob(root, pattern)) {
                auto mods = load_descriptor_file(root, root / file);
                print_verbose(std::cout, file.generic_string() + ": " + std::to_string(mods.size()) + " module(s)");
                for (auto &m: mods) out.push_back(std::move(m));
            }
        }
        return out;
    }

    std::optional<TagSet> parse_tag_list(const std::string &csv) {
        TagSet tags;
        std::stringstream ss(csv);
        std::string item;
        while (std::getline(ss, item, ',')) {
            const auto b = item.find_first_not_of(" \t");
            if (b == std::string::npos) continue;
            const auto e = item.find_last_not_of(" \t");
            tags.insert(item.substr(b, e - b + 1));
        }
        if (tags.empty()) return std::nullopt;
        return tags;
    }
} // namespace assay
