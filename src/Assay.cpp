#include "../include/Assay.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <regex>
#include <sstream>
#include <stdexcept>

using namespace assay;
namespace fs = std::filesystem;

// ------------ ProjectConfig ------------

DistributionMatrix ProjectConfig::matrix() const {
    if (distributions.empty()) return DistributionMatrix::standard();
    return DistributionMatrix(distributions);
}

std::vector<std::string> ProjectConfig::clean_patterns(const CleanScope scope) const {
    std::vector<std::string> out;
    for (const auto &c: cleans) {
        if (c.scope == scope) out.push_back(c.pattern);
    }
    return out;
}

// ------------ Helpers ------------

std::string AssayParser::trim(const std::string &x) {
    auto start = x.begin();
    while (start != x.end() && std::isspace(static_cast<unsigned char>(*start))) {
        ++start;
    }
    auto rend = x.rbegin();
    while (rend != x.rend() && std::isspace(static_cast<unsigned char>(*rend))) {
        ++rend;
    }
    if (start >= rend.base()) return {};
    return std::string(start, rend.base());
}

bool AssayParser::starts_with(const std::string &s, const std::string &p) {
    return s.size() >= p.size() && s.compare(0, p.size(), p) == 0;
}

std::vector<std::string> AssayParser::split_ws(const std::string &line) {
    std::vector<std::string> tokens;
    std::istringstream iss(line);
    std::string tok;
    while (iss >> tok) tokens.push_back(std::move(tok));
    return tokens;
}

std::string AssayParser::strip_quotes(std::string x) {
    x = trim(x);
    if (x.size() >= 2) {
        const char a = x.front(), b = x.back();
        if ((a == '"' && b == '"') || (a == '\'' && b == '\'')) {
            x = x.substr(1, x.size() - 2);
        }
    }
    return x;
}

std::string AssayParser::first_token(const std::string &rest, std::string &after) const {
    const std::string t = trim(rest);
    if (t.empty()) {
        after.clear();
        return {};
    }
    if (t.front() == '"' || t.front() == '\'') {
        const auto close = t.find(t.front(), 1);
        if (close == std::string::npos) bad("Unterminated quote in: " + rest);
        after = trim(t.substr(close + 1));
        return expand_vars(t.substr(1, close - 1));
    }
    size_t j = 0;
    while (j < t.size() && !std::isspace(static_cast<unsigned char>(t[j]))) ++j;
    after = trim(t.substr(j));
    return expand_vars(t.substr(0, j));
}

std::optional<std::string> AssayParser::attribute(const std::string &rest, const std::string &key) const {
    const std::regex re("(^|\\s)" + key + R"re(\s*=\s*"([^"]*)")re");
    std::smatch m;
    if (std::regex_search(rest, m, re) && m.size() >= 3) return expand_vars(m[2].str());
    return std::nullopt;
}

std::optional<TagSet> AssayParser::tag_attribute(const std::string &rest, const std::string &key) const {
    if (auto quoted = attribute(rest, key)) return parse_tag_list(*quoted);
    const std::regex re("(^|\\s)" + key + R"re(\s*=\s*\[([^\]]*)\])re");
    std::smatch m;
    if (std::regex_search(rest, m, re) && m.size() >= 3) return parse_tag_list(expand_vars(m[2].str()));
    return std::nullopt;
}

[[noreturn]] void AssayParser::bad(const std::string &msg) const {
    std::string where = "[Assayfile]";
    if (!file_stack.empty()) where = "[" + file_stack.back().filename().string() + "]";
    throw std::runtime_error(where + " line " + std::to_string(currentLine) + ": " + msg);
}

// ------------ Core ------------

AssayParser::AssayParser() = default;

void AssayParser::parse_file(const std::string &path) {
    fs::path p = fs::absolute(path);
    if (include_depth >= include_depth_max) bad("Include depth exceeded");
    if (!fs::exists(p)) bad("Failed to open file: " + p.string());

    std::string key = p.string();
    if (include_guard.find(key) != include_guard.end()) {
        bad("Circular include detected: " + key);
    }

    std::ifstream in(p);
    if (!in.is_open()) bad("Failed to open file: " + p.string());

    // RAII guard for the file stack, the include set and the line counter
    struct IncludeGuardRAII {
        AssayParser *self;
        std::string key;
        int saved_line;

        IncludeGuardRAII(AssayParser *s, std::string k, fs::path pth)
            : self(s), key(std::move(k)), saved_line(s->currentLine) {
            self->include_guard.insert(key);
            self->file_stack.push_back(std::move(pth));
            self->include_depth++;
        }

        ~IncludeGuardRAII() {
            self->include_guard.erase(key);
            if (!self->file_stack.empty()) self->file_stack.pop_back();
            self->include_depth--;
            self->currentLine = saved_line;
        }
    } guard(this, key, p);

    std::string line;
    currentLine = 0;
    while (std::getline(in, line)) {
        ++currentLine;
        parse_line(line);
    }
}

void AssayParser::parse_line(const std::string &line) {
    std::string s = trim(line);
    if (s.empty()) return;
    if (starts_with(s, "//") || starts_with(s, "#")) return;
    // trailing comments, outside quotes
    {
        bool inq = false;
        for (size_t i = 0; i < s.size(); ++i) {
            if (s[i] == '"') inq = !inq;
            if (inq) continue;
            if (s[i] == '#' || (s[i] == '/' && i + 1 < s.size() && s[i + 1] == '/')) {
                if (i == 0 || std::isspace(static_cast<unsigned char>(s[i - 1]))) {
                    s = trim(s.substr(0, i));
                    break;
                }
            }
        }
    }
    if (s.empty()) return;
    if (s.front() != '@') bad("Unknown directive: " + s);

    const auto toks = split_ws(s);
    const std::string directive = toks.front();
    const std::string rest = trim(s.substr(directive.size()));

    if (directive == "@include") {
        if (rest.empty()) bad("@include expects a path");
        std::string target_rel = strip_quotes(expand_vars(strip_quotes(rest)));
        fs::path base = file_stack.empty() ? fs::current_path() : file_stack.back().parent_path();
        fs::path target = fs::absolute(base / target_rel);
        if (!fs::exists(target)) {
            bad(std::string("@include file not found: ") + target.string() + " (base=" + base.string() + ")");
        }
        parse_file(target.string());
        return;
    }

    // ----- @let -----
    if (directive == "@let") {
        if (rest.empty()) bad("@let expects NAME=VALUE or NAME VALUE");
        auto eq = rest.find('=');
        std::string name, value;
        if (eq == std::string::npos) {
            if (const auto parts = split_ws(rest); parts.size() == 1) {
                name = parts[0];
                value = "1";
            } else if (parts.size() >= 2) {
                name = parts[0];
                for (size_t i = 1; i < parts.size(); ++i) {
                    if (i > 1) value.push_back(' ');
                    value += parts[i];
                }
            } else bad("@let invalid syntax");
        } else {
            name = trim(rest.substr(0, eq));
            value = trim(rest.substr(eq + 1));
        }
        if (name.empty()) bad("@let invalid name");
        vars[name] = expand_vars(strip_quotes(value));
        return;
    }

    // ----- project -----
    if (directive == "@package") {
        if (toks.size() != 3) bad("@package expects NAME VERSION");
        project.package_name = expand_vars(toks[1]);
        project.package_version = expand_vars(toks[2]);
        vars["PACKAGE"] = project.package_name;
        vars["VERSION"] = project.package_version;
        have_package = true;
        return;
    }
    if (directive == "@dirs") {
        if (rest.empty()) bad("@dirs expects build=DIR products=DIR dist=DIR");
        for (const auto &t: split_ws(rest)) {
            const auto eq = t.find('=');
            if (eq == std::string::npos) bad("@dirs expects key=DIR, got: " + t);
            const auto k = trim(t.substr(0, eq));
            const auto v = expand_vars(strip_quotes(t.substr(eq + 1)));
            if (v.empty()) bad("@dirs empty directory for " + k);
            if (k == "build") project.build_dir = v;
            else if (k == "products") project.products_dir = v;
            else if (k == "dist") project.dist_dir = v;
            else bad("@dirs unknown key: " + k);
        }
        vars["BUILD"] = project.build_dir;
        vars["PRODUCTS"] = project.products_dir;
        vars["DIST"] = project.dist_dir;
        return;
    }
    if (directive == "@modules") {
        std::string after;
        const auto pattern = first_token(rest, after);
        if (pattern.empty()) bad("@modules expects a glob");
        project.module_patterns.push_back(pattern);
        return;
    }
    if (directive == "@distribution") {
        parse_distribution(rest);
        return;
    }
    if (directive == "@necessity") {
        std::string after;
        NecessitySpec n;
        n.pattern = first_token(rest, after);
        if (n.pattern.empty()) bad("@necessity expects a glob");
        n.to = attribute(after, "to").value_or("");
        n.only_if = attribute(after, "if").value_or("");
        project.necessities.push_back(std::move(n));
        return;
    }
    if (directive == "@dependency") {
        std::string after;
        DependencySpec d;
        d.pattern = first_token(rest, after);
        if (d.pattern.empty()) bad("@dependency expects a glob");
        const auto to = attribute(after, "to");
        if (!to || to->empty()) bad("@dependency missing to=\"...\"");
        d.to = *to;
        project.dependencies.push_back(std::move(d));
        return;
    }
    if (directive == "@stage" || directive == "@asset") {
        std::string after;
        auto dir = first_token(rest, after);
        if (dir.empty()) bad(directive + " expects a directory");
        (directive == "@stage" ? project.stage_dirs : project.asset_dirs).push_back(std::move(dir));
        return;
    }
    if (directive == "@clean") {
        if (toks.size() < 3) bad("@clean expects SCOPE GLOB");
        CleanSpec c;
        if (toks[1] == "full") c.scope = CleanScope::Full;
        else if (toks[1] == "dist") c.scope = CleanScope::Dist;
        else if (toks[1] == "dev") c.scope = CleanScope::Dev;
        else if (toks[1] == "deps") c.scope = CleanScope::Deps;
        else bad("@clean scope must be full, dist, dev or deps");
        std::string after;
        c.pattern = first_token(trim(rest.substr(toks[1].size())), after);
        project.cleans.push_back(std::move(c));
        return;
    }
    if (directive == "@revision" || directive == "@branch") {
        auto &spec = directive == "@revision" ? project.revision : project.branch;
        const auto task = attribute(rest, "task");
        if (!task) bad(directive + " missing task=\"...\"");
        spec.task = *task;
        if (auto d = attribute(rest, "default")) spec.default_value = *d;
        return;
    }
    if (directive == "@assets") {
        if (toks.size() < 2) bad("@assets expects dev|dist task=\"...\"");
        const auto task = attribute(rest, "task");
        if (!task) bad("@assets missing task=\"...\"");
        if (toks[1] == "dev") project.assets_dev_task = *task;
        else if (toks[1] == "dist") project.assets_dist_task = *task;
        else bad("@assets mode must be dev or dist");
        return;
    }
    if (directive == "@archiver" || directive == "@minifier") {
        const auto task = attribute(rest, "task");
        if (!task) bad(directive + " missing task=\"...\"");
        (directive == "@archiver" ? project.archiver_task : project.minifier_task) = *task;
        return;
    }
    if (directive == "@verify") {
        parse_verify(rest);
        return;
    }
    bad("Unknown directive: " + s);
}

void AssayParser::parse_distribution(const std::string &rest) {
    std::string after;
    DistributionSpec d;
    d.name = first_token(rest, after);
    if (d.name.empty()) bad("@distribution expects a name");
    d.include = tag_attribute(after, "include");
    d.exclude = tag_attribute(after, "exclude");
    for (const auto &t: split_ws(after)) {
        if (!starts_with(t, "expanded=")) continue;
        d.expanded = parse_flag(strip_quotes(t.substr(std::string("expanded=").size())));
    }
    for (const auto &existing: project.distributions) {
        if (existing.name == d.name) bad("Duplicate distribution name: " + d.name);
    }
    project.distributions.push_back(std::move(d));
}

void AssayParser::parse_verify(const std::string &rest) {
    std::string after;
    VerifySpec v;
    v.target = first_token(rest, after);
    if (v.target.empty()) bad("@verify expects a target name");

    // rows for the same target accumulate
    auto it = std::find_if(project.verify.begin(), project.verify.end(),
                           [&](const VerifySpec &x) { return x.target == v.target; });
    const bool is_new = it == project.verify.end();
    VerifySpec &spec = is_new ? v : *it;

    if (auto g = attribute(after, "generator"); g || after.find("generator=distributions") != std::string::npos) {
        if (g && *g != "distributions") bad("@verify unknown generator: " + *g);
        spec.generator = true;
    } else if (auto f = attribute(after, "file")) {
        spec.files.push_back(*f);
    } else {
        VerifyMapping mapping;
        auto from = attribute(after, "from");
        auto match = attribute(after, "match");
        auto to = attribute(after, "to");
        if (!from || !match || !to) bad("@verify expects file=, generator= or from=/match=/to=");
        mapping.from = *from;
        mapping.match = *match;
        mapping.to = *to;
        mapping.rename = attribute(after, "rename").value_or("");
        if (!mapping.rename.empty() && mapping.rename.find(':') == std::string::npos) {
            bad("@verify rename expects old:new");
        }
        spec.mappings.push_back(std::move(mapping));
    }
    if (is_new) project.verify.push_back(std::move(v));
}

void AssayParser::finalize() {
    if (!have_package) bad("Missing @package NAME VERSION");
    if (project.module_patterns.empty()) bad("Missing @modules GLOB");
    try {
        (void) project.matrix();
    } catch (const std::invalid_argument &e) {
        bad(e.what());
    }
}

void AssayParser::print_plan(std::ostream &os) const {
    os << "[assay] Package: " << project.package_name << " v" << project.package_version << "\n";
    os << "[assay] Dirs: build=" << project.build_dir << " products=" << project.products_dir
       << " dist=" << project.dist_dir << "\n";
    os << "[assay] Modules:";
    for (const auto &p: project.module_patterns) os << " " << p;
    os << "\n[assay] Distributions:\n";
    const auto print_tags = [&](const char *label, const std::optional<TagSet> &tags) {
        if (!tags) return;
        os << " | " << label << "=[";
        bool first = true;
        for (const auto &t: *tags) {
            if (!first) os << ",";
            os << t;
            first = false;
        }
        os << "]";
    };
    const DistributionMatrix matrix = project.matrix();
    for (const auto &d: matrix.specs()) {
        os << "  • " << d.name << " | " << (d.is_custom() ? "custom" : "all")
           << " | " << (d.expanded ? "expanded" : "minified");
        print_tags("include", d.include);
        print_tags("exclude", d.exclude);
        os << "\n";
    }
    if (!project.verify.empty()) {
        os << "[assay] Verify:";
        for (const auto &v: project.verify) os << " " << v.target;
        os << "\n";
    }
    os << std::flush;
}

std::string AssayParser::expand_vars(const std::string &in) const {
    return expand_template(in, vars);
}

namespace assay {
    std::string expand_template(const std::string &in, const std::unordered_map<std::string, std::string> &vars) {
        std::string out;
        out.reserve(in.size());
        size_t pos = 0;
        while (pos < in.size()) {
            const size_t open = in.find("${", pos);
            if (open == std::string::npos) break;
            const size_t close = in.find('}', open + 2);
            if (close == std::string::npos) break;
            out.append(in, pos, open - pos);
            const std::string name = in.substr(open + 2, close - open - 2);
            const auto it = vars.find(name);
            if (it != vars.end()) out += it->second;
            else out.append(in, open, close - open + 1);
            pos = close + 1;
        }
        out.append(in, pos, std::string::npos);
        return out;
    }
} // namespace assay

bool AssayParser::parse_flag(const std::string &v) const {
    if (v == "true" || v == "1" || v == "yes") return true;
    if (v == "false" || v == "0" || v == "no") return false;
    bad("expected true or false, got: " + v);
}
