#include "../include/Assay.hpp"
#include "../include/Make.hpp"
#include "../include/ModuleGraph.hpp"
#include "../include/Status.hpp"
#include <clocale>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#ifndef ASSAY_LOCALEDIR
#define ASSAY_LOCALEDIR "/usr/share/locale"
#endif

using namespace assay;
namespace fs = std::filesystem;

namespace {
    struct CliArgs {
        std::string command = "build";
        std::string argument; // text after "command:"
        std::string file = "Assayfile";
        BuildOptions options;
        bool dry_run = false;
    };

    void usage(std::ostream &os) {
        os << _("usage: assay [command] [--file Assayfile] [--name N] [--include a,b] [--exclude c,d]\n"
                "             [--source] [--verbose] [--dry-run]\n"
                "commands:\n"
                "  build[:all|:custom]      default: build:all\n"
                "  custom                   same as build:custom\n"
                "  distributions[:name]     every distribution, or one\n"
                "  buildDists[:name]        clean, load dependencies, distributions, verify, dev assets\n"
                "  verifyDistFiles[:target]\n"
                "  loadDependencies\n"
                "  plan                     print the parsed project\n");
    }

    // "--key=value" or "--key value"
    std::string option_value(const std::string &arg, const std::string &key, int &i, const int argc, char **argv) {
        if (arg.size() > key.size() && arg[key.size()] == '=') return arg.substr(key.size() + 1);
        if (i + 1 >= argc) throw std::invalid_argument(std::string(_("missing value for ")) + key);
        return argv[++i];
    }

    bool has_prefix(const std::string &arg, const std::string &key) {
        return arg == key || arg.rfind(key + "=", 0) == 0;
    }

    CliArgs parse_args(const int argc, char **argv) {
        CliArgs args;
        bool have_command = false;
        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];
            if (has_prefix(arg, "--file")) {
                args.file = option_value(arg, "--file", i, argc, argv);
            } else if (has_prefix(arg, "--name")) {
                args.options.name = option_value(arg, "--name", i, argc, argv);
            } else if (has_prefix(arg, "--include")) {
                args.options.include = parse_tag_list(option_value(arg, "--include", i, argc, argv));
            } else if (has_prefix(arg, "--exclude")) {
                args.options.exclude = parse_tag_list(option_value(arg, "--exclude", i, argc, argv));
            } else if (arg == "--source") {
                args.options.expanded = true;
            } else if (arg == "--verbose" || arg == "-v") {
                set_verbose(true);
            } else if (arg == "--dry-run") {
                args.dry_run = true;
            } else if (arg.rfind("--", 0) == 0) {
                throw std::invalid_argument(std::string(_("unknown option ")) + arg);
            } else if (!have_command) {
                const auto colon = arg.find(':');
                args.command = arg.substr(0, colon);
                if (colon != std::string::npos) args.argument = arg.substr(colon + 1);
                have_command = true;
            } else {
                throw std::invalid_argument(std::string(_("unexpected argument ")) + arg);
            }
        }
        return args;
    }

    std::vector<BuildSettings> plan_for(const Make &make, CliArgs &args) {
        if (args.command == "build" || args.command == "custom") {
            if (args.command == "custom" || args.argument == "custom") {
                args.options.target = BuildTarget::Custom;
            } else if (!args.argument.empty() && args.argument != "all") {
                throw std::invalid_argument(std::string(_("unknown build target ")) + args.argument);
            }
            return make.plan_build(args.options);
        }
        if (args.command == "distributions") return make.plan_distributions(args.argument);
        if (args.command == "buildDists") return make.plan_build_dists(args.argument);
        if (args.command == "verifyDistFiles") return make.plan_verify(args.argument);
        if (args.command == "loadDependencies") return make.plan_load_dependencies();
        throw std::invalid_argument(std::string(_("unknown command ")) + args.command);
    }
} // namespace

int main(const int argc, char **argv) {
    std::setlocale(LC_ALL, "");
    bindtextdomain("assay", ASSAY_LOCALEDIR);
    textdomain("assay");

    CliArgs args;
    try {
        args = parse_args(argc, argv);
    } catch (const std::invalid_argument &e) {
        std::cerr << e.what() << "\n";
        usage(std::cerr);
        return 2;
    }
    if (args.command == "help") {
        usage(std::cout);
        return 0;
    }

    AssayParser parser;
    try {
        parser.parse_file(args.file);
        parser.finalize();
    } catch (const std::exception &e) {
        print_status(std::cout, e.what(), "!!", true);
        return 1;
    }
    if (args.command == "plan") {
        parser.print_plan(std::cout);
        return 0;
    }

    fs::path root = fs::path(args.file).parent_path();
    if (root.empty()) root = ".";
    Make make(parser.config(), root, std::cout);

    std::vector<BuildSettings> plan;
    try {
        plan = plan_for(make, args);
    } catch (const std::invalid_argument &e) {
        std::cerr << e.what() << "\n";
        usage(std::cerr);
        return 2;
    }
    if (args.dry_run) {
        make.print_plan(plan, std::cout);
        return 0;
    }
    return make.run_all(plan) ? 0 : 1;
}
