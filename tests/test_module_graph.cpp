#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include "../include/ModuleGraph.hpp"

using namespace assay;
namespace fs = std::filesystem;

namespace
{
    ModuleDescriptor mod(std::string name, std::vector<std::string> files, std::vector<std::string> deps,
                         TagSet tags = {})
    {
        ModuleDescriptor m;
        m.name = std::move(name);
        m.files = std::move(files);
        m.dependencies = std::move(deps);
        m.tags = tags.empty() ? TagSet{m.name} : std::move(tags);
        return m;
    }

    struct TmpDir
    {
        fs::path path;

        explicit TmpDir(const std::string &name) : path(fs::temp_directory_path() / name)
        {
            fs::remove_all(path);
            fs::create_directories(path);
        }

        ~TmpDir()
        {
            std::error_code ec;
            fs::remove_all(path, ec);
        }

        void write(const std::string &rel, const std::string &text) const
        {
            fs::create_directories((path / rel).parent_path());
            std::ofstream o(path / rel);
            o << text;
        }
    };

    // jQuery <- framework <- renderer, jQueryUI <- uiOptions
    std::vector<ModuleDescriptor> sample()
    {
        return {
            mod("jQuery", {"lib/jquery.js"}, {}),
            mod("jQueryUI", {"lib/jquery-ui.js"}, {"jQuery"}),
            mod("framework", {"core/Fluid.js", "core/DataBinding.js"}, {"jQuery"}, {"framework"}),
            mod("renderer", {"core/Renderer.js"}, {"framework"}, {"framework", "renderer"}),
            mod("uiOptions", {"uio/UIOptions.js", "core/Fluid.js"}, {"renderer", "jQueryUI"}, {"uiOptions"}),
        };
    }
} // namespace

TEST(ModuleGraph, NoFilterTakesEverythingInDependencyOrder)
{
    const auto r = resolve(sample());
    const std::vector<std::string> mods{"jQuery", "jQueryUI", "framework", "renderer", "uiOptions"};
    EXPECT_EQ(r.modules, mods);
    const std::vector<std::string> files{
        "lib/jquery.js", "lib/jquery-ui.js", "core/Fluid.js", "core/DataBinding.js", "core/Renderer.js",
        "uio/UIOptions.js"
    };
    EXPECT_EQ(r.files, files); // core/Fluid.js listed once
}

TEST(ModuleGraph, IncludePullsDependencies)
{
    const auto r = resolve(sample(), TagSet{"renderer"});
    const std::vector<std::string> mods{"jQuery", "framework", "renderer"};
    EXPECT_EQ(r.modules, mods);
}

TEST(ModuleGraph, ExcludeWinsOverDependency)
{
    const auto r = resolve(sample(), TagSet{"framework"}, TagSet{"jQuery", "jQueryUI"});
    const std::vector<std::string> mods{"framework", "renderer"};
    EXPECT_EQ(r.modules, mods);
    for (const auto &f: r.files) EXPECT_EQ(f.find("lib/"), std::string::npos) << f;
}

TEST(ModuleGraph, EmptySelection)
{
    const auto r = resolve(sample(), TagSet{"nothing"});
    EXPECT_TRUE(r.files.empty());
    EXPECT_TRUE(r.modules.empty());
}

TEST(ModuleGraph, DependenciesPrecedeDependentsWhateverDeclarationOrder)
{
    const std::vector<ModuleDescriptor> d{
        mod("c", {"c.js"}, {"b"}),
        mod("b", {"b.js"}, {"a"}),
        mod("a", {"a.js"}, {}),
    };
    const auto r = resolve(d);
    const std::vector<std::string> files{"a.js", "b.js", "c.js"};
    EXPECT_EQ(r.files, files);
}

TEST(ModuleGraph, TiesGoToDeclarationOrder)
{
    const std::vector<ModuleDescriptor> d{
        mod("z", {"z.js"}, {}),
        mod("y", {"y.js"}, {}),
        mod("x", {"x.js"}, {"z", "y"}),
    };
    const auto r = resolve(d);
    const std::vector<std::string> mods{"z", "y", "x"};
    EXPECT_EQ(r.modules, mods);
}

TEST(ModuleGraph, CycleThrowsWithMembers)
{
    const std::vector<ModuleDescriptor> d{
        mod("a", {"a.js"}, {"b"}),
        mod("b", {"b.js"}, {"a"}),
        mod("c", {"c.js"}, {}),
    };
    try
    {
        (void) resolve(d, TagSet{"c"});
        FAIL() << "expected CycleError";
    }
    catch (const CycleError &e)
    {
        const std::vector<std::string> cycle{"a", "b", "a"};
        EXPECT_EQ(e.modules(), cycle);
        EXPECT_NE(std::string(e.what()).find("a -> b -> a"), std::string::npos);
    }
}

TEST(ModuleGraph, UnknownDependencyThrows)
{
    const std::vector<ModuleDescriptor> d{mod("a", {"a.js"}, {"ghost"})};
    EXPECT_THROW((void) resolve(d), ResolveError);
}

TEST(ModuleGraph, DuplicateNameThrows)
{
    const std::vector<ModuleDescriptor> d{mod("a", {"a.js"}, {}), mod("a", {"b.js"}, {})};
    EXPECT_THROW((void) resolve(d), ResolveError);
}

TEST(ModuleGraph, ResolveIsPure)
{
    const auto d = sample();
    const auto first = resolve(d, TagSet{"uiOptions"}, TagSet{"jQueryUI"});
    const auto second = resolve(d, TagSet{"uiOptions"}, TagSet{"jQueryUI"});
    EXPECT_EQ(first.files, second.files);
    EXPECT_EQ(first.modules, second.modules);
}

TEST(ModuleGraph, ParseTagList)
{
    EXPECT_FALSE(parse_tag_list("").has_value());
    EXPECT_FALSE(parse_tag_list(" , ").has_value());
    const auto tags = parse_tag_list("jQuery, jQueryUI ,framework");
    ASSERT_TRUE(tags.has_value());
    EXPECT_EQ(*tags, (TagSet{"framework", "jQuery", "jQueryUI"}));
}

TEST(ModuleGraph, LoadKeyedDescriptor)
{
    TmpDir dir("assay_graph_keyed");
    dir.write("src/core/coreDependencies.json",
              R"({"framework": {"files": ["Fluid.js", "FluidDOM.js"], "dependencies": ["jQuery"]}})");
    dir.write("src/lib/jqueryDependencies.json",
              R"([{"name": "jQuery", "files": ["jquery.js"], "tags": ["jQuery", "thirdParty"]}])");

    const auto d = load_descriptors(dir.path, {"src/**/*Dependencies.json"});
    ASSERT_EQ(d.size(), 2u);
    EXPECT_EQ(d[0].name, "framework");
    const std::vector<std::string> files{"src/core/Fluid.js", "src/core/FluidDOM.js"};
    EXPECT_EQ(d[0].files, files);
    EXPECT_EQ(d[0].tags, TagSet{"framework"});
    EXPECT_EQ(d[0].directory, "src/core");
    EXPECT_EQ(d[1].name, "jQuery");
    EXPECT_EQ(d[1].files, std::vector<std::string>{"src/lib/jquery.js"});
    EXPECT_EQ(d[1].tags, (TagSet{"jQuery", "thirdParty"}));

    const auto r = resolve(d);
    EXPECT_EQ(r.files.front(), "src/lib/jquery.js");
}

TEST(ModuleGraph, MalformedDescriptorThrows)
{
    TmpDir dir("assay_graph_bad");
    dir.write("badDependencies.json", "{ not json");
    EXPECT_THROW((void) load_descriptor_file(dir.path, dir.path / "badDependencies.json"), std::runtime_error);

    dir.write("emptyDependencies.json", R"({"x": {"files": []}})");
    EXPECT_THROW((void) load_descriptor_file(dir.path, dir.path / "emptyDependencies.json"), std::runtime_error);
}

TEST(ModuleGraph, KeyedDescriptorKeepsDeclarationOrder)
{
    TmpDir dir("assay_graph_keyed_order");
    dir.write("src/lettersDependencies.json",
              R"({"zeta": {"files": ["zeta.js"]}, "alpha": {"files": ["alpha.js"]}, "mid": {"files": ["mid.js"]}})");

    const auto d = load_descriptors(dir.path, {"src/*Dependencies.json"});
    ASSERT_EQ(d.size(), 3u);
    EXPECT_EQ(d[0].name, "zeta");
    EXPECT_EQ(d[1].name, "alpha");
    EXPECT_EQ(d[2].name, "mid");

    const auto r = resolve(d);
    const std::vector<std::string> files{"src/zeta.js", "src/alpha.js", "src/mid.js"};
    EXPECT_EQ(r.files, files);
}

TEST(ModuleGraph, IncludeLeavesUnrelatedModulesOut)
{
    const std::vector<ModuleDescriptor> d{
        mod("core", {"core.js"}, {}, {"core"}),
        mod("ui", {"ui.js"}, {"core"}, {"uiOptions"}),
        mod("jquery", {"jquery.js"}, {}, {"jQuery"}),
    };
    const auto r = resolve(d, TagSet{"uiOptions"});
    const std::vector<std::string> files{"core.js", "ui.js"};
    EXPECT_EQ(r.files, files);
}

TEST(ModuleGraph, ExcludeDropsModuleThatIsAlsoIncluded)
{
    const std::vector<ModuleDescriptor> d{
        mod("jqueryShim", {"shim.js"}, {}, {"framework", "jQuery"}),
        mod("fluid", {"Fluid.js"}, {"jqueryShim"}, {"framework"}),
    };
    const auto r = resolve(d, TagSet{"framework"}, TagSet{"jQuery"});
    EXPECT_EQ(r.modules, std::vector<std::string>{"fluid"});
    EXPECT_EQ(r.files, std::vector<std::string>{"Fluid.js"});
}
