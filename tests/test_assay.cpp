#include <gtest/gtest.h>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include "../include/Assay.hpp"

using namespace assay;

namespace
{
    struct TmpFile
    {
        std::string path;

        TmpFile(std::string p, const std::string &text) : path(std::move(p))
        {
            std::ofstream o(path);
            o << text;
        }

        ~TmpFile() { std::remove(path.c_str()); }
    };

    ProjectConfig parse(const std::string &name, const std::string &text)
    {
        TmpFile tf(name, text);
        AssayParser p;
        p.parse_file(tf.path);
        p.finalize();
        return p.config();
    }
} // namespace

TEST(Assay, MinimalProjectUsesStandardMatrix)
{
    const auto cfg = parse("assay_minimal.af",
                           "@package infusion 2.0.0\n"
                           "@modules \"src/**/*Dependencies.json\"\n");
    EXPECT_EQ(cfg.package_name, "infusion");
    EXPECT_EQ(cfg.package_version, "2.0.0");
    EXPECT_EQ(cfg.build_dir, "build");
    EXPECT_EQ(cfg.products_dir, "products");
    EXPECT_EQ(cfg.dist_dir, "dist");
    EXPECT_EQ(cfg.module_patterns, std::vector<std::string>{"src/**/*Dependencies.json"});
    EXPECT_EQ(cfg.matrix().size(), 12u);
    EXPECT_EQ(cfg.revision.task, "git rev-parse --verify --short HEAD");
    EXPECT_EQ(cfg.branch.default_value, "Unknown branch, not within a git repository");
}

TEST(Assay, MissingPackageThrows)
{
    TmpFile tf("assay_nopkg.af", "@modules \"src/*.json\"\n");
    AssayParser p;
    p.parse_file(tf.path);
    EXPECT_THROW(p.finalize(), std::runtime_error);
}

TEST(Assay, MissingModulesThrows)
{
    TmpFile tf("assay_nomodules.af", "@package infusion 1.0\n");
    AssayParser p;
    p.parse_file(tf.path);
    EXPECT_THROW(p.finalize(), std::runtime_error);
}

TEST(Assay, UnknownDirectiveReportsLine)
{
    TmpFile tf("assay_unknown.af",
               "@package infusion 1.0\n"
               "\n"
               "@frobnicate yes\n");
    AssayParser p;
    try
    {
        p.parse_file(tf.path);
        FAIL() << "expected runtime_error";
    }
    catch (const std::runtime_error &e)
    {
        EXPECT_NE(std::string(e.what()).find("line 3"), std::string::npos) << e.what();
        EXPECT_NE(std::string(e.what()).find("assay_unknown.af"), std::string::npos) << e.what();
    }
}

TEST(Assay, DistributionRows)
{
    const auto cfg = parse("assay_dists.af",
                           "@package infusion 2.0.0\n"
                           "@modules \"src/*.json\"\n"
                           "@distribution all\n"
                           "@distribution all.min expanded=false\n"
                           "@distribution framework-no-jquery include=[framework] exclude=[jQuery, jQueryUI]\n"
                           "@distribution uio include=\"uiOptions\" expanded=false\n");
    const auto m = cfg.matrix();
    ASSERT_EQ(m.size(), 4u);
    EXPECT_TRUE(m.specs()[0].expanded);
    EXPECT_FALSE(m.specs()[0].is_custom());
    EXPECT_FALSE(m.specs()[1].expanded);
    const auto &fw = m.specs()[2];
    EXPECT_EQ(*fw.include, TagSet{"framework"});
    EXPECT_EQ(*fw.exclude, (TagSet{"jQuery", "jQueryUI"}));
    EXPECT_EQ(*m.specs()[3].include, TagSet{"uiOptions"});
    EXPECT_FALSE(m.specs()[3].expanded);
}

TEST(Assay, DuplicateDistributionRejected)
{
    TmpFile tf("assay_dupdist.af",
               "@package infusion 2.0.0\n"
               "@distribution all\n"
               "@distribution all expanded=false\n");
    AssayParser p;
    EXPECT_THROW(p.parse_file(tf.path), std::runtime_error);
}

TEST(Assay, StagingDirectives)
{
    const auto cfg = parse("assay_staging.af",
                           "@package infusion 2.0.0\n"
                           "@dirs build=out/build products=out/products dist=out/dist\n"
                           "@modules \"src/*.json\"\n"
                           "@necessity \"README.md\"\n"
                           "@necessity \"src/lib/normalize/*.css\" to=\"css/\" if=\"src/lib/normalize\"\n"
                           "@dependency \"node_modules/jquery/dist/*.js\" to=\"src/lib/jquery/core/js\"\n"
                           "@stage \"tests\"\n"
                           "@asset \"src/framework/preferences/fonts\"\n"
                           "@clean full \"src/lib/infusion\"\n"
                           "@clean dev \"src/**/css/*.css\"\n"
                           "@clean deps \"src/lib/jquery/core/js\"\n");
    EXPECT_EQ(cfg.build_dir, "out/build");
    EXPECT_EQ(cfg.dist_dir, "out/dist");
    ASSERT_EQ(cfg.necessities.size(), 2u);
    EXPECT_EQ(cfg.necessities[0].pattern, "README.md");
    EXPECT_TRUE(cfg.necessities[0].to.empty());
    EXPECT_EQ(cfg.necessities[1].to, "css/");
    EXPECT_EQ(cfg.necessities[1].only_if, "src/lib/normalize");
    ASSERT_EQ(cfg.dependencies.size(), 1u);
    EXPECT_EQ(cfg.dependencies[0].to, "src/lib/jquery/core/js");
    EXPECT_EQ(cfg.stage_dirs, std::vector<std::string>{"tests"});
    EXPECT_EQ(cfg.asset_dirs, std::vector<std::string>{"src/framework/preferences/fonts"});
    EXPECT_EQ(cfg.clean_patterns(CleanScope::Dev), std::vector<std::string>{"src/**/css/*.css"});
    EXPECT_EQ(cfg.clean_patterns(CleanScope::Deps), std::vector<std::string>{"src/lib/jquery/core/js"});
    EXPECT_TRUE(cfg.clean_patterns(CleanScope::Dist).empty());
}

TEST(Assay, DependencyWithoutDestinationThrows)
{
    TmpFile tf("assay_deps_noto.af", "@dependency \"node_modules/x/*.js\"\n");
    AssayParser p;
    EXPECT_THROW(p.parse_file(tf.path), std::runtime_error);
}

TEST(Assay, RunVariablesStayLiteral)
{
    const auto cfg = parse("assay_tasks.af",
                           "@package infusion 2.0.0\n"
                           "@modules \"src/*.json\"\n"
                           "@let SASS=node_modules/.bin/sass\n"
                           "@assets dist task=\"${SASS} --style=${STYLE} src:build/${NAME}\"\n"
                           "@archiver task=\"tar -C ${STAGING} -czf ${ARCHIVE} .\"\n"
                           "@revision task=\"echo r1\" default=\"no revision\"\n");
    EXPECT_EQ(cfg.assets_dist_task, "node_modules/.bin/sass --style=${STYLE} src:build/${NAME}");
    EXPECT_TRUE(cfg.assets_dev_task.empty());
    EXPECT_EQ(cfg.archiver_task, "tar -C ${STAGING} -czf ${ARCHIVE} .");
    EXPECT_EQ(cfg.revision.task, "echo r1");
    EXPECT_EQ(cfg.revision.default_value, "no revision");
}

TEST(Assay, ExpandTemplate)
{
    const std::unordered_map<std::string, std::string> vars{{"A", "1"}, {"NAME", "all"}};
    EXPECT_EQ(expand_template("x${A}y${NAME}z${MISSING}", vars), "x1yallz${MISSING}");
    EXPECT_EQ(expand_template("", vars), "");
    EXPECT_EQ(expand_template("${A}/${unterminated", vars), "1/${unterminated");
}

TEST(Assay, VerifyTargets)
{
    const auto cfg = parse("assay_verify.af",
                           "@package infusion 2.0.0\n"
                           "@modules \"src/*.json\"\n"
                           "@verify css from=\"src\" match=\"**/css/*.scss\" to=\"dist/assets/src\" rename=\"scss:css\"\n"
                           "@verify css from=\"src\" match=\"**/css/*.scss\" to=\"dist/assets/src\" rename=\"scss:min.css\"\n"
                           "@verify distributions generator=distributions\n"
                           "@verify extra file=\"dist/README.md\"\n"
                           "@verify extra file=\"dist/LICENSE.txt\"\n");
    ASSERT_EQ(cfg.verify.size(), 3u);
    EXPECT_EQ(cfg.verify[0].target, "css");
    ASSERT_EQ(cfg.verify[0].mappings.size(), 2u);
    EXPECT_EQ(cfg.verify[0].mappings[0].from, "src");
    EXPECT_EQ(cfg.verify[0].mappings[0].match, "**/css/*.scss");
    EXPECT_EQ(cfg.verify[0].mappings[0].rename, "scss:css");
    EXPECT_EQ(cfg.verify[0].mappings[1].rename, "scss:min.css");
    EXPECT_TRUE(cfg.verify[1].generator);
    const std::vector<std::string> extra{"dist/README.md", "dist/LICENSE.txt"};
    EXPECT_EQ(cfg.verify[2].files, extra);
}

TEST(Assay, VerifyRenameNeedsColon)
{
    TmpFile tf("assay_verify_rename.af",
               "@verify css from=\"src\" match=\"*.scss\" to=\"dist\" rename=\"scss\"\n");
    AssayParser p;
    EXPECT_THROW(p.parse_file(tf.path), std::runtime_error);
}

TEST(Assay, IncludeAndLet)
{
    TmpFile inc("assay_inc_common.af",
                "@package infusion 3.1.0\n"
                "@let MODS=src/**/*Dependencies.json\n");
    TmpFile mainf("assay_inc_main.af",
                  "@include \"assay_inc_common.af\"\n"
                  "@modules \"${MODS}\"\n"
                  "@archiver task=\"zip -r ${ARCHIVE} ${PACKAGE}-${VERSION}\"\n");
    AssayParser p;
    p.parse_file(mainf.path);
    p.finalize();
    EXPECT_EQ(p.config().package_version, "3.1.0");
    EXPECT_EQ(p.config().module_patterns, std::vector<std::string>{"src/**/*Dependencies.json"});
    EXPECT_EQ(p.config().archiver_task, "zip -r ${ARCHIVE} infusion-3.1.0");
}

TEST(Assay, IncludeCircularDetected)
{
    TmpFile a("assay_cycle_a.af", "@include \"assay_cycle_b.af\"\n");
    TmpFile b("assay_cycle_b.af", "@include \"assay_cycle_a.af\"\n");
    AssayParser p;
    EXPECT_THROW(p.parse_file(a.path), std::runtime_error);
}

TEST(Assay, ExpandedFlagMustBeBoolean)
{
    TmpFile ok("assay_flag_ok.af",
               "@package infusion 1.0\n"
               "@modules \"src/*.json\"\n"
               "@distribution a expanded=no\n"
               "@distribution b expanded=\"true\"\n");
    AssayParser p;
    p.parse_file(ok.path);
    p.finalize();
    EXPECT_FALSE(p.config().distributions[0].expanded);
    EXPECT_TRUE(p.config().distributions[1].expanded);

    TmpFile bad("assay_flag_bad.af", "@distribution a expanded=maybe\n");
    AssayParser q;
    EXPECT_THROW(q.parse_file(bad.path), std::runtime_error);
}

TEST(Assay, PrintPlanListsMatrix)
{
    TmpFile tf("assay_plan.af",
               "@package infusion 2.0.0\n"
               "@modules \"src/*.json\"\n"
               "@distribution framework.min include=[framework] expanded=false\n");
    AssayParser p;
    p.parse_file(tf.path);
    p.finalize();
    std::ostringstream os;
    p.print_plan(os);
    EXPECT_NE(os.str().find("framework.min | custom | minified | include=[framework]"), std::string::npos)
        << os.str();
}
