#include <gtest/gtest.h>
#include <string>
#include "../include/Naming.hpp"

using namespace assay;

TEST(Naming, MinSegmentAfterFirstSegment)
{
    EXPECT_EQ(add_minified_segment("infusion-all.js"), "infusion-all.min.js");
    EXPECT_EQ(add_minified_segment("infusion-all.js.map"), "infusion-all.min.js.map");
    EXPECT_EQ(add_minified_segment("fss-theme-hc.css"), "fss-theme-hc.min.css");
}

TEST(Naming, NameWithoutDotGetsTrailingMin)
{
    EXPECT_EQ(add_minified_segment("README"), "README.min");
}

TEST(Naming, Idempotent)
{
    const std::string once = add_minified_segment("infusion-uio.js.map");
    EXPECT_EQ(add_minified_segment(once), once);
    EXPECT_EQ(add_minified_segment("infusion-all.min.js"), "infusion-all.min.js");
}

TEST(Naming, LeadingDotLeftAlone)
{
    EXPECT_EQ(add_minified_segment(".hidden.js"), ".hidden.js");
    EXPECT_EQ(add_minified_segment(""), "");
}

TEST(Naming, PublishedName)
{
    EXPECT_EQ(published_file_name("infusion-all.js", true), "infusion-all.js");
    EXPECT_EQ(published_file_name("infusion-all.js", false), "infusion-all.min.js");
}

TEST(Naming, BundleAndArchive)
{
    EXPECT_EQ(bundle_base_name("infusion", "custom"), "infusion-custom");
    EXPECT_EQ(archive_file_name("infusion", "all", "2.0.0"), "infusion-all-2.0.0.zip");
}
