#include <gtest/gtest.h>

#include "core/loader/loader_config.h"
#include "test_helpers.h"

#include <fstream>
#include <string>

using namespace cphoto;
using namespace cphoto_test;

namespace
{
static void WriteFile(const std::filesystem::path& p, const std::string& text)
{
    std::ofstream f(p, std::ios::binary | std::ios::trunc);
    f << text;
}
} // namespace

TEST(LoaderConfig, MissingFileKeepsDefaults)
{
    ScratchDir dir("cphoto_cfg_missing");
    LoaderConfig cfg;
    cfg.photo_dir = "/defaults";
    std::string err;

    EXPECT_TRUE(LoadLoaderConfig((dir.Path() / "nope.json").string(), cfg, err));
    EXPECT_TRUE(err.empty());
    EXPECT_EQ(cfg.worker_count, 1);
    EXPECT_EQ(cfg.photo_dir, "/defaults");
    EXPECT_TRUE(cfg.prefer_high_res);
    EXPECT_FALSE(cfg.debug_logging);
}

TEST(LoaderConfig, SaveThenLoad)
{
    ScratchDir dir("cphoto_cfg_roundtrip");
    const std::string path = (dir.Path() / "sub" / "loader.json").string();

    LoaderConfig out;
    out.worker_count = 3;
    out.photo_dir = "/srv/photos";
    out.prefer_high_res = false;
    out.debug_logging = true;
    std::string err;
    ASSERT_TRUE(SaveLoaderConfig(path, out, err)) << err;
    EXPECT_FALSE(std::filesystem::exists(path + ".tmp"));

    LoaderConfig in;
    ASSERT_TRUE(LoadLoaderConfig(path, in, err)) << err;
    EXPECT_EQ(in.worker_count, 3);
    EXPECT_EQ(in.photo_dir, "/srv/photos");
    EXPECT_FALSE(in.prefer_high_res);
    EXPECT_TRUE(in.debug_logging);
}

TEST(LoaderConfig, IgnoresMistypedAndUnknownKeys)
{
    ScratchDir dir("cphoto_cfg_loose");
    const auto path = dir.Path() / "loader.json";
    WriteFile(path, R"({"worker_count": "four", "photo_dir": 12, "debug_logging": true, "colour": "blue"})");

    LoaderConfig cfg;
    cfg.photo_dir = "/keep";
    std::string err;
    ASSERT_TRUE(LoadLoaderConfig(path.string(), cfg, err)) << err;
    EXPECT_EQ(cfg.worker_count, 1);
    EXPECT_EQ(cfg.photo_dir, "/keep");
    EXPECT_TRUE(cfg.debug_logging);
}

TEST(LoaderConfig, ClampsWorkerCount)
{
    ScratchDir dir("cphoto_cfg_clamp");
    const auto path = dir.Path() / "loader.json";
    LoaderConfig cfg;
    std::string err;

    WriteFile(path, R"({"worker_count": 64})");
    ASSERT_TRUE(LoadLoaderConfig(path.string(), cfg, err));
    EXPECT_EQ(cfg.worker_count, 8);

    WriteFile(path, R"({"worker_count": 0})");
    ASSERT_TRUE(LoadLoaderConfig(path.string(), cfg, err));
    EXPECT_EQ(cfg.worker_count, 1);
}

TEST(LoaderConfig, UnknownSchemaIsIgnored)
{
    ScratchDir dir("cphoto_cfg_schema");
    const auto path = dir.Path() / "loader.json";
    WriteFile(path, R"({"schema_version": 99, "worker_count": 4})");

    LoaderConfig cfg;
    std::string err;
    EXPECT_TRUE(LoadLoaderConfig(path.string(), cfg, err));
    EXPECT_EQ(cfg.worker_count, 1);
}

TEST(LoaderConfig, MalformedJsonReportsError)
{
    ScratchDir dir("cphoto_cfg_bad");
    const auto path = dir.Path() / "loader.json";
    WriteFile(path, "{ not json");

    LoaderConfig cfg;
    cfg.worker_count = 2;
    std::string err;
    EXPECT_FALSE(LoadLoaderConfig(path.string(), cfg, err));
    EXPECT_FALSE(err.empty());
    EXPECT_EQ(cfg.worker_count, 2);
}

TEST(LoaderConfig, DefaultPhotoDirLivesUnderConfigDir)
{
    const LoaderConfig cfg = DefaultLoaderConfig();
    EXPECT_EQ(cfg.photo_dir.rfind(GetContactPhotoConfigDir(), 0), 0u);
    EXPECT_NE(GetLoaderConfigPath().find("loader.json"), std::string::npos);
}
