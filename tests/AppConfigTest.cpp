#include <gtest/gtest.h>

#include "App/App.hpp"

#include <cstdio>
#include <vector>

static bool Parse(std::vector<const char*> args, AppConfig& cfg, std::string& err)
{
    args.insert(args.begin(), "mazegen");
    return ParseArgs(static_cast<int>(args.size()), args.data(), cfg, err);
}

TEST(AppConfig, Defaults)
{
    AppConfig cfg;
    std::string err;
    ASSERT_TRUE(Parse({ "12", "8" }, cfg, err)) << err;

    EXPECT_EQ(cfg.width, 12);
    EXPECT_EQ(cfg.height, 8);
    EXPECT_EQ(cfg.algorithm, "dfs");
    EXPECT_FALSE(cfg.hasSeed);
    EXPECT_EQ(cfg.cellSize, kDefaultCellSize);
    EXPECT_EQ(cfg.outPath, "maze");
    EXPECT_FALSE(cfg.ascii);
    EXPECT_FALSE(cfg.quiet);
}

TEST(AppConfig, AllOptions)
{
    AppConfig cfg;
    std::string err;
    ASSERT_TRUE(Parse({ "--seed", "42", "3", "-c", "4", "--algorithm", "DFS",
                        "3", "-o", "out/m", "--ascii", "-q" }, cfg, err)) << err;

    EXPECT_EQ(cfg.width, 3);
    EXPECT_EQ(cfg.height, 3);
    EXPECT_TRUE(cfg.hasSeed);
    EXPECT_EQ(cfg.seed, 42u);
    EXPECT_EQ(cfg.cellSize, 4);
    EXPECT_EQ(cfg.algorithm, "dfs");
    EXPECT_EQ(cfg.outPath, "out/m");
    EXPECT_TRUE(cfg.ascii);
    EXPECT_TRUE(cfg.quiet);
}

TEST(AppConfig, NegativeDimensionsReachTheGenerator)
{
    AppConfig cfg;
    std::string err;
    ASSERT_TRUE(Parse({ "-4", "0" }, cfg, err)) << err;
    EXPECT_EQ(cfg.width, -4);
    EXPECT_EQ(cfg.height, 0);
}

TEST(AppConfig, HelpNeedsNoDimensions)
{
    AppConfig cfg;
    std::string err;
    ASSERT_TRUE(Parse({ "--help" }, cfg, err));
    EXPECT_TRUE(cfg.showHelp);
}

TEST(AppConfig, Rejects)
{
    const std::vector<std::vector<const char*>> bad = {
        {},
        { "5" },
        { "5", "5", "5" },
        { "five", "5" },
        { "5", "5x" },
        { "5", "5", "--seed" },
        { "5", "5", "--seed", "-1" },
        { "5", "5", "--seed", "4294967296" },
        { "5", "5", "--cell", "1" },
        { "5", "5", "--out", "" },
        { "5", "5", "--bogus" },
        { "99999999999", "5" },
    };

    for (const auto& args : bad)
    {
        AppConfig cfg;
        std::string err;
        EXPECT_FALSE(Parse(args, cfg, err)) << "args[0]=" << (args.empty() ? "" : args[0]);
        EXPECT_FALSE(err.empty());
    }
}

TEST(AppConfig, RunReportsGeneratorErrors)
{
    AppConfig cfg;
    cfg.width = 0;
    cfg.height = 4;
    cfg.hasSeed = true;
    cfg.quiet = true;
    EXPECT_EQ(runApp(cfg), 2);

    cfg.width = 4;
    cfg.algorithm = "prim";
    EXPECT_EQ(runApp(cfg), 2);
}

TEST(AppConfig, RunWritesImage)
{
    AppConfig cfg;
    cfg.width = 6;
    cfg.height = 4;
    cfg.hasSeed = true;
    cfg.seed = 42;
    cfg.quiet = true;
    cfg.outPath = ::testing::TempDir() + "mazegen_app";
    EXPECT_EQ(runApp(cfg), 0);
    EXPECT_EQ(std::remove((cfg.outPath + ".png").c_str()), 0);
}

TEST(AppConfig, RunDrawsSeedWhenNoneGiven)
{
    AppConfig cfg;
    cfg.width = 3;
    cfg.height = 3;
    cfg.quiet = true;
    cfg.outPath = ::testing::TempDir() + "mazegen_app_random";
    EXPECT_EQ(runApp(cfg), 0);
    EXPECT_EQ(std::remove((cfg.outPath + ".png").c_str()), 0);
}

TEST(AppConfig, RunReportsOversizedImage)
{
    AppConfig cfg;
    cfg.width = 4;
    cfg.height = 2;
    cfg.hasSeed = true;
    cfg.quiet = true;
    cfg.cellSize = 1 << 30;
    cfg.outPath = ::testing::TempDir() + "mazegen_app_huge";
    EXPECT_EQ(runApp(cfg), 1);

    std::FILE* f = std::fopen((cfg.outPath + ".png").c_str(), "rb");
    EXPECT_EQ(f, nullptr);
    if (f) std::fclose(f);
}
