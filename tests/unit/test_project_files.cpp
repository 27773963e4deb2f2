#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "auditor/project_files.h"

using namespace StrictKit::Audit;
namespace fs = std::filesystem;

class ProjectFilesTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        root_ = fs::temp_directory_path() / ("strictkit_files_" + std::to_string(stamp));
        fs::create_directories(root_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    void writeFile(const std::string& rel, const std::string& content = "x") {
        const fs::path path = root_ / rel;
        fs::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary);
        out << content;
    }

    fs::path root_;
};

TEST_F(ProjectFilesTest, ListsMatchingExtensionsSorted) {
    writeFile("src/b.ts");
    writeFile("src/a.tsx");
    writeFile("index.ts");
    writeFile("README.md");
    writeFile("src/util.js");

    const FsFileEnumerator files(root_.string());
    const auto ts = files.listFiles({".ts", ".tsx"});

    const std::vector<std::string> expected = {"index.ts", "src/a.tsx", "src/b.ts"};
    EXPECT_EQ(ts, expected);
}

TEST_F(ProjectFilesTest, IgnoredDirectoriesNeverEntered) {
    writeFile("node_modules/pkg/index.ts");
    writeFile("dist/out.ts");
    writeFile("build/gen.ts");
    writeFile("out/x.ts");
    writeFile("coverage/lcov.ts");
    writeFile(".next/server.ts");
    writeFile(".git/hooks/h.ts");
    writeFile(".hidden/secret.ts");
    writeFile("src/kept.ts");

    const FsFileEnumerator files(root_.string());
    const auto ts = files.listFiles({".ts"});

    ASSERT_EQ(ts.size(), 1u);
    EXPECT_EQ(ts[0], "src/kept.ts");
}

TEST_F(ProjectFilesTest, ExtraIgnoreDirsHonored) {
    writeFile("vendor/lib.ts");
    writeFile("generated/api.ts");
    writeFile("src/app.ts");

    const FsFileEnumerator files(root_.string(),
                                 FsFileEnumerator::splitIgnoreList("vendor, generated"));
    const auto ts = files.listFiles({".ts"});

    ASSERT_EQ(ts.size(), 1u);
    EXPECT_EQ(ts[0], "src/app.ts");
}

TEST_F(ProjectFilesTest, MinifiedScriptsSkipped) {
    writeFile("public/vendor.min.js");
    writeFile("public/app.js");

    const FsFileEnumerator files(root_.string());
    const auto js = files.listFiles({".js"});

    ASSERT_EQ(js.size(), 1u);
    EXPECT_EQ(js[0], "public/app.js");
}

TEST_F(ProjectFilesTest, HiddenFilesSkipped) {
    writeFile(".env.json");
    writeFile("config.json");

    const FsFileEnumerator files(root_.string());
    const auto json = files.listFiles({".json"});

    ASSERT_EQ(json.size(), 1u);
    EXPECT_EQ(json[0], "config.json");
}

TEST_F(ProjectFilesTest, SymlinkedDirectoryNotFollowed) {
    writeFile("real/inside.ts");
    std::error_code ec;
    fs::create_directory_symlink(root_ / "real", root_ / "link", ec);
    if (ec) GTEST_SKIP() << "cannot create symlink: " << ec.message();

    const FsFileEnumerator files(root_.string());
    const auto ts = files.listFiles({".ts"});

    ASSERT_EQ(ts.size(), 1u);
    EXPECT_EQ(ts[0], "real/inside.ts");
}

TEST_F(ProjectFilesTest, SplitIgnoreList) {
    EXPECT_TRUE(FsFileEnumerator::splitIgnoreList(nullptr).empty());
    EXPECT_TRUE(FsFileEnumerator::splitIgnoreList("").empty());

    const std::vector<std::string> expected = {"a", "b c", "d"};
    EXPECT_EQ(FsFileEnumerator::splitIgnoreList(" a ,b c,, d "), expected);
}

TEST_F(ProjectFilesTest, ReaderReturnsContent) {
    writeFile("src/a.ts", "const x: number = 1;\n");
    writeFile("empty.ts", "");

    const FsContentReader reader(root_.string());

    const auto content = reader.read("src/a.ts");
    ASSERT_TRUE(content.has_value());
    EXPECT_EQ(*content, "const x: number = 1;\n");

    const auto empty = reader.read("empty.ts");
    ASSERT_TRUE(empty.has_value());
    EXPECT_TRUE(empty->empty());
}

TEST_F(ProjectFilesTest, ReaderMissingFileIsNullopt) {
    const FsContentReader reader(root_.string());
    EXPECT_FALSE(reader.read("nope.ts").has_value());
    EXPECT_FALSE(reader.exists("nope.ts"));
}

TEST_F(ProjectFilesTest, ExistsOnlyForRegularFiles) {
    writeFile("Dockerfile", "FROM node:20\n");
    fs::create_directories(root_ / "yarn.lock");

    const FsContentReader reader(root_.string());
    EXPECT_TRUE(reader.exists("Dockerfile"));
    EXPECT_FALSE(reader.exists("yarn.lock")) << "a directory is not a lockfile";
}

TEST_F(ProjectFilesTest, PathHelpers) {
    EXPECT_TRUE(hasExtension("a.tsx", {".ts", ".tsx"}));
    EXPECT_FALSE(hasExtension("a.ts.bak", {".ts"}));
    EXPECT_EQ(baseName("src/deep/file.ts"), "file.ts");
    EXPECT_EQ(baseName("file.ts"), "file.ts");
}
