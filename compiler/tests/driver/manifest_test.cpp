// Manifest tests
//
// kindred.toml parsing, validation and application to CompileOptions.

#include "driver/manifest.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

using namespace kindred;
using namespace kindred::driver;

class ManifestTest : public ::testing::Test {
protected:
    static auto parse_ok(const std::string& content) -> Manifest {
        auto result = Manifest::parse(content);
        EXPECT_TRUE(is_ok(result)) << (is_err(result) ? unwrap_err(result) : "");
        if (is_err(result)) {
            return {};
        }
        return unwrap(result);
    }

    static auto parse_error(const std::string& content) -> std::string {
        auto result = Manifest::parse(content);
        EXPECT_TRUE(is_err(result));
        return is_err(result) ? unwrap_err(result) : "";
    }
};

// ============================================================================
// Parsing
// ============================================================================

TEST_F(ManifestTest, FullManifest) {
    auto manifest = parse_ok(R"(
# Project settings
[package]
name = "hello-world"

[build]
source = "src/app.kin"    # entry file
output_dir = "out"
mode = "Debug"
linker = "clang"
timeout = 30
)");
    EXPECT_EQ(manifest.package.name, "hello-world");
    EXPECT_EQ(manifest.build.source, "src/app.kin");
    EXPECT_EQ(manifest.build.output_dir, "out");
    EXPECT_EQ(manifest.build.mode, backend::OptimizationMode::Debug);
    EXPECT_EQ(manifest.build.linker, "clang");
    EXPECT_EQ(manifest.build.timeout, 30);
}

TEST_F(ManifestTest, EmptyManifestSetsNothing) {
    auto manifest = parse_ok("");
    EXPECT_TRUE(manifest.package.name.empty());
    EXPECT_FALSE(manifest.build.source.has_value());
    EXPECT_FALSE(manifest.build.mode.has_value());
    EXPECT_TRUE(manifest.validate());
}

TEST_F(ManifestTest, StringEscapes) {
    auto manifest = parse_ok("[build]\nsource = \"dir\\\\main \\\"x\\\".kin\"\n");
    EXPECT_EQ(manifest.build.source, "dir\\main \"x\".kin");
}

TEST_F(ManifestTest, IntegerWithSeparator) {
    auto manifest = parse_ok("[build]\ntimeout = 1_000\n");
    EXPECT_EQ(manifest.build.timeout, 1000);
}

// ============================================================================
// Errors
// ============================================================================

TEST_F(ManifestTest, UnknownSection) {
    EXPECT_EQ(parse_error("[dependencies]\n"), "line 1: Unknown section [dependencies]");
}

TEST_F(ManifestTest, UnknownKeyReportsLine) {
    EXPECT_EQ(parse_error("[build]\n\nopt_level = 3\n"),
              "line 3: Unknown key 'opt_level' in [build]");
}

TEST_F(ManifestTest, InvalidMode) {
    auto error = parse_error("[build]\nmode = \"Fast\"\n");
    EXPECT_EQ(error, "line 2: 'mode' must be \"Debug\" or \"Release\", found \"Fast\"");
}

TEST_F(ManifestTest, WrongValueType) {
    EXPECT_EQ(parse_error("[build]\nsource = 3\n"), "line 2: 'source' must be a string");
    EXPECT_EQ(parse_error("[build]\ntimeout = \"10\"\n"),
              "line 2: 'timeout' must be a positive number of seconds");
    EXPECT_EQ(parse_error("[build]\ntimeout = 0\n"),
              "line 2: 'timeout' must be a positive number of seconds");
}

TEST_F(ManifestTest, KeyOutsideSection) {
    EXPECT_EQ(parse_error("name = \"x\"\n"), "line 1: Key 'name' outside of a section");
}

TEST_F(ManifestTest, TrailingGarbage) {
    EXPECT_EQ(parse_error("[package]\nname = \"a\" \"b\"\n"),
              "line 2: Unexpected text after value of 'name'");
}

TEST_F(ManifestTest, UnterminatedString) {
    EXPECT_EQ(parse_error("[package]\nname = \"abc\n"), "line 2: Unterminated string");
}

TEST_F(ManifestTest, InvalidPackageName) {
    EXPECT_EQ(parse_error("[package]\nname = \"my app\"\n"), "invalid package name `my app`");
    EXPECT_TRUE(is_valid_package_name("app_2-x"));
    EXPECT_FALSE(is_valid_package_name("a/b"));
    EXPECT_FALSE(is_valid_package_name(""));
}

TEST_F(ManifestTest, EmptyPathIsRejected) {
    auto error = parse_error("[build]\noutput_dir = \"\"\n");
    EXPECT_NE(error.find("invalid [build] settings"), std::string::npos) << error;
}

// ============================================================================
// Application
// ============================================================================

TEST_F(ManifestTest, ApplyResolvesRelativePaths) {
    auto manifest = parse_ok("[package]\nname = \"demo\"\n"
                             "[build]\nsource = \"src/main.kin\"\noutput_dir = \"/tmp/out\"\n"
                             "mode = \"release\"\n");
    CompileOptions options;
    options.optimization_mode = backend::OptimizationMode::Debug;
    manifest.apply_to(options, "/work/project");

    EXPECT_EQ(options.artifact_name, "demo");
    EXPECT_EQ(options.source_path, std::filesystem::path("/work/project/src/main.kin"));
    EXPECT_EQ(options.output_directory, std::filesystem::path("/tmp/out"));
    EXPECT_EQ(options.optimization_mode, backend::OptimizationMode::Release);
    EXPECT_EQ(options.linker, "cc");
    EXPECT_EQ(options.timeout_seconds, 120);
}

TEST_F(ManifestTest, ApplyLeavesUnsetValues) {
    auto manifest = parse_ok("[build]\nlinker = \"gcc\"\n");
    CompileOptions options;
    manifest.apply_to(options, {});
    EXPECT_EQ(options.source_path, std::filesystem::path(DEFAULT_SOURCE));
    EXPECT_EQ(options.output_directory, std::filesystem::path(DEFAULT_OUTPUT_DIR));
    EXPECT_TRUE(options.artifact_name.empty());
    EXPECT_EQ(options.linker, "gcc");
}

TEST_F(ManifestTest, LoadPrefixesPath) {
    auto dir = std::filesystem::temp_directory_path() / "kindred_manifest_test";
    std::filesystem::create_directories(dir);
    auto path = dir / MANIFEST_FILE;
    {
        std::ofstream out(path);
        out << "[build]\nmode = \"Slow\"\n";
    }

    auto result = Manifest::load(path);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).rfind(path.string() + ": line 2:", 0), 0u) << unwrap_err(result);

    auto missing = Manifest::load(dir / "absent.toml");
    ASSERT_TRUE(is_err(missing));
    EXPECT_NE(unwrap_err(missing).find("cannot read"), std::string::npos);

    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
}
