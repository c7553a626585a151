/**
 * Codeveil - Command Line Tests
 *
 * Runs the codeveil executable over files in a scratch directory.
 */

#include "../fixtures/codec_fixture.hpp"

using namespace codeveil;
using namespace codeveil::test;

class CliTest : public CodecFixture {
protected:
    std::string path(const std::string& name) {
        return (test_dir_ / name).string();
    }

    bool contains(const std::string& haystack, const std::string& needle) {
        return haystack.find(needle) != std::string::npos;
    }
};

// ============================================================================
// lana-vortex
// ============================================================================

TEST_F(CliTest, FragmentCipherEncodeDecodeReveal) {
    const std::string source = "console.log(\"caf\xc3\xa9\");\n";
    writeFile("app.js", source);

    auto encoded = runCli({"--key", "s3cret", "encode", path("app.js"), path("app.veiled.js")});
    ASSERT_TRUE(encoded.success()) << encoded.stderr_output;
    EXPECT_EQ(readFile(path("app.veiled.js")).compare(0, 19, "(function(){var p=["), 0);
    EXPECT_TRUE(contains(encoded.stderr_output, "[codeveil] Method: lana-vortex"));

    auto decoded = runCli({"--key", "s3cret", "decode", path("app.veiled.js"), path("back.js")});
    ASSERT_TRUE(decoded.success()) << decoded.stderr_output;
    EXPECT_EQ(readFile(path("back.js")), source);

    auto revealed = runCli({"reveal", path("app.veiled.js"), path("revealed.js")});
    ASSERT_TRUE(revealed.success()) << revealed.stderr_output;
    EXPECT_EQ(readFile(path("revealed.js")), source);
}

TEST_F(CliTest, FragmentCipherNeedsKey) {
    writeFile("app.js", "alert(1)");

    auto result = runCli({"encode", path("app.js"), path("out.js")});
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_TRUE(contains(result.stderr_output, "Code and key cannot be empty"));
}

// ============================================================================
// lexical-scramble
// ============================================================================

TEST_F(CliTest, RenameWritesTableBesideOutput) {
    writeFile("app.js", "function foo(bar){return bar+1;}");

    auto encoded = runCli({"--method", "lexical-scramble", "encode", path("app.js"), path("out.js")});
    ASSERT_TRUE(encoded.success()) << encoded.stderr_output;
    EXPECT_EQ(readFile(path("out.js")), "function a(b){return b+1;}");
    EXPECT_EQ(readFile(path("out.js.map.json")), "{\n  \"foo\": \"a\",\n  \"bar\": \"b\"\n}");

    auto decoded = runCli({"--method", "lexical-scramble", "--map", path("out.js.map.json"),
                           "decode", path("out.js"), path("back.js")});
    ASSERT_TRUE(decoded.success()) << decoded.stderr_output;
    EXPECT_EQ(readFile(path("back.js")), "function foo(bar){return bar+1;}");
}

TEST_F(CliTest, RenameDecodeWithoutTable) {
    writeFile("out.js", "function a(b){return b+1;}");

    auto result = runCli({"--method", "lexical-scramble", "decode", path("out.js"), path("back.js")});
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_TRUE(contains(result.stderr_output, "needs its rename table"));
    EXPECT_FALSE(std::filesystem::exists(path("back.js")));
}

TEST_F(CliTest, ConfigFileKeepsLayout) {
    writeFile("codeveil.json", R"({"method": "lexical-scramble",
                                   "lexical_scramble": {"minify": false}})");
    writeFile("app.js", "// note\nvar total = 1;\n");

    auto result = runCli({"--config", path("codeveil.json"), "--map-out", path("table.json"),
                          "encode", path("app.js"), path("out.js")});
    ASSERT_TRUE(result.success()) << result.stderr_output;
    EXPECT_EQ(readFile(path("out.js")), "// note\nvar a = 1;\n");
    EXPECT_EQ(readFile(path("table.json")), "{\n  \"total\": \"a\"\n}");
}

// ============================================================================
// string-conceal
// ============================================================================

TEST_F(CliTest, ConcealAndReveal) {
    writeFile("app.js", "let x = \"hi\";");

    auto encoded = runCli({"--method", "string-conceal", "--key", "k", "--seed", "5",
                           "encode", path("app.js"), path("out.js")});
    ASSERT_TRUE(encoded.success()) << encoded.stderr_output;
    EXPECT_FALSE(contains(readFile(path("out.js")), "\"hi\""));

    auto decoded = runCli({"--method", "string-conceal", "--key", "k", "--map-out", path("notes.txt"),
                           "decode", path("out.js"), path("back.js")});
    ASSERT_TRUE(decoded.success()) << decoded.stderr_output;
    EXPECT_EQ(readFile(path("notes.txt")), "Revealed strings from the concealed array:\n\n0: \"hi\"");

    auto wrong = runCli({"--method", "string-conceal", "--key", "q",
                         "decode", path("out.js"), path("wrong.js")});
    EXPECT_EQ(wrong.exit_code, 1);
    EXPECT_TRUE(contains(wrong.stderr_output, "The provided key is incorrect."));
}

TEST_F(CliTest, SeedMakesNamesReproducible) {
    writeFile("app.js", "f('a'); g('b');");

    const std::vector<std::string> base = {"--method", "string-conceal", "--key", "k", "--seed", "77",
                                           "encode", path("app.js")};
    auto args_one = base;
    args_one.push_back(path("one.js"));
    auto args_two = base;
    args_two.push_back(path("two.js"));

    ASSERT_TRUE(runCli(args_one).success());
    ASSERT_TRUE(runCli(args_two).success());
    EXPECT_EQ(readFile(path("one.js")), readFile(path("two.js")));
}

// ============================================================================
// Options and failures
// ============================================================================

TEST_F(CliTest, ListMethods) {
    auto result = runCli({"--list"});

    ASSERT_TRUE(result.success());
    EXPECT_TRUE(contains(result.stdout_output, "lana-vortex"));
    EXPECT_TRUE(contains(result.stdout_output, "lexical-scramble"));
    EXPECT_TRUE(contains(result.stdout_output, "string-conceal"));
}

TEST_F(CliTest, Statistics) {
    writeFile("app.js", "console.log(1)");

    auto result = runCli({"--stats", "--key", "ab", "encode", path("app.js"), path("out.js")});
    ASSERT_TRUE(result.success()) << result.stderr_output;
    EXPECT_TRUE(contains(result.stderr_output, "=== Codeveil Statistics ==="));
    EXPECT_TRUE(contains(result.stderr_output, "[lana-vortex]"));
}

TEST_F(CliTest, BadArguments) {
    writeFile("app.js", "x");

    EXPECT_EQ(runCli({"--method", "rot13", "encode", path("app.js"), path("out.js")}).exit_code, 1);
    EXPECT_EQ(runCli({"--key", "k", "encode", path("missing.js"), path("out.js")}).exit_code, 1);
    EXPECT_EQ(runCli({"--seed", "abc", "--key", "k", "encode", path("app.js"), path("out.js")}).exit_code, 1);
    EXPECT_EQ(runCli({"scramble", path("app.js"), path("out.js")}).exit_code, 1);
    EXPECT_EQ(runCli({"--bogus"}).exit_code, 1);
    EXPECT_EQ(runCli({"encode", path("app.js")}).exit_code, 1);

    writeFile("seed.json", R"({"random_seed": -1})");
    EXPECT_EQ(runCli({"--config", path("seed.json"), "--key", "k",
                      "encode", path("app.js"), path("out.js")}).exit_code, 1);
}
