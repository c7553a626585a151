/**
 * Codeveil - Identifier Rename Tests
 */

#include <gtest/gtest.h>
#include "codecs/rename/identifier_rename.hpp"

#include <set>

using namespace codeveil;
using namespace codeveil::rename;

class IdentifierRenameTest : public ::testing::Test {
protected:
    IdentifierRenameCodec codec;

    IdentifierRenameConfig keepLayout() {
        IdentifierRenameConfig config;
        config.minify = false;
        return config;
    }

    ErrorKind decodeError(const std::string& artifact, const std::string& table) {
        try {
            codec.decode(artifact, table);
        } catch (const CodecError& e) {
            return e.kind();
        }
        ADD_FAILURE() << "expected a CodecError";
        return ErrorKind::InvalidInput;
    }
};

// ============================================================================
// Name generation
// ============================================================================

TEST(GenerateNameTest, Sequence) {
    EXPECT_EQ(generateName(0), "a");
    EXPECT_EQ(generateName(1), "b");
    EXPECT_EQ(generateName(25), "z");
    EXPECT_EQ(generateName(26), "A");
    EXPECT_EQ(generateName(51), "Z");
    EXPECT_EQ(generateName(52), "_");
    EXPECT_EQ(generateName(53), "aa");
    EXPECT_EQ(generateName(54), "ab");
    EXPECT_EQ(generateName(53 + 53), "ba");
}

TEST(GenerateNameTest, NeverRepeats) {
    std::set<std::string> seen;
    for (size_t i = 0; i < 5000; i++) {
        EXPECT_TRUE(seen.insert(generateName(i)).second) << i;
    }
}

TEST(ReservedWordsTest, ContainsKeywordsAndGlobals) {
    const auto& words = builtinReservedWords();

    for (const char* word : {"function", "return", "var", "let", "const", "this",
                             "true", "undefined", "await", "document", "window", "console"}) {
        EXPECT_EQ(words.count(word), 1u) << word;
    }
    EXPECT_EQ(words.count("foo"), 0u);
}

// ============================================================================
// Table serialization
// ============================================================================

TEST(RenameTableTest, SerializeIsPrettyAndOrdered) {
    RenameTable table = {{"foo", "a"}, {"bar", "b"}};

    EXPECT_EQ(serializeTable(table), "{\n  \"foo\": \"a\",\n  \"bar\": \"b\"\n}");
    EXPECT_EQ(serializeTable({}), "{}");
}

TEST(RenameTableTest, ParseKeepsOrder) {
    RenameTable table = parseTable(R"({"zeta": "a", "alpha": "b"})");

    ASSERT_EQ(table.size(), 2u);
    EXPECT_EQ(table[0].first, "zeta");
    EXPECT_EQ(table[1].second, "b");
}

TEST(RenameTableTest, ParseErrors) {
    auto kind = [](const std::string& json) {
        try {
            parseTable(json);
        } catch (const CodecError& e) {
            return e.kind();
        }
        ADD_FAILURE() << "no error for " << json;
        return ErrorKind::InvalidInput;
    };

    EXPECT_EQ(kind(""), ErrorKind::MissingDecodeKey);
    EXPECT_EQ(kind("  \n"), ErrorKind::MissingDecodeKey);
    EXPECT_EQ(kind("not json"), ErrorKind::MalformedArtifact);
    EXPECT_EQ(kind("[\"a\"]"), ErrorKind::MalformedArtifact);
    EXPECT_EQ(kind(R"({"a": 1})"), ErrorKind::MalformedArtifact);
    EXPECT_EQ(kind(R"({"a": ""})"), ErrorKind::MalformedArtifact);
}

// ============================================================================
// Discovery and assignment
// ============================================================================

TEST_F(IdentifierRenameTest, DiscoverySkipsReservedCommentsAndLiterals) {
    auto ids = codec.discoverIdentifiers(
        "// helper for inner\nfunction outer(x) { var s = \"label\"; return x + s; }");

    std::vector<std::string> expected = {"outer", "x", "s"};
    EXPECT_EQ(ids, expected);
}

TEST_F(IdentifierRenameTest, ExtraReservedWords) {
    IdentifierRenameConfig config;
    config.extra_reserved = {"jQuery"};
    IdentifierRenameCodec custom(config);

    auto ids = custom.discoverIdentifiers("jQuery(sel)");
    EXPECT_EQ(ids, std::vector<std::string>{"sel"});
}

TEST_F(IdentifierRenameTest, LongestNamesFirstStableOnTies) {
    RenameTable table = codec.assignNames({"ab", "longer", "cd", "x"}, "ab longer cd x");

    ASSERT_EQ(table.size(), 4u);
    EXPECT_EQ(table[0].first, "longer");
    EXPECT_EQ(table[1].first, "ab");
    EXPECT_EQ(table[2].first, "cd");
    EXPECT_EQ(table[3].first, "x");
    EXPECT_EQ(table[0].second, "a");
    EXPECT_EQ(table[3].second, "d");
}

TEST_F(IdentifierRenameTest, SkipsNamesAlreadyInUse) {
    // "a" occurs only inside a string, so it is never renamed and must not
    // be handed out
    CodecResult result = codec.encode("var x = \"a\";", "");

    EXPECT_EQ(result.text, "var b = \"a\";");
    EXPECT_EQ(result.log, "{\n  \"x\": \"b\"\n}");
}

TEST_F(IdentifierRenameTest, SkipsReservedCandidates) {
    IdentifierRenameConfig config;
    config.extra_reserved = {"a"};
    IdentifierRenameCodec custom(config);

    CodecResult result = custom.encode("let y = a;", "");
    EXPECT_EQ(result.text, "let b = a;");
}

// ============================================================================
// Encode
// ============================================================================

TEST_F(IdentifierRenameTest, Traits) {
    EXPECT_EQ(codec.getName(), "lexical-scramble");
    EXPECT_FALSE(codec.getTraits().encode_requires_key);
    EXPECT_EQ(codec.getTraits().decode_input, DecodeInput::RenameTable);
    EXPECT_FALSE(codec.getTraits().lossless);

    IdentifierRenameCodec plain(keepLayout());
    EXPECT_TRUE(plain.getTraits().lossless);
}

TEST_F(IdentifierRenameTest, RenamesAndMinifies) {
    CodecResult result = codec.encode("var x = 1; // note\n/* c */ var y = 2;", "");

    EXPECT_EQ(result.text, "var a = 1; var b = 2;");
    EXPECT_EQ(result.counters.at("identifiers_renamed"), 2);
    EXPECT_EQ(result.counters.at("replacements"), 2);
}

TEST_F(IdentifierRenameTest, RenamesInsideStringsToo) {
    CodecResult result = codec.encode("var foo = \"foo\";", "");

    EXPECT_EQ(result.text, "var a = \"a\";");
    EXPECT_EQ(codec.decode(result.text, result.log).text, "var foo = \"foo\";");
}

TEST_F(IdentifierRenameTest, ShortNameNeverCapturesAnother) {
    // longName -> a, a -> b: a sequential rewrite would merge them
    CodecResult result = codec.encode("var longName = a;", "");

    EXPECT_EQ(result.text, "var a = b;");
    EXPECT_EQ(codec.decode(result.text, result.log).text, "var longName = a;");
}

TEST_F(IdentifierRenameTest, DollarIdentifiers) {
    CodecResult result = codec.encode("var $el = $(sel);", "");

    EXPECT_EQ(result.text, "var a = c(b);");
    EXPECT_EQ(codec.decode(result.text, result.log).text, "var $el = $(sel);");
}

TEST_F(IdentifierRenameTest, NothingToRename) {
    CodecResult result = codec.encode("return   true;", "");

    EXPECT_EQ(result.text, "return true;");
    EXPECT_EQ(result.log, "{}");
}

// ============================================================================
// Decode
// ============================================================================

TEST_F(IdentifierRenameTest, RoundTripWithoutMinify) {
    IdentifierRenameCodec plain(keepLayout());
    const std::string source =
        "// counter\n"
        "function makeCounter(start) {\n"
        "    let count = start; /* state */\n"
        "    return function() { return count++; };\n"
        "}\n";

    CodecResult encoded = plain.encode(source, "");
    EXPECT_NE(encoded.text, source);
    EXPECT_EQ(plain.decode(encoded.text, encoded.log).text, source);
}

TEST_F(IdentifierRenameTest, RoundTripEqualsMinifiedSource) {
    const std::string source = "function foo(bar) {\n  // add one\n  return bar + 1;\n}\n";

    CodecResult encoded = codec.encode(source, "");
    CodecResult decoded = codec.decode(encoded.text, encoded.log);

    EXPECT_EQ(decoded.text, IdentifierRenameCodec::minify(source));
    EXPECT_EQ(decoded.log, "Successfully deobfuscated using the provided map.");
}

TEST_F(IdentifierRenameTest, DecodeErrors) {
    EXPECT_EQ(decodeError("a", ""), ErrorKind::MissingDecodeKey);
    EXPECT_EQ(decodeError("a", "{broken"), ErrorKind::MalformedArtifact);
    EXPECT_EQ(decodeError("a", R"({"x": "a", "y": "a"})"), ErrorKind::InconsistentMapping);
}

TEST_F(IdentifierRenameTest, MissingTableMessage) {
    try {
        codec.decode("a", "");
        FAIL() << "expected MissingDecodeKey";
    } catch (const CodecError& e) {
        EXPECT_STREQ(e.what(), "Deobfuscation map is required for Lexical Scramble.");
    }
}
