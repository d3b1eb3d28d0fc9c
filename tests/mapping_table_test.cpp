#include <libdarija/darija_core.h>

#include <gtest/gtest.h>

#include <filesystem>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace {

std::vector<std::string> tokensOf(const std::vector<MappingEntry>& entries) {
    std::vector<std::string> tokens;
    for (const auto& entry : entries) tokens.push_back(entry.token);
    return tokens;
}

MappingTable tableOf(std::vector<MappingEntry> entries) {
    return MappingTable(std::move(entries));
}

std::string shippedMappingFile() {
    return (fs::path(DARIJA_SRC_DIR) / "core" / "data" / "mapping.toml").string();
}

TEST(BuiltinTableTest, KeepsInsertionOrder) {
    const MappingTable& table = builtinDarijaTable();
    ASSERT_EQ(table.size(), 14u);
    EXPECT_EQ(tokensOf(table.entries()),
              (std::vector<std::string>{"3", "7", "9", "2", "5", "6", "8",
                                        "dh", "d7", "sh", "s5", "s9", "d9", "z7"}));
}

TEST(BuiltinTableTest, SplitsIntoTwoPasses) {
    const MappingTable& table = builtinDarijaTable();
    EXPECT_EQ(tokensOf(table.multiCharEntries()),
              (std::vector<std::string>{"dh", "d7", "sh", "s5", "s9", "d9", "z7"}));
    EXPECT_EQ(tokensOf(table.singleCharEntries()),
              (std::vector<std::string>{"3", "7", "9", "2", "5", "6", "8"}));
}

TEST(BuiltinTableTest, LooksUpTokens) {
    const MappingTable& table = builtinDarijaTable();
    ASSERT_NE(table.find("sh"), nullptr);
    EXPECT_EQ(table.find("sh")->replacement, "ش");
    EXPECT_EQ(table.find("3")->replacement, "ع");
    EXPECT_EQ(table.find("gh"), nullptr);
    EXPECT_EQ(table.find("SH"), nullptr);
    EXPECT_TRUE(table.contains("z7"));
    EXPECT_FALSE(table.contains(""));
}

TEST(BuiltinTableTest, AllowsSeveralTokensForOneLetter) {
    const MappingTable& table = builtinDarijaTable();
    EXPECT_EQ(table.find("s5")->replacement, "ص");
    EXPECT_EQ(table.find("s9")->replacement, "ص");
}

TEST(BuiltinTableTest, IsSharedAndReadOnly) {
    EXPECT_EQ(&builtinDarijaTable(), &builtinDarijaTable());
    Normalizer normalizer;
    EXPECT_EQ(tokensOf(normalizer.table().entries()), tokensOf(builtinDarijaTable().entries()));
}

TEST(MappingTableTest, SortsMultiCharTokensLongestFirst) {
    MappingTable table({
        {"ab", "ع"},
        {"x", "ح"},
        {"abcd", "ق"},
        {"abc", "خ"},
        {"yz", "ط"},
    });
    EXPECT_EQ(tokensOf(table.multiCharEntries()),
              (std::vector<std::string>{"abcd", "abc", "ab", "yz"}));
    EXPECT_EQ(tokensOf(table.singleCharEntries()), (std::vector<std::string>{"x"}));
    EXPECT_EQ(tokensOf(table.entries()),
              (std::vector<std::string>{"ab", "x", "abcd", "abc", "yz"}));
}

TEST(MappingTableTest, RejectsInvalidTables) {
    EXPECT_THROW(MappingTable(std::vector<MappingEntry>{}), std::runtime_error);
    EXPECT_THROW(tableOf({{"", "ع"}}), std::runtime_error);
    EXPECT_THROW(tableOf({{"SH", "ش"}}), std::runtime_error);
    EXPECT_THROW(tableOf({{"s h", "ش"}}), std::runtime_error);
    EXPECT_THROW(tableOf({{"\xC3\xA9", "ع"}}), std::runtime_error);
    EXPECT_THROW(tableOf({{"sh", "ش"}, {"sh", "ص"}}), std::runtime_error);
    EXPECT_THROW(tableOf({{"sh", ""}}), std::runtime_error);
    EXPECT_THROW(tableOf({{"sh", "x"}}), std::runtime_error);
    EXPECT_THROW(tableOf({{"sh", "ش "}}), std::runtime_error);
}

TEST(MappingTableTest, ParsesCharMapSection) {
    const std::string toml =
        "# comment line\n"
        "[meta]\n"
        "\"ignored\" = \"ع\"\n"
        "\n"
        "[charMap]\n"
        "\"3\" = \"ع\"   # trailing comment\n"
        "'sh' = 'ش'\n"
        "kh = \"خ\"\r\n"
        "\"a#\" = \"ح\"\n"
        "\"a=\" = \"ق\"\n"
        "not a mapping line\n"
        "[ other ]\n"
        "\"zz\" = \"ز\"\n";
    MappingTable table = MappingTable::fromToml(toml);
    EXPECT_EQ(tokensOf(table.entries()),
              (std::vector<std::string>{"3", "sh", "kh", "a#", "a="}));
    EXPECT_EQ(table.find("3")->replacement, "ع");
    EXPECT_EQ(table.find("kh")->replacement, "خ");
    EXPECT_EQ(table.find("a#")->replacement, "ح");
    EXPECT_EQ(table.find("a=")->replacement, "ق");
    EXPECT_FALSE(table.contains("ignored"));
    EXPECT_FALSE(table.contains("zz"));
}

TEST(MappingTableTest, ValidatesParsedEntries) {
    EXPECT_THROW(MappingTable::fromToml("[charMap]\n\"sh\" = \"ش\"\n\"sh\" = \"ص\"\n"),
                 std::runtime_error);
    EXPECT_THROW(MappingTable::fromToml("[charMap]\n\"Sh\" = \"ش\"\n"), std::runtime_error);
    EXPECT_THROW(MappingTable::fromToml("[otherSection]\n\"sh\" = \"ش\"\n"), std::runtime_error);
}

TEST(MappingTableTest, ShippedFileMatchesBuiltinTable) {
    MappingTable fromFile = MappingTable::fromFile(shippedMappingFile());
    const MappingTable& builtin = builtinDarijaTable();
    ASSERT_EQ(fromFile.size(), builtin.size());
    for (size_t i = 0; i < builtin.size(); ++i) {
        EXPECT_EQ(fromFile.entries()[i].token, builtin.entries()[i].token);
        EXPECT_EQ(fromFile.entries()[i].replacement, builtin.entries()[i].replacement);
    }
}

TEST(MappingTableTest, MissingFileThrows) {
    EXPECT_THROW(MappingTable::fromFile("/nonexistent/darija/mapping.toml"), std::runtime_error);
    EXPECT_THROW(Normalizer("/nonexistent/darija/mapping.toml"), std::runtime_error);
}

TEST(MappingTableTest, NormalizerLoadsMappingFile) {
    Normalizer normalizer(shippedMappingFile());
    EXPECT_EQ(normalizer.normalize("shkun ghadi ydir 2chghal d9i9a?"),
              "شkun ghadi ydir ءchghal ضiقa?");
}

TEST(TextClassificationTest, RecognizesArabicScript) {
    EXPECT_TRUE(isArabicScriptText(std::string("ش")));
    EXPECT_TRUE(isArabicScriptText(std::string("السلام")));
    EXPECT_TRUE(isArabicScriptText(std::string("ﻻ")));  // presentation form
    EXPECT_FALSE(isArabicScriptText(std::string("")));
    EXPECT_FALSE(isArabicScriptText(std::string("sh")));
    EXPECT_FALSE(isArabicScriptText(std::string("ال سلام")));
    EXPECT_FALSE(isArabicScriptText(std::string("\xD8")));
}

TEST(TextClassificationTest, ValidatesUtf8) {
    EXPECT_TRUE(isValidUtf8(""));
    EXPECT_TRUE(isValidUtf8("3andi"));
    EXPECT_TRUE(isValidUtf8("عندي \xF0\x9F\x98\x80"));
    EXPECT_FALSE(isValidUtf8("\xC3\x28"));
    EXPECT_FALSE(isValidUtf8("\xE2\x82"));
    EXPECT_FALSE(isValidUtf8("\xC0\xAF"));  // overlong '/'
}

TEST(VersionTest, ReportsBuildVersion) {
    EXPECT_EQ(getDarijaVersion(), DARIJA_VERSION);
    EXPECT_FALSE(getDarijaVersion().empty());
}

} // namespace
