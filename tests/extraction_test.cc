#include "cinit.hh"

#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <vector>

using cinit::Error;
using cinit::ErrorKind;
using cinit::ExtractOptions;
using cinit::FieldMap;
using cinit::IndexedEntryMap;
using cinit::extract_field_map;
using cinit::overlay_entries;
using cinit::scan_indexed_entries;

namespace {

const char* const SPECIES_KEY = "SPECIES_[A-Z0-9_]+";

ExtractOptions strict_options() {
    ExtractOptions options;
    options.commit_unterminated = false;
    return options;
}

}  // namespace

// ============================================================================
// Block-assignment extractor
// ============================================================================

TEST(FieldMapTest, OneFieldPerLine) {
    const FieldMap fields = extract_field_map(
        "    .baseHP = 45,\n"
        "    .types = MON_TYPES(TYPE_GRASS, TYPE_POISON),\n"
        "    .speciesName = _(\"Bulbasaur\"),\n");
    ASSERT_EQ(fields.size(), 3u);
    EXPECT_EQ(fields.at("baseHP"), "45");
    EXPECT_EQ(fields.at("types"), "MON_TYPES(TYPE_GRASS, TYPE_POISON)");
    EXPECT_EQ(fields.at("speciesName"), "_(\"Bulbasaur\")");
}

TEST(FieldMapTest, NestedValuesKeepTheirCommas) {
    const FieldMap fields = extract_field_map(".x = FOO(1, 2),\n.y = { 1, 2, 3 },\n");
    EXPECT_EQ(fields, (FieldMap{{"x", "FOO(1, 2)"}, {"y", "{ 1, 2, 3 }"}}));
}

TEST(FieldMapTest, ValueSpanningLinesIsJoinedWithSpaces) {
    const FieldMap fields = extract_field_map(
        "    .evolutions = EVOLUTION({EVO_LEVEL, 16, SPECIES_IVYSAUR},\n"
        "                            {EVO_ITEM, ITEM_X, SPECIES_Y}),\n"
        "    .height = 7,\n");
    EXPECT_EQ(fields.at("evolutions"),
              "EVOLUTION({EVO_LEVEL, 16, SPECIES_IVYSAUR}, {EVO_ITEM, ITEM_X, SPECIES_Y})");
    EXPECT_EQ(fields.at("height"), "7");
}

TEST(FieldMapTest, SeveralFieldsOnOneLine) {
    const FieldMap fields = extract_field_map(".a = 1, .b = {2, 3}, .c = 4");
    ASSERT_EQ(fields.size(), 3u);
    EXPECT_EQ(fields.at("a"), "1");
    EXPECT_EQ(fields.at("b"), "{2, 3}");
    EXPECT_EQ(fields.at("c"), "4");
}

TEST(FieldMapTest, NestedDesignatorsStayInsideTheirValue) {
    const FieldMap fields = extract_field_map(".info = { .x = 1, .y = 2 }, .z = 3,");
    ASSERT_EQ(fields.size(), 2u);
    EXPECT_EQ(fields.at("info"), "{ .x = 1, .y = 2 }");
    EXPECT_EQ(fields.at("z"), "3");
}

TEST(FieldMapTest, DelimitersInsideStringsDoNotOpenValues) {
    const FieldMap fields = extract_field_map(".name = _(\"a{b,\"), .h = 1,");
    EXPECT_EQ(fields.at("name"), "_(\"a{b,\")");
    EXPECT_EQ(fields.at("h"), "1");
}

TEST(FieldMapTest, LastFieldWithoutCommaIsComplete) {
    const FieldMap fields = extract_field_map(".a = 1,\n.b = 2", strict_options());
    EXPECT_EQ(fields.at("a"), "1");
    EXPECT_EQ(fields.at("b"), "2");
}

TEST(FieldMapTest, UnterminatedFieldIsKeptByDefault) {
    const FieldMap fields = extract_field_map(".a = 1,\n.b = FOO(1, 2\n");
    EXPECT_EQ(fields.at("a"), "1");
    EXPECT_EQ(fields.at("b"), "FOO(1, 2");
}

TEST(FieldMapTest, UnterminatedFieldFailsInStrictMode) {
    try {
        extract_field_map(".a = 1,\n.b = FOO(1, 2\n", strict_options());
        FAIL() << "expected a parse error";
    } catch (const Error& ex) {
        EXPECT_EQ(ex.kind(), ErrorKind::Parse);
        EXPECT_NE(std::string(ex.what()).find(".b"), std::string::npos);
    }
}

TEST(FieldMapTest, RepeatedFieldKeepsLastValue) {
    const FieldMap fields = extract_field_map(".a = 1,\n.a = 2,\n");
    ASSERT_EQ(fields.size(), 1u);
    EXPECT_EQ(fields.at("a"), "2");
}

TEST(FieldMapTest, LinesOutsideFieldsAreIgnored) {
    const FieldMap fields = extract_field_map("junk\n# 12 \"file.h\"\n.a = 1,\nmore junk\n");
    ASSERT_EQ(fields.size(), 1u);
    EXPECT_EQ(fields.at("a"), "1");
}

TEST(FieldMapTest, EmptyInteriorYieldsEmptyMap) {
    EXPECT_TRUE(extract_field_map("").empty());
    EXPECT_TRUE(extract_field_map("  \n\n").empty());
}

// ============================================================================
// Indexed-entry scanner
// ============================================================================

namespace {

const char* const SPECIES_TABLE =
    "const struct SpeciesInfo gSpeciesInfo[] =\n"
    "{\n"
    "    [SPECIES_BULBASAUR] =\n"
    "    {\n"
    "        .baseHP = 45,\n"
    "        .height = 7,\n"
    "    },\n"
    "    [SPECIES_IVYSAUR] = { .baseHP = 60, .height = 10, },\n"
    "};\n";

}  // namespace

TEST(IndexedEntryTest, FindsMultiLineAndSingleLineEntries) {
    const IndexedEntryMap entries = scan_indexed_entries(SPECIES_TABLE, SPECIES_KEY);
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries.at("SPECIES_BULBASAUR").at("baseHP"), "45");
    EXPECT_EQ(entries.at("SPECIES_BULBASAUR").at("height"), "7");
    EXPECT_EQ(entries.at("SPECIES_IVYSAUR").at("baseHP"), "60");
    EXPECT_EQ(entries.at("SPECIES_IVYSAUR").at("height"), "10");
}

TEST(IndexedEntryTest, KeyPatternSelectsEntries) {
    const IndexedEntryMap entries = scan_indexed_entries(SPECIES_TABLE, "SPECIES_IVY[A-Z]+");
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries.count("SPECIES_IVYSAUR"), 1u);
}

TEST(IndexedEntryTest, DefaultPatternSkipsNumericIndices) {
    const IndexedEntryMap entries =
        scan_indexed_entries("[0] = { .x = 1, },\n[NAMED] = { .x = 2, },\n", "");
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries.at("NAMED").at("x"), "2");
}

TEST(IndexedEntryTest, AdjacentEntriesAreBothKept) {
    const IndexedEntryMap entries =
        scan_indexed_entries("[KEY_A] = { .x = 1, };[KEY_B] = { .x = 2, };", "KEY_[A-Z]");
    EXPECT_EQ(entries, (IndexedEntryMap{{"KEY_A", {{"x", "1"}}}, {"KEY_B", {{"x", "2"}}}}));
}

TEST(IndexedEntryTest, UnclosedEntryIsDroppedAndNeighbourKept) {
    const IndexedEntryMap entries =
        scan_indexed_entries("[KEY_A] = { .x = 1, ;[KEY_B] = { .x = 2, };", "KEY_[A-Z]");
    EXPECT_EQ(entries, (IndexedEntryMap{{"KEY_B", {{"x", "2"}}}}));
}

TEST(IndexedEntryTest, MalformedEntryDoesNotSwallowNeighbours) {
    const std::string text =
        "    [SPECIES_A] = { .x = 1, },\n"
        "    [SPECIES_B] = { .x = FOO(2,\n"
        "    [SPECIES_C] = { .x = 3, },\n"
        "};\n";
    std::vector<std::string> diagnostics;
    const IndexedEntryMap entries =
        scan_indexed_entries(text, SPECIES_KEY, ExtractOptions(), &diagnostics);
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries.at("SPECIES_A").at("x"), "1");
    EXPECT_EQ(entries.at("SPECIES_C").at("x"), "3");
    EXPECT_EQ(entries.count("SPECIES_B"), 0u);
    ASSERT_EQ(diagnostics.size(), 1u);
    EXPECT_NE(diagnostics[0].find("SPECIES_B"), std::string::npos);
}

TEST(IndexedEntryTest, NestedIndexDesignatorsStayInsideTheEntry) {
    const std::string text =
        "[SPECIES_A] = {\n"
        "    .evYield = { [STAT_HP] = 1, [STAT_ATK] = 2 },\n"
        "    .height = 7,\n"
        "},\n"
        "[SPECIES_B] = { .height = 9, },\n";
    std::vector<std::string> diagnostics;
    const IndexedEntryMap entries = scan_indexed_entries(text, "", ExtractOptions(), &diagnostics);
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries.at("SPECIES_A").at("evYield"), "{ [STAT_HP] = 1, [STAT_ATK] = 2 }");
    EXPECT_EQ(entries.at("SPECIES_A").at("height"), "7");
    EXPECT_EQ(entries.at("SPECIES_B").at("height"), "9");
    EXPECT_TRUE(diagnostics.empty());
}

TEST(IndexedEntryTest, NestedHeaderWithMatchingKeyIsNotABoundary) {
    const IndexedEntryMap entries = scan_indexed_entries(
        "[SPECIES_A] = { .forms = { [SPECIES_B] = 1 }, .h = 7, }", SPECIES_KEY);
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries.at("SPECIES_A").at("forms"), "{ [SPECIES_B] = 1 }");
    EXPECT_EQ(entries.at("SPECIES_A").at("h"), "7");
}

TEST(IndexedEntryTest, HeaderShapedStringIsNotAHeader) {
    std::vector<std::string> diagnostics;
    const IndexedEntryMap entries = scan_indexed_entries(
        "[SPECIES_A] = { .name = _(\"[SPECIES_Q] = x\"), .h = 7, }\n"
        "const char* s = \"[SPECIES_R] = {\";\n",
        SPECIES_KEY, ExtractOptions(), &diagnostics);
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries.at("SPECIES_A").at("name"), "_(\"[SPECIES_Q] = x\")");
    EXPECT_EQ(entries.at("SPECIES_A").at("h"), "7");
    EXPECT_TRUE(diagnostics.empty());
}

TEST(IndexedEntryTest, EmptyBlocksAreSkipped) {
    std::vector<std::string> diagnostics;
    const IndexedEntryMap entries = scan_indexed_entries(
        "[SPECIES_NONE] = { },\n[SPECIES_EGG] = {},\n[SPECIES_A] = { .x = 1 },\n",
        SPECIES_KEY, ExtractOptions(), &diagnostics);
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries.at("SPECIES_A").at("x"), "1");
    EXPECT_EQ(diagnostics.size(), 2u);
}

TEST(IndexedEntryTest, StrictModeSkipsEntryWithOpenField) {
    const std::string text =
        "[SPECIES_D] = { .x = (1, },\n"
        "[SPECIES_E] = { .x = 5, },\n";
    std::vector<std::string> diagnostics;
    const IndexedEntryMap strict =
        scan_indexed_entries(text, SPECIES_KEY, strict_options(), &diagnostics);
    ASSERT_EQ(strict.size(), 1u);
    EXPECT_EQ(strict.count("SPECIES_E"), 1u);
    EXPECT_EQ(diagnostics.size(), 1u);

    const IndexedEntryMap lenient = scan_indexed_entries(text, SPECIES_KEY);
    ASSERT_EQ(lenient.size(), 2u);
    EXPECT_EQ(lenient.at("SPECIES_D").at("x"), "(1");
}

TEST(IndexedEntryTest, LaterDuplicateKeyReplacesEarlier) {
    const IndexedEntryMap entries = scan_indexed_entries(
        "[SPECIES_A] = { .x = 1, .y = 2, },\n[SPECIES_A] = { .x = 3, },\n", SPECIES_KEY);
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries.at("SPECIES_A"), (FieldMap{{"x", "3"}}));
}

TEST(IndexedEntryTest, InvalidKeyPatternIsParseError) {
    try {
        scan_indexed_entries(SPECIES_TABLE, "SPECIES_[");
        FAIL() << "expected a parse error";
    } catch (const Error& ex) {
        EXPECT_EQ(ex.kind(), ErrorKind::Parse);
    }
}

TEST(IndexedEntryTest, ConcurrentScansAgree) {
    std::string text;
    for (int i = 0; i < 50; ++i) {
        text += "[SPECIES_N" + std::to_string(i) + "] = {\n    .baseHP = " + std::to_string(i) +
                ",\n    .types = MON_TYPES(TYPE_A, TYPE_B),\n},\n";
    }
    const IndexedEntryMap expected = scan_indexed_entries(text, SPECIES_KEY);
    ASSERT_EQ(expected.size(), 50u);

    std::vector<IndexedEntryMap> results(4);
    std::vector<std::thread> workers;
    for (size_t i = 0; i < results.size(); ++i) {
        workers.emplace_back([&text, &results, i]() {
            results[i] = scan_indexed_entries(text, SPECIES_KEY);
        });
    }
    for (auto& w : workers) w.join();
    for (const auto& r : results) EXPECT_EQ(r, expected);
}

// ============================================================================
// Overlay of entry maps
// ============================================================================

TEST(OverlayTest, OverlayReplacesWholeEntries) {
    IndexedEntryMap base = {{"A", {{"x", "1"}}}, {"B", {{"x", "2"}, {"z", "9"}}}};
    IndexedEntryMap overlay = {{"B", {{"y", "3"}}}, {"C", {{"x", "4"}}}};
    const IndexedEntryMap merged = overlay_entries(base, overlay);
    ASSERT_EQ(merged.size(), 3u);
    EXPECT_EQ(merged.at("A"), (FieldMap{{"x", "1"}}));
    EXPECT_EQ(merged.at("B"), (FieldMap{{"y", "3"}}));
    EXPECT_EQ(merged.at("C"), (FieldMap{{"x", "4"}}));
}
