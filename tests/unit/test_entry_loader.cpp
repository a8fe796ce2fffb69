#include <gtest/gtest.h>
#include "ingest/entry_loader.hpp"
#include <cstdio>
#include <filesystem>

using namespace lpi;
using json = nlohmann::json;

TEST(EntryLoaderTest, SortsChronologicallyAndKeepsFileOrderForSameDay) {
    json doc = json::array({
        {{"entry_id", "c"}, {"date", "2024-01-03"}, {"text", "third"}},
        {{"entry_id", "a"}, {"date", "2024-01-01"}, {"text", "first"}},
        {{"entry_id", "b1"}, {"date", "2024-01-02"}},
        {{"entry_id", "b2"}, {"date", "2024-01-02T08:30:00"}}
    });
    auto entries = parse_entries(doc);
    ASSERT_EQ(entries.size(), 4u);
    EXPECT_EQ(entries[0].entry_id, "a");
    EXPECT_EQ(entries[1].entry_id, "b1");
    EXPECT_EQ(entries[2].entry_id, "b2");
    EXPECT_EQ(entries[2].date, "2024-01-02");
    EXPECT_EQ(entries[3].entry_id, "c");
}

TEST(EntryLoaderTest, AcceptsWrappedDocument) {
    json doc = {{"entries", json::array({{{"entry_id", "x"}, {"date", "2024-05-01"}}})}};
    EXPECT_EQ(parse_entries(doc).size(), 1u);
}

TEST(EntryLoaderTest, RejectsInvalidEntries) {
    EXPECT_THROW(parse_entries(json::object()), std::runtime_error);
    EXPECT_THROW(parse_entries(json::array({{{"date", "2024-01-01"}}})), std::runtime_error);
    EXPECT_THROW(parse_entries(json::array({{{"entry_id", "a"}, {"date", "01/02/2024"}}})),
                 std::runtime_error);
    EXPECT_THROW(parse_entries(json::array({{{"entry_id", "a"}, {"date", "2024-01-01"}},
                                            {{"entry_id", "a"}, {"date", "2024-01-02"}}})),
                 std::runtime_error);
}

TEST(EntryLoaderTest, FileRoundTrip) {
    auto path = (std::filesystem::temp_directory_path() / "lpi_entries_test.json").string();
    EntryRecord e;
    e.entry_id = "d1";
    e.date = "2024-02-10";
    e.text = "Quiet Saturday.";
    e.location_city = "Porto";
    save_entries({e}, path);

    auto loaded = load_entries(path);
    std::remove(path.c_str());

    ASSERT_EQ(loaded.size(), 1u);
    EXPECT_EQ(loaded[0].text, "Quiet Saturday.");
    EXPECT_EQ(loaded[0].location_city, "Porto");
}

TEST(EntryLoaderTest, MissingFileThrows) {
    EXPECT_THROW(load_entries("/nonexistent/entries.json"), std::runtime_error);
}

TEST(EntryLoaderTest, CombinedTextSkipsEmptyParts) {
    EntryRecord e;
    e.text = "Long day.";
    e.image_caption = "A rainy street";
    EXPECT_EQ(combined_text(e), "Diary: Long day. Scene: A rainy street");

    e.voice_transcript = "Need rest.";
    EXPECT_EQ(combined_text(e), "Diary: Long day. Voice: Need rest. Scene: A rainy street");

    EXPECT_EQ(combined_text(EntryRecord()), "");
}
