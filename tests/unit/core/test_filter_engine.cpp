/**
 * @file test_filter_engine.cpp
 * @brief Unit tests for filter predicates and listing helpers
 */

#include <gtest/gtest.h>

#include <kcenon/log_collector/core/filter_engine.h>

#include <chrono>
#include <string>
#include <vector>

namespace kcenon::log_collector::test {

using namespace std::chrono_literals;

class FilterEngineTest : public ::testing::Test {
protected:
    void SetUp() override { now_ = std::chrono::system_clock::now(); }

    auto make_entry(const std::string& path, uint64_t size,
                    std::chrono::system_clock::duration age = 0s) const -> file_entry {
        file_entry entry;
        entry.path = path;
        entry.absolute_path = "/var/log/" + path;
        entry.size = size;
        entry.modified_at = now_ - age;
        return entry;
    }

    std::chrono::system_clock::time_point now_;
};

// =============================================================================
// Filter construction
// =============================================================================

TEST_F(FilterEngineTest, Pattern_RejectsInvalidExpression) {
    auto result = filter_config::pattern("[unclosed");

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::invalid_filter_pattern);
}

TEST_F(FilterEngineTest, Pattern_RejectsEmptyExpression) {
    auto result = filter_config::pattern("");

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::invalid_filter_pattern);
}

TEST_F(FilterEngineTest, Extensions_NormalizesDotAndCase) {
    auto result = filter_config::extensions({"LOG", ".Txt"});

    ASSERT_TRUE(result.has_value());
    const auto& allowed = result.value().allowed_extensions();
    ASSERT_EQ(allowed.size(), 2u);
    EXPECT_EQ(allowed[0], ".log");
    EXPECT_EQ(allowed[1], ".txt");
}

TEST_F(FilterEngineTest, Extensions_RejectsEmptyList) {
    auto result = filter_config::extensions({});
    EXPECT_FALSE(result.has_value());
}

TEST_F(FilterEngineTest, SizeRange_RejectsInvertedBounds) {
    auto result = filter_config::size_range(100, 10);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::invalid_configuration);
}

TEST_F(FilterEngineTest, DateSince_ParsesSupportedFormats) {
    EXPECT_TRUE(filter_config::date_since(std::string("2025-01-31")).has_value());
    EXPECT_TRUE(filter_config::date_since(std::string("2025-01-31 08:15:00")).has_value());
    EXPECT_TRUE(filter_config::date_since(std::string("2025-01-31T08:15:00")).has_value());
}

TEST_F(FilterEngineTest, DateSince_RejectsMalformedDates) {
    for (const char* text : {"yesterday", "2025-13-01", "2025-02-30", "2025-01-31 25:00:00",
                             "2025-01-31extra"}) {
        auto result = filter_config::date_since(std::string(text));
        ASSERT_FALSE(result.has_value()) << text;
        EXPECT_EQ(result.error().code, error_code::invalid_date) << text;
    }
}

TEST_F(FilterEngineTest, ParseDate_DateOnlyIsLocalMidnight) {
    auto date_only = filter_engine::parse_date("2025-06-15");
    auto with_time = filter_engine::parse_date("2025-06-15 00:00:00");

    ASSERT_TRUE(date_only.has_value());
    ASSERT_TRUE(with_time.has_value());
    EXPECT_EQ(date_only.value(), with_time.value());
}

// =============================================================================
// Predicate evaluation
// =============================================================================

TEST_F(FilterEngineTest, All_MatchesEverything) {
    EXPECT_TRUE(filter_engine::matches(make_entry("a.log", 0), filter_config::all()));
    EXPECT_TRUE(filter_engine::matches(make_entry("core.dump", 1 << 20), filter_config::all()));
}

TEST_F(FilterEngineTest, Pattern_MatchesAgainstFilenameOnly) {
    auto filter = filter_config::pattern("^kern").value();

    EXPECT_TRUE(filter_engine::matches(make_entry("kern.log", 10), filter));
    EXPECT_TRUE(filter_engine::matches(make_entry("old/kern.log.1", 10), filter));
    EXPECT_FALSE(filter_engine::matches(make_entry("kernel/syslog", 10), filter));
}

TEST_F(FilterEngineTest, Pattern_SearchesAnywhereInName) {
    auto filter = filter_config::pattern("error").value();

    EXPECT_TRUE(filter_engine::matches(make_entry("app_error_2025.log", 10), filter));
    EXPECT_FALSE(filter_engine::matches(make_entry("app_info.log", 10), filter));
}

TEST_F(FilterEngineTest, DateSince_IsInclusive) {
    auto since = now_ - 48h;
    auto filter = filter_config::date_since(since);

    auto at_boundary = make_entry("edge.log", 1);
    at_boundary.modified_at = since;

    EXPECT_TRUE(filter_engine::matches(at_boundary, filter));
    EXPECT_TRUE(filter_engine::matches(make_entry("b.log", 1, 24h), filter));
    EXPECT_FALSE(filter_engine::matches(make_entry("a.log", 1, 5 * 24h), filter));
}

TEST_F(FilterEngineTest, Extension_IsCaseInsensitive) {
    auto filter = filter_config::extensions({"log"}).value();

    EXPECT_TRUE(filter_engine::matches(make_entry("APP.LOG", 1), filter));
    EXPECT_TRUE(filter_engine::matches(make_entry("app.log", 1), filter));
    EXPECT_FALSE(filter_engine::matches(make_entry("app.log.gz", 1), filter));
    EXPECT_FALSE(filter_engine::matches(make_entry("catalog", 1), filter));
}

TEST_F(FilterEngineTest, SizeRange_BoundsAreInclusive) {
    auto bounded = filter_config::size_range(10, 100).value();
    auto open = filter_config::size_range(10).value();

    EXPECT_FALSE(filter_engine::matches(make_entry("a", 9), bounded));
    EXPECT_TRUE(filter_engine::matches(make_entry("a", 10), bounded));
    EXPECT_TRUE(filter_engine::matches(make_entry("a", 100), bounded));
    EXPECT_FALSE(filter_engine::matches(make_entry("a", 101), bounded));
    EXPECT_TRUE(filter_engine::matches(make_entry("a", 1ull << 40), open));
}

TEST_F(FilterEngineTest, DirectoriesAlwaysMatch) {
    auto dir = make_entry("archive", 0);
    dir.is_directory = true;

    EXPECT_TRUE(filter_engine::matches(dir, filter_config::pattern("^nomatch$").value()));
    EXPECT_TRUE(filter_engine::matches(dir, filter_config::size_range(1000).value()));
}

// =============================================================================
// Chains
// =============================================================================

TEST_F(FilterEngineTest, Chain_EmptyMatchesEverything) {
    filter_chain chain;
    EXPECT_TRUE(filter_engine::matches(make_entry("anything.bin", 5), chain));
}

TEST_F(FilterEngineTest, Chain_RequiresEveryPredicate) {
    filter_chain chain{filter_config::extensions({"log"}).value(),
                       filter_config::date_since(now_ - 48h)};

    EXPECT_TRUE(filter_engine::matches(make_entry("b.log", 1, 24h), chain));
    EXPECT_FALSE(filter_engine::matches(make_entry("a.log", 1, 5 * 24h), chain));
    EXPECT_FALSE(filter_engine::matches(make_entry("b.txt", 1, 24h), chain));
}

TEST_F(FilterEngineTest, Apply_DropsDirectoriesAndNonMatches) {
    std::vector<file_entry> entries{make_entry("a.log", 1), make_entry("b.txt", 2),
                                    make_entry("sub", 0), make_entry("sub/c.log", 3)};
    entries[2].is_directory = true;

    auto selected =
        filter_engine::apply(entries, filter_chain{filter_config::extensions({"log"}).value()});

    ASSERT_EQ(selected.size(), 2u);
    EXPECT_EQ(selected[0].path, "a.log");
    EXPECT_EQ(selected[1].path, "sub/c.log");
}

// =============================================================================
// Listing helpers
// =============================================================================

TEST_F(FilterEngineTest, SortEntries_ByNameIgnoresCase) {
    std::vector<file_entry> entries{make_entry("b.log", 1), make_entry("A.log", 2),
                                    make_entry("c.log", 3)};

    filter_engine::sort_entries(entries, sort_key::name);

    EXPECT_EQ(entries[0].path, "A.log");
    EXPECT_EQ(entries[1].path, "b.log");
    EXPECT_EQ(entries[2].path, "c.log");
}

TEST_F(FilterEngineTest, SortEntries_BySizeDescending) {
    std::vector<file_entry> entries{make_entry("small", 1), make_entry("large", 300),
                                    make_entry("medium", 20)};

    filter_engine::sort_entries(entries, sort_key::size, true);

    EXPECT_EQ(entries[0].path, "large");
    EXPECT_EQ(entries[1].path, "medium");
    EXPECT_EQ(entries[2].path, "small");
}

TEST_F(FilterEngineTest, SortEntries_ByModified) {
    std::vector<file_entry> entries{make_entry("new", 1, 1h), make_entry("old", 1, 10h)};

    filter_engine::sort_entries(entries, sort_key::modified);

    EXPECT_EQ(entries[0].path, "old");
    EXPECT_EQ(entries[1].path, "new");
}

TEST_F(FilterEngineTest, TotalSizeSkipsDirectories) {
    std::vector<file_entry> entries{make_entry("a", 100), make_entry("dir", 4096),
                                    make_entry("b", 50)};
    entries[1].is_directory = true;

    EXPECT_EQ(filter_engine::total_size(entries), 150u);
}

TEST_F(FilterEngineTest, FormatSize) {
    EXPECT_EQ(filter_engine::format_size(0), "0.00 B");
    EXPECT_EQ(filter_engine::format_size(512), "512.00 B");
    EXPECT_EQ(filter_engine::format_size(1536), "1.50 KB");
    EXPECT_EQ(filter_engine::format_size(5ull * 1024 * 1024), "5.00 MB");
}

TEST_F(FilterEngineTest, Describe) {
    EXPECT_EQ(filter_config::all().describe(), "all");
    EXPECT_EQ(filter_config::pattern("^kern").value().describe(), "pattern '^kern'");
    EXPECT_EQ(filter_config::size_range(1, 2).value().describe(), "size in [1, 2]");
    EXPECT_EQ(filter_config::extensions({"log", "txt"}).value().describe(),
              "extension in {.log,.txt}");
}

}  // namespace kcenon::log_collector::test
