#include "tools/backup_store.hpp"

#include <doctest.h>

#include <chrono>

using namespace patchy;

TEST_CASE("backup_store") {
    BackupStore store;

    SUBCASE("snapshot_and_take") {
        CHECK_FALSE(store.contains("a.txt"));
        store.snapshot("a.txt", "one");
        CHECK(store.contains("a.txt"));
        CHECK(store.size() == 1);

        auto backup = store.take("a.txt");
        REQUIRE(backup);
        CHECK(backup->original_content == "one");
        CHECK(backup->file_path == "a.txt");
        CHECK_FALSE(store.contains("a.txt"));
        CHECK_FALSE(store.take("a.txt"));
    }

    SUBCASE("latest_snapshot_wins") {
        store.snapshot("a.txt", "one");
        store.snapshot("a.txt", "two");
        CHECK(store.size() == 1);
        CHECK(store.take("a.txt")->original_content == "two");
    }

    SUBCASE("paths_are_independent") {
        store.snapshot("a.txt", "a");
        store.snapshot("b.txt", "b");
        CHECK(store.take("b.txt")->original_content == "b");
        CHECK(store.contains("a.txt"));
    }

    SUBCASE("context_shares_the_store") {
        EditContext context{store};
        context.backups.snapshot("c.txt", "c");
        CHECK(store.contains("c.txt"));
    }

    SUBCASE("format_timestamp") {
        auto epoch = std::chrono::system_clock::from_time_t(0);
        CHECK(format_timestamp(epoch) == "1970-01-01 00:00:00 UTC");
    }
}
