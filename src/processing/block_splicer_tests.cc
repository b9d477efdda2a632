#include "processing/block_splicer.hpp"

#include <doctest.h>

#include <algorithm>
#include <string>
#include <vector>

using namespace patchy;

TEST_CASE("splice_window") {
    SUBCASE("centered") {
        auto w = splice_window(5, 3, 10, 20);
        CHECK(w.start == 2);
        CHECK(w.end == 8);
        CHECK(w.replace_count == 6);
    }

    SUBCASE("clamped_at_top") {
        auto w = splice_window(1, 3, 3, 5);
        CHECK(w.start == 0);
        CHECK(w.end == 4);
        CHECK(w.replace_count == 3);
    }

    SUBCASE("clamped_at_bottom") {
        auto w = splice_window(4, 3, 10, 5);
        CHECK(w.start == 1);
        CHECK(w.end == 5);
        CHECK(w.replace_count == 4);
    }

    SUBCASE("empty_buffer") {
        auto w = splice_window(0, 3, 4, 0);
        CHECK(w.start == 0);
        CHECK(w.end == 0);
        CHECK(w.replace_count == 0);
    }

    SUBCASE("anchor_past_end") {
        auto w = splice_window(10, 3, 4, 2);
        CHECK(w.start == 2);
        CHECK(w.replace_count == 0);
    }

    SUBCASE("removal_is_bounded") {
        const int64_t C = 3;
        for (int64_t len = 0; len < 12; len++) {
            for (int64_t anchor = 0; anchor < std::max<int64_t>(len, 1); anchor++) {
                for (int64_t fragment_len = 0; fragment_len < 9; fragment_len++) {
                    auto w = splice_window(anchor, C, fragment_len, len);
                    CHECK(w.replace_count >= 0);
                    CHECK(w.replace_count <= std::min(2 * C, fragment_len));
                    CHECK(w.start + w.replace_count <= len);
                }
            }
        }
    }
}

TEST_CASE("splice_block") {
    SUBCASE("duplicates_trailing_line") {
        // Anchoring on "b" (index 1) replaces three lines from the top. The
        // second "d" is left behind; that's how the window heuristic works.
        std::vector<std::string> buffer = {"a", "b", "c", "d", "e"};
        auto w = splice_block(buffer, 1, {"b", "X", "d"}, 3);
        CHECK(w.start == 0);
        CHECK(w.end == 4);
        CHECK(w.replace_count == 3);
        CHECK(buffer == std::vector<std::string>{"b", "X", "d", "d", "e"});
    }

    SUBCASE("fragment_larger_than_window") {
        std::vector<std::string> buffer = {"a", "b"};
        auto w = splice_block(buffer, 0, {"1", "2", "3", "4", "5"}, 3);
        CHECK(w.replace_count == 2);
        CHECK(buffer == std::vector<std::string>{"1", "2", "3", "4", "5"});
    }

    SUBCASE("into_empty_buffer") {
        std::vector<std::string> buffer;
        splice_block(buffer, 0, {"x", "y"}, 3);
        CHECK(buffer == std::vector<std::string>{"x", "y"});
    }

    SUBCASE("middle_of_long_buffer") {
        std::vector<std::string> buffer;
        for (int i = 0; i < 20; i++) {
            buffer.push_back(std::to_string(i));
        }
        auto w = splice_block(buffer, 10, {"ten", "eleven"}, 3);
        CHECK(w.start == 7);
        CHECK(w.replace_count == 2);
        REQUIRE(buffer.size() == 20);
        CHECK(buffer[6] == "6");
        CHECK(buffer[7] == "ten");
        CHECK(buffer[8] == "eleven");
        CHECK(buffer[9] == "9");
    }

    SUBCASE("length_accounting") {
        std::vector<std::string> buffer = {"a", "b", "c", "d", "e", "f", "g", "h"};
        Fragment fragment = {"1", "2", "3", "4", "5", "6", "7", "8", "9"};
        auto before = static_cast<int64_t>(buffer.size());
        auto w = splice_block(buffer, 4, fragment, 3);
        CHECK(static_cast<int64_t>(buffer.size()) ==
              before - w.replace_count + static_cast<int64_t>(fragment.size()));
    }
}
