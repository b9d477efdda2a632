#include "bipolar_array.hpp"

#include <doctest.h>

#include <utility>

TEST_CASE("BipolarArray") {
    SUBCASE("negative_indices") {
        auto a = patchy::BipolarArray<unsigned int>(-1, 1);
        a[0] = 1;
        a[-1] = 2;

        REQUIRE(a[0] == 1);
        REQUIRE(a[-1] == 2);
        REQUIRE(a[1] == 0);
    }

    SUBCASE("full_range") {
        auto a = patchy::BipolarArray<int>(-4, 3);
        for (int i = -4; i <= 3; i++) {
            a[i] = i * 10;
        }
        for (int i = -4; i <= 3; i++) {
            CHECK(a[i] == i * 10);
        }
        CHECK(a.min() == -4);
        CHECK(a.max() == 3);
    }

    SUBCASE("slice_copies_the_range") {
        auto a = patchy::BipolarArray<int>(-5, 5);
        for (int i = -5; i <= 5; i++) {
            a[i] = i;
        }
        auto b = a.slice(-2, 2);
        CHECK(b.min() == -2);
        CHECK(b.max() == 2);
        CHECK(b[-2] == -2);
        CHECK(b[2] == 2);

        b[0] = 42;
        CHECK(a[0] == 0);
    }

    SUBCASE("move") {
        auto a = patchy::BipolarArray<int>(-1, 1);
        a[1] = 7;
        auto b = std::move(a);
        CHECK(b[1] == 7);
    }
}
