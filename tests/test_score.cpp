#include "editor/Score.h"

#include <catch2/catch.hpp>

#include <cstdio>
#include <filesystem>
#include <string>

using namespace notesketch;

namespace {

Note makeNote(double start, double end, double pitch) {
    Note n;
    n.start = start;
    n.end = end;
    n.pitch = pitch;
    return n;
}

} // namespace

TEST_CASE("Score assigns ids and normalizes reversed notes", "[score]") {
    Score score;
    const int a = score.add(makeNote(0.0, 2.0, 220.0));
    const int b = score.add(makeNote(5.0, 3.0, 330.0));
    CHECK(a != b);
    CHECK(score.size() == 2);

    const Note* nb = score.find(b);
    REQUIRE(nb != nullptr);
    CHECK(nb->start == 3.0);
    CHECK(nb->end == 5.0);
    CHECK(nb->length() == 2.0);

    CHECK(score.remove(a));
    CHECK_FALSE(score.remove(a));
    CHECK(score.find(a) == nullptr);

    // Ids are never reused
    const int c = score.add(makeNote(1.0, 2.0, 110.0));
    CHECK(c != a);
    CHECK(c != b);
}

TEST_CASE("Box queries match any overlap", "[score]") {
    Score score;
    const int low = score.add(makeNote(0.0, 2.0, 110.0));
    const int high = score.add(makeNote(1.0, 3.0, 880.0));
    score.add(makeNote(6.0, 8.0, 440.0));

    CHECK(score.notesIn(1.5, 2.5, 100.0, 1000.0) == std::vector<int>{low, high});
    CHECK(score.notesIn(2.5, 1.5, 1000.0, 500.0) == std::vector<int>{high});
    CHECK(score.notesIn(4.0, 5.0, 0.0, 2000.0).empty());
}

TEST_CASE("Sorting by start keeps insertion order for ties", "[score]") {
    Score score;
    const int a = score.add(makeNote(2.0, 3.0, 220.0));
    const int b = score.add(makeNote(1.0, 4.0, 330.0));
    const int c = score.add(makeNote(2.0, 2.5, 440.0));

    auto sorted = score.sortedByStart();
    REQUIRE(sorted.size() == 3);
    CHECK(sorted[0].id == b);
    CHECK(sorted[1].id == a);
    CHECK(sorted[2].id == c);
    CHECK(score.endTime() == 4.0);
    CHECK(Score().endTime() == 0.0);
}

TEST_CASE("Score survives a TOML save and load", "[score]") {
    Score score;
    Note loud = makeNote(0.5, 1.5, 261.63);
    loud.velocity = 1.0;
    score.add(loud);
    score.add(makeNote(2.0, 4.0, 392.0));

    std::string error;
    auto loaded = Score::fromToml(score.toToml(), error);
    REQUIRE(loaded);
    CHECK(error.empty());
    REQUIRE(loaded->size() == 2);
    CHECK(loaded->notes()[0].start == 0.5);
    CHECK(loaded->notes()[0].pitch == Approx(261.63));
    CHECK(loaded->notes()[0].velocity == 1.0);
    CHECK(loaded->notes()[1].end == 4.0);
    CHECK(loaded->notes()[1].velocity == 0.75);
}

TEST_CASE("Score files are written and read back", "[score]") {
    const auto path = (std::filesystem::temp_directory_path() / "notesketch_score_test.toml").string();
    Score score;
    score.add(makeNote(1.0, 2.0, 300.0));

    std::string error;
    REQUIRE(score.save(path, error));
    auto loaded = Score::load(path, error);
    std::remove(path.c_str());

    REQUIRE(loaded);
    CHECK(loaded->size() == 1);
    CHECK(loaded->notes()[0].pitch == 300.0);

    CHECK_FALSE(Score::load(path, error));
    CHECK(error.rfind("Load error", 0) == 0);
}

TEST_CASE("Malformed score documents are rejected", "[score]") {
    std::string error;

    SECTION("versioned document") {
        CHECK_FALSE(Score::fromToml("version = 2\nnotes = []\n", error));
        CHECK(error == "Load error: unsupported version or corrupt document");
    }

    SECTION("invalid TOML") {
        CHECK_FALSE(Score::fromToml("notes = [[[", error));
        CHECK(error.rfind("Load error", 0) == 0);
    }

    SECTION("note without a pitch") {
        CHECK_FALSE(Score::fromToml("[[notes]]\nstart = 0.0\nend = 1.0\n", error));
        CHECK_FALSE(error.empty());
    }

    SECTION("note with a negative pitch") {
        CHECK_FALSE(Score::fromToml("[[notes]]\nstart = 0.0\nend = 1.0\npitch = -4.0\n", error));
    }
}

TEST_CASE("Loading clamps velocity and accepts an empty document", "[score]") {
    std::string error;
    auto score = Score::fromToml("[[notes]]\nstart = 0.0\nend = 1.0\npitch = 220.0\nvelocity = 3.0\n",
                                 error);
    REQUIRE(score);
    CHECK(score->notes()[0].velocity == 1.0);

    auto empty = Score::fromToml("", error);
    REQUIRE(empty);
    CHECK(empty->empty());
}
