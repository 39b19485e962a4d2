#include "editor/Viewport.h"

#include <catch2/catch.hpp>

#include <cmath>

using namespace notesketch;

TEST_CASE("Default view maps 16 beats across the width", "[viewport]") {
    auto view = makeViewport(Viewport::Kind::Log, 80, 24);
    CHECK(view->mapX(0.0) == Approx(0.0));
    CHECK(view->mapX(8.0) == Approx(40.0));
    CHECK(view->mapX(16.0) == Approx(80.0));
    CHECK(view->mapXinv(20.0) == Approx(4.0));
}

TEST_CASE("Pitch grows upward with row 0 at the top", "[viewport]") {
    for (auto kind : {Viewport::Kind::Log, Viewport::Kind::Linear}) {
        auto view = makeViewport(kind, 80, 24);
        CHECK(view->mapY(55.0) == Approx(24.0));
        CHECK(view->mapY(1760.0) == Approx(0.0).margin(1e-9));
        CHECK(view->mapYinv(view->mapY(440.0)) == Approx(440.0));
        CHECK(view->minPitch() == Approx(55.0));
        CHECK(view->maxPitch() == Approx(1760.0));
    }
}

TEST_CASE("Log view spaces octaves evenly", "[viewport]") {
    auto view = makeViewport(Viewport::Kind::Log, 80, 24);
    // 55 Hz to 1760 Hz is five octaves over 24 rows
    const double octave = 24.0 / 5.0;
    CHECK(view->mapY(110.0) == Approx(24.0 - octave));
    CHECK(view->mapY(220.0) == Approx(24.0 - 2 * octave));
    CHECK(LogViewport::freqToNote(440.0) == Approx(69.0));
    CHECK(LogViewport::noteToFreq(81.0) == Approx(880.0));
}

TEST_CASE("Translate and zoom move the visible region", "[viewport]") {
    auto view = makeViewport(Viewport::Kind::Log, 80, 24);

    view->translateX(0.25);
    CHECK(view->minTime() == Approx(4.0));
    CHECK(view->maxTime() == Approx(20.0));

    view->zoomX(2.0, 12.0);
    CHECK(view->minTime() == Approx(8.0));
    CHECK(view->maxTime() == Approx(16.0));

    view->translateY(0.2);   // one octave up
    CHECK(view->minPitch() == Approx(110.0));
    CHECK(view->maxPitch() == Approx(3520.0));

    view->zoomY(2.0, 440.0);
    CHECK(view->mapYinv(view->mapY(440.0)) == Approx(440.0));
    CHECK(view->maxPitch() / view->minPitch() == Approx(std::pow(2.0, 2.5)));
}

TEST_CASE("Linear view stays above zero Hz", "[viewport]") {
    auto view = makeViewport(Viewport::Kind::Linear, 80, 24);
    view->translateY(-1.0);
    CHECK(view->minPitch() == Approx(1.0));
    CHECK(view->maxPitch() == Approx(1706.0));

    view->zoomY(0.5, 10.0);
    CHECK(view->minPitch() >= 1.0);
}

TEST_CASE("Toggling keeps the region and size", "[viewport]") {
    auto log = makeViewport(Viewport::Kind::Log, 100, 30);
    log->translateX(0.5);

    auto linear = toggled(*log);
    CHECK(linear->kind() == Viewport::Kind::Linear);
    CHECK(linear->width() == 100);
    CHECK(linear->height() == 30);
    CHECK(linear->minTime() == Approx(8.0));
    CHECK(linear->minPitch() == Approx(55.0));
    CHECK(linear->maxPitch() == Approx(1760.0));

    auto back = toggled(*linear);
    CHECK(back->kind() == Viewport::Kind::Log);
    CHECK(back->mapY(440.0) == Approx(log->mapY(440.0)));
}

TEST_CASE("Canvas size is at least one cell", "[viewport]") {
    auto view = makeViewport(Viewport::Kind::Log, 0, -3);
    CHECK(view->width() == 1);
    CHECK(view->height() == 1);

    auto copy = view->clone();
    CHECK(copy->kind() == Viewport::Kind::Log);
    CHECK(copy->width() == 1);
}
