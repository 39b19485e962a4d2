#include "editor/Viewport.h"

#include <algorithm>
#include <cmath>

namespace notesketch {

namespace {

double mapRange(double v, double a0, double a1, double b0, double b1) {
    if (a1 == a0)
        return b0;
    return b0 + (v - a0) * (b1 - b0) / (a1 - a0);
}

constexpr double kMinPitch = 1.0;   // lowest Hz a linear view may show

} // namespace

Viewport::Viewport(double minTime, double minPitchAxis, double maxTime, double maxPitchAxis)
    : minX_(minTime)
    , minY_(minPitchAxis)
    , maxX_(maxTime)
    , maxY_(maxPitchAxis)
{}

void Viewport::setSize(int width, int height) {
    width_ = std::max(width, 1);
    height_ = std::max(height, 1);
}

double Viewport::mapX(double time) const {
    return mapRange(time, minX_, maxX_, 0.0, width_);
}

double Viewport::mapXinv(double column) const {
    return mapRange(column, 0.0, width_, minX_, maxX_);
}

double Viewport::mapY(double pitch) const {
    return mapRange(toAxis(pitch), minY_, maxY_, height_, 0.0);
}

double Viewport::mapYinv(double row) const {
    return fromAxis(mapRange(row, height_, 0.0, minY_, maxY_));
}

void Viewport::translateX(double ratio) {
    const double dx = (maxX_ - minX_) * ratio;
    minX_ += dx;
    maxX_ += dx;
}

void Viewport::translateY(double ratio) {
    double dy = (maxY_ - minY_) * ratio;
    // keep linear views above 0 Hz
    if (kind() == Kind::Linear && minY_ + dy < kMinPitch)
        dy = kMinPitch - minY_;
    minY_ += dy;
    maxY_ += dy;
}

void Viewport::zoomX(double ratio, double aboutTime) {
    if (!(ratio > 0.0))
        return;
    const double oldWidth = maxX_ - minX_;
    const double newWidth = oldWidth / ratio;

    minX_ = aboutTime - (aboutTime - minX_) * newWidth / oldWidth;
    maxX_ = minX_ + newWidth;
}

void Viewport::zoomY(double ratio, double aboutPitch) {
    if (!(ratio > 0.0) || !(aboutPitch > 0.0))
        return;
    const double about = toAxis(aboutPitch);
    const double oldHeight = maxY_ - minY_;
    const double newHeight = oldHeight / ratio;

    minY_ = about - (about - minY_) * newHeight / oldHeight;
    maxY_ = minY_ + newHeight;
    if (kind() == Kind::Linear && minY_ < kMinPitch) {
        maxY_ += kMinPitch - minY_;
        minY_ = kMinPitch;
    }
}

// ---------------------------------------------------------------------------
// LogViewport
// ---------------------------------------------------------------------------

LogViewport::LogViewport(double minTime, double minPitch, double maxTime, double maxPitch)
    : Viewport(minTime, freqToNote(minPitch), maxTime, freqToNote(maxPitch))
{}

std::unique_ptr<Viewport> LogViewport::clone() const {
    return std::make_unique<LogViewport>(*this);
}

double LogViewport::freqToNote(double freq) {
    return 12.0 * std::log2(freq / 440.0) + 69.0;
}

double LogViewport::noteToFreq(double note) {
    return 440.0 * std::pow(2.0, (note - 69.0) / 12.0);
}

// ---------------------------------------------------------------------------
// LinearViewport
// ---------------------------------------------------------------------------

LinearViewport::LinearViewport(double minTime, double minPitch, double maxTime, double maxPitch)
    : Viewport(minTime, std::max(minPitch, kMinPitch), maxTime, maxPitch)
{}

std::unique_ptr<Viewport> LinearViewport::clone() const {
    return std::make_unique<LinearViewport>(*this);
}

// ---------------------------------------------------------------------------

std::unique_ptr<Viewport> toggled(const Viewport& viewport) {
    std::unique_ptr<Viewport> out;
    if (viewport.kind() == Viewport::Kind::Log) {
        out = std::make_unique<LinearViewport>(viewport.minTime(), viewport.minPitch(),
                                               viewport.maxTime(), viewport.maxPitch());
    } else {
        out = std::make_unique<LogViewport>(viewport.minTime(), viewport.minPitch(),
                                            viewport.maxTime(), viewport.maxPitch());
    }
    out->setSize(viewport.width(), viewport.height());
    return out;
}

std::unique_ptr<Viewport> makeViewport(Viewport::Kind kind, int width, int height) {
    std::unique_ptr<Viewport> out;
    if (kind == Viewport::Kind::Log)
        out = std::make_unique<LogViewport>(0.0, 55.0, 16.0, 1760.0);
    else
        out = std::make_unique<LinearViewport>(0.0, 55.0, 16.0, 1760.0);
    out->setSize(width, height);
    return out;
}

} // namespace notesketch
