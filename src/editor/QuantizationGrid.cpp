#include "editor/QuantizationGrid.h"

#include <algorithm>
#include <cmath>

namespace notesketch {

namespace {
constexpr int kMaxLines = 512;
}

QuantizationGrid::QuantizationGrid(double xSnap, double ySnap)
    : xSnap_(xSnap > 0.0 ? xSnap : 0.0)
    , ySnap_(ySnap > 0.0 ? ySnap : 216.0)
{}

void QuantizationGrid::setXSnap(double xSnap) {
    xSnap_ = xSnap > 0.0 ? xSnap : 0.0;
}

void QuantizationGrid::setYSnap(double ySnap) {
    if (ySnap > 0.0)
        ySnap_ = ySnap;
}

double QuantizationGrid::snapX(double x) const {
    if (xSnap_ == 0.0)
        return x;
    return xSnap_ * std::round(x / xSnap_);
}

double QuantizationGrid::snapY(double y) const {
    if (y <= 0.0)
        return ySnap_;
    if (ySnap_ <= y)
        return ySnap_ * std::round(y / ySnap_);
    return ySnap_ / std::round(ySnap_ / y);
}

double QuantizationGrid::commonDivisor(const std::vector<double>& pitches) {
    if (pitches.empty())
        return 0.0;

    const double lowest = *std::min_element(pitches.begin(), pitches.end());
    if (lowest <= 0.0)
        return 0.0;

    for (int k = 1; k <= kMaxDivisor; ++k) {
        const double base = lowest / k;
        bool fits = true;
        for (double p : pitches) {
            const double ratio = p / base;
            if (std::abs(ratio - std::round(ratio)) > kHarmonicTolerance * ratio) {
                fits = false;
                break;
            }
        }
        if (fits)
            return base;
    }
    return lowest / kMaxDivisor;
}

std::vector<double> QuantizationGrid::verticalLines(double x0, double x1) const {
    std::vector<double> lines;
    if (xSnap_ == 0.0 || x1 <= x0)
        return lines;

    for (double x = std::ceil(x0 / xSnap_) * xSnap_;
         x < x1 && static_cast<int>(lines.size()) < kMaxLines; x += xSnap_) {
        lines.push_back(x);
    }
    return lines;
}

std::vector<GridLine> QuantizationGrid::harmonicLines(double y0, double y1) const {
    const double lo = std::min(y0, y1);
    const double hi = std::max(y0, y1);
    std::vector<GridLine> lines;

    // upper lines
    for (int i = 1; ySnap_ * i < hi && i <= kMaxLines; ++i) {
        const double y = ySnap_ * i;
        if (y >= lo)
            lines.push_back({y, i, false});
    }

    // lower lines
    for (int n = 2; ySnap_ / n > 1.0 && ySnap_ / n > lo && n <= kMaxLines; ++n) {
        const double y = ySnap_ / n;
        if (y <= hi)
            lines.push_back({y, n, true});
    }
    return lines;
}

int QuantizationGrid::twoDivs(int n) {
    if (n <= 0)
        return 0;
    int r = 0;
    while (n % 2 == 0) {
        ++r;
        n /= 2;
    }
    return r;
}

} // namespace notesketch
