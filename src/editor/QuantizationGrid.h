#pragma once

#include <vector>

namespace notesketch {

/// A harmonic grid line: the pitch and its index k (harmonic k*base for
/// pitches above the base, subharmonic base/k below)
struct GridLine {
    double pitch;
    int index;
    bool subharmonic;
};

/// Snaps pointer positions to the time grid and the harmonic pitch grid.
class QuantizationGrid {
public:
    /// Subharmonics of the lowest pitch searched by commonDivisor()
    static constexpr int kMaxDivisor = 32;

    /// Relative tolerance for "is a harmonic of"
    static constexpr double kHarmonicTolerance = 1e-3;

    QuantizationGrid(double xSnap = 1.0, double ySnap = 216.0);

    void setXSnap(double xSnap);
    double xSnap() const { return xSnap_; }

    /// Reference pitch in Hz. Non-positive values are ignored.
    void setYSnap(double ySnap);
    double ySnap() const { return ySnap_; }

    /// Nearest multiple of the X snap (identity when the snap is 0)
    double snapX(double x) const;

    /// Nearest harmonic of the reference at or above it, nearest subharmonic below
    double snapY(double y) const;

    /// Highest pitch of which every given pitch is a harmonic, searching the
    /// first kMaxDivisor subharmonics of the lowest one. Falls back to the
    /// lowest pitch divided by kMaxDivisor when nothing closer fits.
    static double commonDivisor(const std::vector<double>& pitches);

    /// Vertical line times in [x0, x1)
    std::vector<double> verticalLines(double x0, double x1) const;

    /// Harmonic and subharmonic lines between y0 and y1 Hz
    std::vector<GridLine> harmonicLines(double y0, double y1) const;

    /// Number of times n divides by 2, used to weight grid lines
    static int twoDivs(int n);

private:
    double xSnap_;
    double ySnap_;
};

} // namespace notesketch
