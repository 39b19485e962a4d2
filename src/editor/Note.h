#pragma once

#include <algorithm>

namespace notesketch {

/// A note on the pitch/time plane. Times are in beats, pitch in Hz.
struct Note {
    int id = 0;                 // assigned by Score, 0 = not yet added
    double start = 0.0;
    double end = 0.0;
    double pitch = 0.0;
    double velocity = 0.75;     // 0..1

    double length() const { return end - start; }

    /// Whether the note overlaps the box [t0, t1] x [p0, p1]
    bool intersects(double t0, double t1, double p0, double p1) const {
        return start <= std::max(t0, t1) && end >= std::min(t0, t1)
            && pitch >= std::min(p0, p1) && pitch <= std::max(p0, p1);
    }
};

} // namespace notesketch
