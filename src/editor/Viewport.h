#pragma once

#include <memory>

namespace notesketch {

/// Maps world coordinates (time in beats, pitch in Hz) to a canvas of
/// width x height cells and back. Row 0 is the top of the canvas.
class Viewport {
public:
    enum class Kind { Log, Linear };

    virtual ~Viewport() = default;

    virtual Kind kind() const = 0;
    virtual std::unique_ptr<Viewport> clone() const = 0;

    void setSize(int width, int height);
    int width() const { return width_; }
    int height() const { return height_; }

    double mapX(double time) const;
    double mapXinv(double column) const;
    double mapY(double pitch) const;
    double mapYinv(double row) const;

    /// Shift by a fraction of the visible span
    void translateX(double ratio);
    void translateY(double ratio);

    /// Zoom in by `ratio` (>1 narrows the span), keeping `about` fixed
    void zoomX(double ratio, double aboutTime);
    void zoomY(double ratio, double aboutPitch);

    double minTime() const { return minX_; }
    double maxTime() const { return maxX_; }
    double minPitch() const { return fromAxis(minY_); }
    double maxPitch() const { return fromAxis(maxY_); }

protected:
    Viewport(double minTime, double minPitchAxis, double maxTime, double maxPitchAxis);

    /// Pitch in Hz to the value the vertical axis is linear in, and back
    virtual double toAxis(double pitch) const = 0;
    virtual double fromAxis(double value) const = 0;

    double minX_;
    double minY_;
    double maxX_;
    double maxY_;
    int width_ = 80;
    int height_ = 24;
};

/// Vertical axis in MIDI note numbers (equal-tempered log pitch)
class LogViewport : public Viewport {
public:
    LogViewport(double minTime, double minPitch, double maxTime, double maxPitch);

    Kind kind() const override { return Kind::Log; }
    std::unique_ptr<Viewport> clone() const override;

    static double freqToNote(double freq);
    static double noteToFreq(double note);

protected:
    double toAxis(double pitch) const override { return freqToNote(pitch); }
    double fromAxis(double value) const override { return noteToFreq(value); }
};

/// Vertical axis in Hz
class LinearViewport : public Viewport {
public:
    LinearViewport(double minTime, double minPitch, double maxTime, double maxPitch);

    Kind kind() const override { return Kind::Linear; }
    std::unique_ptr<Viewport> clone() const override;

protected:
    double toAxis(double pitch) const override { return pitch; }
    double fromAxis(double value) const override { return value; }
};

/// The other kind of viewport showing the same region at the same size
std::unique_ptr<Viewport> toggled(const Viewport& viewport);

/// Default view: 16 beats, 55 Hz to 1760 Hz
std::unique_ptr<Viewport> makeViewport(Viewport::Kind kind, int width, int height);

} // namespace notesketch
