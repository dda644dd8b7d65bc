// world/kiln_shell.cpp
//
// Implementation notes:
//   - phase = 2*pi * (rpm / 60) * t, wrapped with fmod so long runs keep precision.
//   - Residence time follows the plant rule of thumb 30 min at 1 rpm, scaled by 1/rpm.
//   - No dependencies on ImGui / ImPlot / OpenGL.

#include "kiln_shell.h"

#include <algorithm>
#include <cmath>

namespace kiln {
namespace world {

// Numeric stability thresholds
static constexpr double kPI = 3.14159265358979323846;
static constexpr double kTwoPi = 2.0 * kPI;
static constexpr double kMinGeometry = 1e-6;
static constexpr double kResidenceAtOneRpm_min = 30.0;

static inline Vec3d make_v3(double x, double y, double z) {
    Vec3d out;
    out.x = x;
    out.y = y;
    out.z = z;
    return out;
}

double residenceTimeMinutes(double motor_rpm) {
    if (!std::isfinite(motor_rpm) || motor_rpm <= 0.0) return 0.0;
    return kResidenceAtOneRpm_min / motor_rpm;
}

double heatTransferEfficiency(double motor_rpm) {
    const double residence_min = residenceTimeMinutes(motor_rpm);
    if (residence_min <= 0.0) return 0.0;
    return std::min(1.0, residence_min / kResidenceAtOneRpm_min);
}

double KilnShell::rotationPhase(double time_s, double motor_rpm) {
    if (!std::isfinite(time_s) || !std::isfinite(motor_rpm) || motor_rpm <= 0.0) {
        return 0.0;
    }
    const double revs = (motor_rpm / 60.0) * time_s;
    double phase = kTwoPi * std::fmod(revs, 1.0);
    if (phase < 0.0) phase += kTwoPi;
    if (phase >= kTwoPi) phase = 0.0;
    return phase;
}

void KilnShell::recompute(const KilnShellInputs& in) {
    valid_ = false;

    if (!std::isfinite(cfg_.radius_m) || cfg_.radius_m <= kMinGeometry) return;
    if (!std::isfinite(cfg_.length_m) || cfg_.length_m <= kMinGeometry) return;
    if (!std::isfinite(cfg_.inclination_deg) || std::abs(cfg_.inclination_deg) >= 45.0) return;
    if (cfg_.ring_count < 2 || cfg_.ring_segments < 3) return;
    if (!std::isfinite(in.motor_rpm) || in.motor_rpm < 0.0) return;
    if (!std::isfinite(in.time_s)) return;

    geo_.phase_rad = rotationPhase(in.time_s, in.motor_rpm);

    // 1) Axis: feed end at origin (raised), burner end lower by the slope.
    const double incl = cfg_.inclination_deg * kPI / 180.0;
    const double drop = cfg_.length_m * std::sin(incl);
    const double run  = cfg_.length_m * std::cos(incl);
    geo_.feed_end_m   = make_v3(0.0, cfg_.radius_m + drop, 0.0);
    geo_.burner_end_m = make_v3(run, cfg_.radius_m, 0.0);

    // 2) Rings. Cross-section is taken perpendicular to X; the slope is small
    //    enough that the resulting ellipse skew is invisible at these scales.
    geo_.ring_count = cfg_.ring_count;
    geo_.ring_segments = cfg_.ring_segments;
    geo_.rings_m.assign(static_cast<std::size_t>(cfg_.ring_count * cfg_.ring_segments), Vec3d{});

    for (int k = 0; k < cfg_.ring_count; ++k) {
        const double u = static_cast<double>(k) / static_cast<double>(cfg_.ring_count - 1);
        const double cx = geo_.feed_end_m.x + u * (geo_.burner_end_m.x - geo_.feed_end_m.x);
        const double cy = geo_.feed_end_m.y + u * (geo_.burner_end_m.y - geo_.feed_end_m.y);

        for (int j = 0; j < cfg_.ring_segments; ++j) {
            const double a = kTwoPi * static_cast<double>(j) / static_cast<double>(cfg_.ring_segments)
                           + geo_.phase_rad;
            geo_.rings_m[static_cast<std::size_t>(k * cfg_.ring_segments + j)] =
                make_v3(cx, cy + cfg_.radius_m * std::cos(a), cfg_.radius_m * std::sin(a));
        }
    }

    // 3) Seam marker follows vertex 0 of the burner-end ring.
    geo_.seam_marker_m = geo_.ringVertex(cfg_.ring_count - 1, 0);

    valid_ = true;
}

} // namespace world
} // namespace kiln
