#pragma once

// world/kiln_shell.h
//
// Rotary kiln shell geometry and rotation kinematics.
//
// Design goals:
//   - No ImGui / ImPlot / OpenGL dependencies.
//   - Deterministic geometry driven by (elapsed time, motor speed) only.
//     Rotation is cosmetic: it never feeds back into the thermal model.
//   - Simple interface for visualization to render the shell (rings + seams).
//
// Coordinate convention (matches vis/main_vis.cpp):
//   - Y is up.
//   - The kiln axis runs along +X from the feed end (x = 0) to the burner
//     end (x = length), descending by the inclination angle.
//   - Ring k, vertex j sits at angle theta_j + phase around the axis;
//     theta_0 = 0 points to +Y (top of the shell) before rotation.

#include <vector>

namespace kiln {
namespace world {

struct Vec3d {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;
};

struct KilnShellConfig {
    // Reference plant dimensions.
    double radius_m = 3.0;
    double length_m = 40.0;
    // Slope toward the burner end (typical 2-4 degrees).
    double inclination_deg = 3.5;

    int ring_count = 9;        // rings along the axis, >= 2
    int ring_segments = 24;    // vertices per ring, >= 3
};

struct KilnShellInputs {
    double time_s = 0.0;
    double motor_rpm = 2.5;
};

struct KilnShellGeometry {
    // Rotation phase in [0, 2*pi).
    double phase_rad = 0.0;

    // Shell axis endpoints (room coordinates).
    Vec3d feed_end_m {};
    Vec3d burner_end_m {};

    // rings_m[k * ring_segments + j]
    std::vector<Vec3d> rings_m {};
    int ring_count = 0;
    int ring_segments = 0;

    // Point on the burner-end rim that rotates with the shell (seam marker).
    Vec3d seam_marker_m {};

    const Vec3d& ringVertex(int ring, int seg) const {
        return rings_m[static_cast<std::size_t>(ring * ring_segments + seg)];
    }
};

// Material residence time for a given shell speed (minutes). 0 for rpm <= 0.
double residenceTimeMinutes(double motor_rpm);

// Fraction of burner heat reaching the material bed, min(1, residence / 30 min).
// Feeds PlantParameters::heat_transfer_efficiency_0_1. 0 for rpm <= 0.
double heatTransferEfficiency(double motor_rpm);

class KilnShell {
public:
    KilnShell() = default;
    explicit KilnShell(const KilnShellConfig& cfg) : cfg_(cfg) {}

    void setConfig(const KilnShellConfig& cfg) { cfg_ = cfg; }
    const KilnShellConfig& config() const { return cfg_; }

    // Recompute the shell geometry from inputs.
    // Side-effect free beyond updating geometry().
    void recompute(const KilnShellInputs& in);

    bool isValid() const { return valid_; }
    const KilnShellGeometry& geometry() const { return geo_; }

    // Rotation phase for (time, rpm), wrapped to [0, 2*pi). 0 for invalid inputs.
    static double rotationPhase(double time_s, double motor_rpm);

private:
    KilnShellConfig cfg_ {};
    KilnShellGeometry geo_ {};
    bool valid_ = false;
};

} // namespace world
} // namespace kiln
