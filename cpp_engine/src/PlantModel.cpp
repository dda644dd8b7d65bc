#include "PlantModel.h"

#include <algorithm>
#include <cmath>

namespace kiln {

namespace {

static inline bool isFinitePositive(double x) {
    return std::isfinite(x) && x > 0.0;
}

} // namespace

double plantEquilibrium(double heat_input_pct, const PlantParameters& p) {
    const double gain_eff = p.process_gain_C_per_pct * p.heat_transfer_efficiency_0_1;
    return gain_eff * heat_input_pct + p.ambient_C;
}

PlantStep advancePlant(double current_C, double heat_input_pct, double dt_s, const PlantParameters& p) {
    PlantStep out;
    out.temperature_C = current_C;

    if (!isFinitePositive(dt_s) || !isFinitePositive(p.time_constant_s)) {
        return out;
    }

    // Coarse dt (dt >= tau) lands on the equilibrium instead of overshooting it.
    const double frac = std::min(dt_s / p.time_constant_s, 1.0);
    const double target_C = plantEquilibrium(heat_input_pct, p);

    double next_C = current_C + frac * (target_C - current_C);
    if (!std::isfinite(next_C)) {
        // Hold the last good value; the envelope check below still applies.
        next_C = current_C;
    }

    if (next_C < p.floor_C) {
        next_C = p.floor_C;
        out.saturated = true;
    } else if (next_C > p.ceiling_C) {
        next_C = p.ceiling_C;
        out.saturated = true;
    }

    out.temperature_C = next_C;
    return out;
}

ConfigStatus validatePlantParameters(const PlantParameters& p) {
    const double vals[] = {
        p.time_constant_s, p.ambient_C, p.process_gain_C_per_pct,
        p.heat_transfer_efficiency_0_1, p.floor_C, p.ceiling_C, p.initial_temperature_C,
    };
    for (double v : vals) {
        if (!std::isfinite(v)) return {ConfigError::NonFiniteValue, "plant"};
    }
    if (p.time_constant_s <= 0.0) {
        return {ConfigError::InvalidTimeConstant, "time_constant_s"};
    }
    if (p.floor_C > p.ceiling_C) {
        return {ConfigError::InvalidEnvelope, "floor_C"};
    }
    if (p.heat_transfer_efficiency_0_1 < 0.0 || p.heat_transfer_efficiency_0_1 > 1.0) {
        return {ConfigError::InvalidEfficiency, "heat_transfer_efficiency_0_1"};
    }
    return {};
}

} // namespace kiln
