#pragma once

#include "KilnTypes.h"

namespace kiln {

// Result of one plant integration step.
struct PlantStep {
    double temperature_C = 0.0;
    // True if the integrated value left [floor_C, ceiling_C] and was clamped.
    bool saturated = false;
};

// First-order lag kiln thermal model (explicit Euler).
//
//   next = T + dt * ((gain_eff * heat + ambient - T) / tau)
//   gain_eff = process_gain_C_per_pct * heat_transfer_efficiency_0_1
//
// Pure function of its inputs. The step fraction dt/tau is capped at 1.
// Non-finite or non-positive dt returns the current temperature unchanged.
PlantStep advancePlant(double current_C, double heat_input_pct, double dt_s, const PlantParameters& p);

// Steady-state temperature for a constant heat input (unclamped).
double plantEquilibrium(double heat_input_pct, const PlantParameters& p);

ConfigStatus validatePlantParameters(const PlantParameters& p);

} // namespace kiln
