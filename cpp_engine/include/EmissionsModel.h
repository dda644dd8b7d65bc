#pragma once

#include "KilnTypes.h"

namespace kiln {

// Burner fuel rate implied by a control output (percent of firing capacity).
//   fuel = min(fuel_base + fuel_per_pct * max(0, u), fuel_max)
double fuelRateKgph(double control_output_pct, const EmissionsParameters& p);

// CO2 emission rate (kg/h). Tunable mapping, not combustion chemistry:
//   co2 = co2_per_kg_fuel * fuel(u) + temperature_coeff * max(0, T - temperature_ref)
// Non-decreasing in both inputs, clamped to >= 0, 0 for non-finite inputs.
double estimateEmissions(double control_output_pct, double temperature_C, const EmissionsParameters& p);

// Rejects non-finite values and negative fuel/CO2 coefficients, either of
// which would break monotonicity.
ConfigStatus validateEmissionsParameters(const EmissionsParameters& p);

} // namespace kiln
