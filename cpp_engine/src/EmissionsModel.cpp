#include "EmissionsModel.h"

#include <algorithm>
#include <cmath>

namespace kiln {

double fuelRateKgph(double control_output_pct, const EmissionsParameters& p) {
    if (!std::isfinite(control_output_pct)) return 0.0;
    const double fuel = p.fuel_base_kgph + p.fuel_per_pct_kgph * std::max(0.0, control_output_pct);
    return std::clamp(fuel, 0.0, std::max(0.0, p.fuel_max_kgph));
}

double estimateEmissions(double control_output_pct, double temperature_C, const EmissionsParameters& p) {
    if (!std::isfinite(control_output_pct) || !std::isfinite(temperature_C)) return 0.0;

    const double fuel_term = p.co2_per_kg_fuel * fuelRateKgph(control_output_pct, p);
    const double temp_term = p.temperature_coeff_kgph_per_C * std::max(0.0, temperature_C - p.temperature_ref_C);

    const double co2 = fuel_term + temp_term;
    if (!std::isfinite(co2)) return 0.0;
    return std::max(0.0, co2);
}

ConfigStatus validateEmissionsParameters(const EmissionsParameters& p) {
    const double vals[] = {
        p.fuel_base_kgph, p.fuel_per_pct_kgph, p.fuel_max_kgph,
        p.co2_per_kg_fuel, p.temperature_coeff_kgph_per_C, p.temperature_ref_C,
    };
    for (double v : vals) {
        if (!std::isfinite(v)) return {ConfigError::NonFiniteValue, "emissions"};
    }
    if (p.fuel_base_kgph < 0.0) return {ConfigError::NegativeCoefficient, "fuel_base_kgph"};
    if (p.fuel_per_pct_kgph < 0.0) return {ConfigError::NegativeCoefficient, "fuel_per_pct_kgph"};
    if (p.fuel_max_kgph < 0.0) return {ConfigError::NegativeCoefficient, "fuel_max_kgph"};
    if (p.co2_per_kg_fuel < 0.0) return {ConfigError::NegativeCoefficient, "co2_per_kg_fuel"};
    if (p.temperature_coeff_kgph_per_C < 0.0) {
        return {ConfigError::NegativeCoefficient, "temperature_coeff_kgph_per_C"};
    }
    return {};
}

} // namespace kiln
