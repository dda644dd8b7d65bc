#pragma once

#include <vector>

#include "KilnTypes.h"

namespace kiln {

// Burning-zone temperature bands for clinker formation.
enum class ClinkerQuality : int {
    Poor    = 0, // below partial sintering
    Partial = 1, // >= 1200 C
    Good    = 2, // >= 1350 C
};

constexpr double kClinkerPartial_C = 1200.0;
constexpr double kClinkerGood_C    = 1350.0;

ClinkerQuality classifyClinker(double temperature_C);
const char* toString(ClinkerQuality q);

struct RunSummary {
    int sample_count = 0;
    double duration_s = 0.0;
    double peak_temperature_C = 0.0;
    double final_temperature_C = 0.0;
    // Peak above setpoint (C); 0 if never exceeded.
    double overshoot_C = 0.0;
    // First time after which temperature stays within the band; negative if never settled.
    double settling_time_s = -1.0;
    // Integral of |setpoint - T| dt (C*s).
    double iae_C_s = 0.0;
    double total_co2_kg = 0.0;
    double mean_control_output = 0.0;
    double mean_fuel_kgph = 0.0;
    int saturated_samples = 0;
    int output_saturated_samples = 0;
};

// Summarizes an ordered sample series. Each sample's rates are held over the
// interval since the previous sample (the first interval starts at t0_s).
RunSummary summarizeRun(const std::vector<Sample>& samples,
                        const EmissionsParameters& emissions,
                        double t0_s = 0.0,
                        double settle_band_frac = 0.02);

// Annual savings against a fixed baseline firing rate.
struct EfficiencyParameters {
    double baseline_fuel_kgph = 700.0;
    double operating_days_per_year = 330.0;
    double fuel_price_per_tonne = 15.0;
    double co2_per_kg_fuel = 3.17;
};

struct EfficiencyEstimate {
    double fuel_saved_kg_per_year = 0.0;  // negative when burning above baseline
    double co2_avoided_kg_per_year = 0.0;
    double money_saved_per_year = 0.0;
};

EfficiencyEstimate estimateEfficiency(double fuel_kgph, const EfficiencyParameters& p = EfficiencyParameters{});

} // namespace kiln
