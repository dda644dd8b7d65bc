#include "KilnMetrics.h"

#include "EmissionsModel.h"

#include <algorithm>
#include <cmath>

namespace kiln {

ClinkerQuality classifyClinker(double temperature_C) {
    if (!std::isfinite(temperature_C)) return ClinkerQuality::Poor;
    if (temperature_C >= kClinkerGood_C) return ClinkerQuality::Good;
    if (temperature_C >= kClinkerPartial_C) return ClinkerQuality::Partial;
    return ClinkerQuality::Poor;
}

const char* toString(ClinkerQuality q) {
    switch (q) {
        case ClinkerQuality::Good:    return "Good clinker formation";
        case ClinkerQuality::Partial: return "Partial sintering";
        case ClinkerQuality::Poor:    return "Poor quality";
    }
    return "Unknown";
}

RunSummary summarizeRun(const std::vector<Sample>& samples,
                        const EmissionsParameters& emissions,
                        double t0_s,
                        double settle_band_frac) {
    RunSummary m{};
    if (samples.empty()) return m;

    m.sample_count = static_cast<int>(samples.size());
    m.peak_temperature_C = samples.front().temperature_C;

    double t_prev = t0_s;
    double weighted_output = 0.0;
    double weighted_fuel = 0.0;
    double total_dt = 0.0;

    for (const Sample& s : samples) {
        const double dt = std::max(0.0, s.t_s - t_prev);
        t_prev = s.t_s;

        m.peak_temperature_C = std::max(m.peak_temperature_C, s.temperature_C);
        m.overshoot_C = std::max(m.overshoot_C, s.temperature_C - s.setpoint_C);
        m.iae_C_s += std::abs(s.setpoint_C - s.temperature_C) * dt;
        // Rates are per hour.
        m.total_co2_kg += s.emission_rate_kgph * dt / 3600.0;

        weighted_output += s.control_output * dt;
        weighted_fuel += fuelRateKgph(s.control_output, emissions) * dt;
        total_dt += dt;

        if (s.flags_u32 & Flag_TemperatureSaturated) ++m.saturated_samples;
        if (s.flags_u32 & Flag_OutputSaturated) ++m.output_saturated_samples;
    }

    m.duration_s = total_dt;
    m.final_temperature_C = samples.back().temperature_C;
    if (total_dt > 0.0) {
        m.mean_control_output = weighted_output / total_dt;
        m.mean_fuel_kgph = weighted_fuel / total_dt;
    }

    // Settling: walk backwards to the last sample outside the band.
    const double band_frac = std::max(0.0, settle_band_frac);
    int last_outside = -1;
    for (int i = m.sample_count - 1; i >= 0; --i) {
        const Sample& s = samples[static_cast<std::size_t>(i)];
        const double band = band_frac * std::abs(s.setpoint_C);
        if (std::abs(s.temperature_C - s.setpoint_C) > band) {
            last_outside = i;
            break;
        }
    }
    if (last_outside < 0) {
        m.settling_time_s = samples.front().t_s - t0_s;
    } else if (last_outside + 1 < m.sample_count) {
        m.settling_time_s = samples[static_cast<std::size_t>(last_outside + 1)].t_s - t0_s;
    }

    return m;
}

EfficiencyEstimate estimateEfficiency(double fuel_kgph, const EfficiencyParameters& p) {
    EfficiencyEstimate e{};
    if (!std::isfinite(fuel_kgph)) return e;

    const double hours = p.operating_days_per_year * 24.0;
    e.fuel_saved_kg_per_year = (p.baseline_fuel_kgph - fuel_kgph) * hours;
    e.co2_avoided_kg_per_year = e.fuel_saved_kg_per_year * p.co2_per_kg_fuel;
    e.money_saved_per_year = (e.fuel_saved_kg_per_year / 1000.0) * p.fuel_price_per_tonne;
    return e;
}

} // namespace kiln
