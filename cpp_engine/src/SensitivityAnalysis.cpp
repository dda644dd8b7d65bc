#include "SensitivityAnalysis.h"

#include "EmissionsModel.h"
#include "KilnSimulator.h"
#include "PidController.h"
#include "PlantModel.h"
#include "../world/kiln_shell.h"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>

namespace kiln {

SensitivityAnalyzer::SensitivityAnalyzer() = default;

void SensitivityAnalyzer::setScenario(const ScenarioConfig& scenario) {
    scenario_ = scenario;
}

void SensitivityAnalyzer::clearResults() {
    results_.clear();
}

std::vector<double> SensitivityAnalyzer::sampleValues(const ParameterRange& range) const {
    std::vector<double> values;
    if (range.samples <= 1 || range.max <= range.min) {
        values.push_back(range.nominal);
        return values;
    }

    values.reserve(static_cast<std::size_t>(range.samples));
    const double span = range.max - range.min;
    const int steps = range.samples - 1;
    for (int i = 0; i < range.samples; ++i) {
        const double t = static_cast<double>(i) / static_cast<double>(steps);
        values.push_back(range.min + span * t);
    }
    return values;
}

namespace {

PlantParameters coupledPlant(const SensitivityAnalyzer::ScenarioConfig& scenario) {
    PlantParameters plant = scenario.plant;
    if (scenario.motor_rpm > 0.0) {
        // Shell speed sets the bed heat-transfer efficiency.
        plant.heat_transfer_efficiency_0_1 = world::heatTransferEfficiency(scenario.motor_rpm);
    }
    return plant;
}

} // namespace

ConfigStatus SensitivityAnalyzer::validateScenario(const ScenarioConfig& scenario) {
    if (!std::isfinite(scenario.dt_s) || scenario.dt_s <= 0.0 ||
        !std::isfinite(scenario.t_end_s) || scenario.t_end_s <= 0.0) {
        return {ConfigError::NonFiniteValue, "dt_s"};
    }
    if (!std::isfinite(scenario.motor_rpm)) {
        return {ConfigError::NonFiniteValue, "motor_rpm"};
    }
    // 0 rpm leaves the shell uncoupled; negative speeds have no meaning here.
    if (scenario.motor_rpm < 0.0) {
        return {ConfigError::NegativeCoefficient, "motor_rpm"};
    }

    ConfigStatus st = validatePlantParameters(coupledPlant(scenario));
    if (!st.ok()) return st;
    st = validateEmissionsParameters(scenario.emissions);
    if (!st.ok()) return st;
    return validateControllerConfig(scenario.controller);
}

RunSummary SensitivityAnalyzer::runScenario(const ScenarioConfig& scenario) {
    // The simulator would quietly substitute defaults for a bad plant.
    if (!validateScenario(scenario).ok()) {
        return RunSummary{};
    }
    const PlantParameters plant = coupledPlant(scenario);

    // Samples are collected here, so the simulator's own ring can stay small.
    KilnSimulator sim(plant, scenario.emissions, 16);
    ConfigPatch patch;
    patch.setpoint_C = scenario.controller.setpoint_C;
    patch.gains = scenario.controller.gains;
    patch.mode = scenario.controller.mode;
    patch.manual_output = scenario.controller.manual_output;
    patch.output_bounds = scenario.controller.output_bounds;
    if (!sim.setConfig(patch).ok()) {
        return RunSummary{};
    }
    sim.start();

    std::vector<Sample> samples;
    if (scenario.dt_s > 0.0 && scenario.t_end_s > 0.0) {
        samples.reserve(static_cast<std::size_t>(scenario.t_end_s / scenario.dt_s) + 1u);
    }

    double t = 0.0;
    bool stepped = false;

    while (scenario.dt_s > 0.0 && t + scenario.dt_s <= scenario.t_end_s + 1e-9) {
        const double t_next = t + scenario.dt_s;

        if (!stepped && scenario.step_at_s >= 0.0 && t_next >= scenario.step_at_s) {
            ConfigPatch step;
            step.setpoint_C = scenario.step_setpoint_C;
            if (!sim.setConfig(step).ok()) break;
            stepped = true;
        }

        const TickResult r = sim.tick(scenario.dt_s);
        if (!r.has_sample) break;
        samples.push_back(r.sample);
        t = t_next;
    }

    return summarizeRun(samples, scenario.emissions);
}

void SensitivityAnalyzer::appendRow(const char* name, double value, const ScenarioConfig& scenario) {
    SensitivityRow row;
    row.parameter_name = name;
    row.parameter_value = value;
    row.status = validateScenario(scenario);
    if (row.status.ok()) {
        row.metrics = runScenario(scenario);
    }
    results_.push_back(row);
}

void SensitivityAnalyzer::analyzeProportionalGain(const ParameterRange& range) {
    clearResults();
    for (double value : sampleValues(range)) {
        ScenarioConfig scenario = scenario_;
        scenario.controller.gains.Kp = value;
        appendRow("Kp", value, scenario);
    }
}

void SensitivityAnalyzer::analyzeIntegralGain(const ParameterRange& range) {
    clearResults();
    for (double value : sampleValues(range)) {
        ScenarioConfig scenario = scenario_;
        scenario.controller.gains.Ki = value;
        appendRow("Ki", value, scenario);
    }
}

void SensitivityAnalyzer::analyzeDerivativeGain(const ParameterRange& range) {
    clearResults();
    for (double value : sampleValues(range)) {
        ScenarioConfig scenario = scenario_;
        scenario.controller.gains.Kd = value;
        appendRow("Kd", value, scenario);
    }
}

void SensitivityAnalyzer::analyzeTimeConstant(const ParameterRange& range) {
    clearResults();
    for (double value : sampleValues(range)) {
        ScenarioConfig scenario = scenario_;
        scenario.plant.time_constant_s = value;
        appendRow("time_constant_s", value, scenario);
    }
}

void SensitivityAnalyzer::analyzeMotorSpeed(const ParameterRange& range) {
    clearResults();
    for (double value : sampleValues(range)) {
        ScenarioConfig scenario = scenario_;
        scenario.motor_rpm = value;
        appendRow("motor_rpm", value, scenario);
    }
}

bool SensitivityAnalyzer::exportSensitivityMatrixCSV(const std::string& filename) const {
    std::ofstream out(filename);
    if (!out.is_open()) {
        return false;
    }

    out << "parameter,value,peak_T_C,final_T_C,overshoot_C,settling_time_s,iae_C_s,"
           "total_co2_kg,mean_fuel_kgph,output_saturated_samples,status\n";
    out << std::fixed << std::setprecision(6);
    for (const auto& row : results_) {
        out << row.parameter_name << ','
            << row.parameter_value << ','
            << row.metrics.peak_temperature_C << ','
            << row.metrics.final_temperature_C << ','
            << row.metrics.overshoot_C << ','
            << row.metrics.settling_time_s << ','
            << row.metrics.iae_C_s << ','
            << row.metrics.total_co2_kg << ','
            << row.metrics.mean_fuel_kgph << ','
            << row.metrics.output_saturated_samples << ','
            << (row.status.ok() ? "ok" : row.status.field) << '\n';
    }
    return static_cast<bool>(out);
}

const std::vector<SensitivityAnalyzer::SensitivityRow>& SensitivityAnalyzer::results() const {
    return results_;
}

} // namespace kiln
