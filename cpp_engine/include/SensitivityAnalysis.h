#pragma once

#include <string>
#include <vector>

#include "KilnMetrics.h"
#include "KilnTypes.h"

namespace kiln {

class SensitivityAnalyzer {
public:
    struct ParameterRange {
        double nominal = 0.0;
        double min = 0.0;
        double max = 0.0;
        int samples = 0;
    };

    struct ScenarioConfig {
        double dt_s = 1.0;
        double t_end_s = 3600.0;
        // Optional setpoint step (applied once when time crosses step_at_s).
        double step_at_s = -1.0;
        double step_setpoint_C = 1350.0;
        double motor_rpm = 1.0;
        ControllerConfig controller{};
        PlantParameters plant{};
        EmissionsParameters emissions{};
    };

    struct SensitivityRow {
        std::string parameter_name;
        double parameter_value = 0.0;
        // Not ok when the swept value made the scenario invalid; metrics stay empty.
        ConfigStatus status{};
        RunSummary metrics{};
    };

    SensitivityAnalyzer();

    void setScenario(const ScenarioConfig& scenario);
    const ScenarioConfig& scenario() const { return scenario_; }
    void clearResults();

    void analyzeProportionalGain(const ParameterRange& range);
    void analyzeIntegralGain(const ParameterRange& range);
    void analyzeDerivativeGain(const ParameterRange& range);
    void analyzeTimeConstant(const ParameterRange& range);
    void analyzeMotorSpeed(const ParameterRange& range);

    // Returns false if the file cannot be opened.
    bool exportSensitivityMatrixCSV(const std::string& filename) const;
    const std::vector<SensitivityRow>& results() const;

    // Checks the plant (after shell-speed coupling), emissions, controller
    // and timing of a scenario without running it.
    static ConfigStatus validateScenario(const ScenarioConfig& scenario);

    // Runs one closed-loop scenario to t_end_s and summarizes it. Returns an
    // empty summary (sample_count == 0) when validateScenario rejects it.
    static RunSummary runScenario(const ScenarioConfig& scenario);

private:
    ScenarioConfig scenario_{};
    std::vector<SensitivityRow> results_{};

    std::vector<double> sampleValues(const ParameterRange& range) const;
    void appendRow(const char* name, double value, const ScenarioConfig& scenario);
};

} // namespace kiln
