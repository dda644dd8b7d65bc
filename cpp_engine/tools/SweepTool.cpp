#include "SensitivityAnalysis.h"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <string>

namespace {
std::string toLower(std::string v) {
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return v;
}

void printUsage() {
    std::cout << "SweepTool usage:\n"
              << "  SweepTool --param <kp|ki|kd|tau|rpm> [--min v] [--max v] [--samples n]\n"
              << "            [--setpoint C] [--t-end s] [--dt s] [--out file]\n";
}

bool parseDouble(const char* s, double& out) {
    try {
        std::size_t used = 0;
        out = std::stod(s, &used);
        return used > 0;
    } catch (const std::exception&) {
        return false;
    }
}

bool parseInt(const char* s, int& out) {
    try {
        std::size_t used = 0;
        out = std::stoi(s, &used);
        return used > 0;
    } catch (const std::exception&) {
        return false;
    }
}
} // namespace

int main(int argc, char** argv) {
    std::string param;
    double min_val = 0.0;
    double max_val = 0.0;
    int samples = 5;
    std::string out = "kiln_sensitivity.csv";
    bool min_set = false;
    bool max_set = false;

    kiln::SensitivityAnalyzer::ScenarioConfig scenario;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool ok = true;
        if (arg == "--param" && i + 1 < argc) {
            param = toLower(argv[++i]);
        } else if (arg == "--min" && i + 1 < argc) {
            ok = parseDouble(argv[++i], min_val);
            min_set = true;
        } else if (arg == "--max" && i + 1 < argc) {
            ok = parseDouble(argv[++i], max_val);
            max_set = true;
        } else if (arg == "--samples" && i + 1 < argc) {
            ok = parseInt(argv[++i], samples);
        } else if (arg == "--setpoint" && i + 1 < argc) {
            ok = parseDouble(argv[++i], scenario.controller.setpoint_C);
        } else if (arg == "--t-end" && i + 1 < argc) {
            ok = parseDouble(argv[++i], scenario.t_end_s);
        } else if (arg == "--dt" && i + 1 < argc) {
            ok = parseDouble(argv[++i], scenario.dt_s);
        } else if (arg == "--out" && i + 1 < argc) {
            out = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            return 0;
        } else {
            std::cout << "Unknown argument: " << arg << "\n";
            printUsage();
            return 1;
        }
        if (!ok) {
            std::cout << "Invalid value for " << arg << ": " << argv[i] << "\n";
            return 1;
        }
    }

    if (param.empty()) {
        printUsage();
        return 1;
    }
    if (!(scenario.dt_s > 0.0) || !(scenario.t_end_s > 0.0)) {
        std::cout << "--dt and --t-end must be > 0\n";
        return 1;
    }

    kiln::SensitivityAnalyzer analyzer;
    analyzer.setScenario(scenario);

    kiln::SensitivityAnalyzer::ParameterRange range;
    range.samples = samples;

    if (param == "kp") {
        range.nominal = scenario.controller.gains.Kp;
    } else if (param == "ki") {
        range.nominal = scenario.controller.gains.Ki;
    } else if (param == "kd") {
        range.nominal = scenario.controller.gains.Kd;
    } else if (param == "tau" || param == "time_constant" || param == "time_constant_s") {
        range.nominal = scenario.plant.time_constant_s;
    } else if (param == "rpm" || param == "motor_rpm") {
        range.nominal = scenario.motor_rpm;
    } else {
        std::cout << "Unsupported parameter: " << param << "\n";
        printUsage();
        return 1;
    }

    if (!min_set) {
        min_val = range.nominal * 0.75;
    }
    if (!max_set) {
        max_val = range.nominal * 1.25;
    }

    range.min = min_val;
    range.max = max_val;

    if (param == "kp") {
        analyzer.analyzeProportionalGain(range);
    } else if (param == "ki") {
        analyzer.analyzeIntegralGain(range);
    } else if (param == "kd") {
        analyzer.analyzeDerivativeGain(range);
    } else if (param == "rpm" || param == "motor_rpm") {
        analyzer.analyzeMotorSpeed(range);
    } else {
        analyzer.analyzeTimeConstant(range);
    }

    for (const auto& row : analyzer.results()) {
        if (!row.status.ok()) {
            std::cout << row.parameter_name << "=" << row.parameter_value
                      << "  rejected: " << row.status.field << " (" << kiln::toString(row.status.error) << ")\n";
            continue;
        }
        std::cout << row.parameter_name << "=" << row.parameter_value
                  << "  peak=" << row.metrics.peak_temperature_C << " C"
                  << "  settle=" << row.metrics.settling_time_s << " s"
                  << "  co2=" << row.metrics.total_co2_kg << " kg\n";
    }

    if (!analyzer.exportSensitivityMatrixCSV(out)) {
        std::cout << "Failed to write: " << out << "\n";
        return 1;
    }
    std::cout << "Wrote sensitivity sweep to: " << out << "\n";
    return 0;
}
