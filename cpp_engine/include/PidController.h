#pragma once

#include "KilnTypes.h"

namespace kiln {

enum class PidStatus : int {
    Ok            = 0,
    InvalidConfig = 1,
};

struct PidResult {
    PidStatus status = PidStatus::Ok;
    // Final output after clamping to output_bounds. 0 on InvalidConfig;
    // the caller holds its previous output instead.
    double output = 0.0;
    ControllerInternalState state{};

    // Term breakdown (AUTO only; zero in MANUAL).
    double error = 0.0;
    double p_term = 0.0;
    double i_term = 0.0;
    double d_term = 0.0;
    bool output_saturated = false;
};

// Positional PID with conditional-integration anti-windup.
//
// AUTO:   u = clamp(Kp*e + Ki*I + Kd*(e - e_prev)/dt, min, max)
//         e*dt is added to I only if the resulting raw output stays inside the
//         bounds, or the error pulls the output back out of saturation.
// MANUAL: u = clamp(manual_output, min, max); I and e_prev are frozen.
// Entering AUTO (from MANUAL, or first compute after reset) clears I and
// reseeds e_prev from the current error.
//
// Deterministic: depends only on the arguments. On InvalidConfig
// (dt <= 0, non-finite inputs, min > max, negative gains) the state is
// returned untouched.
PidResult computePid(double setpoint_C,
                     double measured_C,
                     double dt_s,
                     const ControllerConfig& cfg,
                     const ControllerInternalState& state);

ConfigStatus validateControllerConfig(const ControllerConfig& cfg);

// Owning wrapper keeping ControllerInternalState across ticks.
class PidController {
public:
    PidController() = default;

    PidResult compute(double setpoint_C, double measured_C, double dt_s, const ControllerConfig& cfg);

    void reset() { state_ = ControllerInternalState{}; }
    const ControllerInternalState& state() const { return state_; }

private:
    ControllerInternalState state_{};
};

} // namespace kiln
