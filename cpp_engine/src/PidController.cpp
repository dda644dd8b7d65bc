#include "PidController.h"

#include <algorithm>
#include <cmath>

namespace kiln {

namespace {

static inline bool isFinitePositive(double x) {
    return std::isfinite(x) && x > 0.0;
}

static inline double clampOut(double x, const OutputBounds& b) {
    return std::clamp(x, b.min, b.max);
}

static bool isValidMode(ControlMode m) {
    return m == ControlMode::Auto || m == ControlMode::Manual;
}

} // namespace

ConfigStatus validateControllerConfig(const ControllerConfig& cfg) {
    const double vals[] = {
        cfg.setpoint_C, cfg.gains.Kp, cfg.gains.Ki, cfg.gains.Kd,
        cfg.output_bounds.min, cfg.output_bounds.max, cfg.manual_output,
    };
    for (double v : vals) {
        if (!std::isfinite(v)) return {ConfigError::NonFiniteValue, "controller"};
    }
    if (cfg.gains.Kp < 0.0) return {ConfigError::NegativeGain, "Kp"};
    if (cfg.gains.Ki < 0.0) return {ConfigError::NegativeGain, "Ki"};
    if (cfg.gains.Kd < 0.0) return {ConfigError::NegativeGain, "Kd"};
    if (cfg.output_bounds.min > cfg.output_bounds.max) {
        return {ConfigError::InvertedBounds, "output_bounds"};
    }
    if (!isValidMode(cfg.mode)) return {ConfigError::InvalidMode, "mode"};
    return {};
}

PidResult computePid(double setpoint_C,
                     double measured_C,
                     double dt_s,
                     const ControllerConfig& cfg,
                     const ControllerInternalState& state) {
    PidResult r;
    r.state = state;

    if (!isFinitePositive(dt_s) ||
        !std::isfinite(setpoint_C) || !std::isfinite(measured_C) ||
        !validateControllerConfig(cfg).ok()) {
        r.status = PidStatus::InvalidConfig;
        return r;
    }

    const OutputBounds& b = cfg.output_bounds;

    if (cfg.mode == ControlMode::Manual) {
        r.output = clampOut(cfg.manual_output, b);
        r.output_saturated = (r.output <= b.min || r.output >= b.max);
        r.state.last_mode = ControlMode::Manual;
        return r;
    }

    const double e = setpoint_C - measured_C;
    r.error = e;

    // Entering AUTO: no stale integral, no derivative kick. The first AUTO
    // output is Kp*e + Ki*e*dt regardless of the last MANUAL output.
    if (state.last_mode != ControlMode::Auto) {
        r.state.integral = 0.0;
        r.state.previous_error = e;
    }

    const PidGains& g = cfg.gains;
    const double derivative = (e - r.state.previous_error) / dt_s;

    r.p_term = g.Kp * e;
    r.d_term = g.Kd * derivative;

    const double integral_candidate = r.state.integral + e * dt_s;
    const double raw_candidate = r.p_term + g.Ki * integral_candidate + r.d_term;

    // Conditional integration: pause accumulation while the output would sit
    // beyond a bound and the error pushes further into it.
    const bool winding_up   = (raw_candidate > b.max) && (e > 0.0);
    const bool winding_down = (raw_candidate < b.min) && (e < 0.0);
    if (!winding_up && !winding_down) {
        r.state.integral = integral_candidate;
    }

    r.i_term = g.Ki * r.state.integral;
    const double raw = r.p_term + r.i_term + r.d_term;

    r.output = clampOut(raw, b);
    r.output_saturated = (raw >= b.max || raw <= b.min);
    r.state.previous_error = e;
    r.state.last_mode = ControlMode::Auto;
    return r;
}

PidResult PidController::compute(double setpoint_C, double measured_C, double dt_s, const ControllerConfig& cfg) {
    PidResult r = computePid(setpoint_C, measured_C, dt_s, cfg, state_);
    if (r.status == PidStatus::Ok) {
        state_ = r.state;
    }
    return r;
}

} // namespace kiln
