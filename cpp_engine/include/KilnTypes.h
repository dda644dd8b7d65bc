#pragma once

#include <cstdint>
#include <optional>

namespace kiln {

// ============================================================
// Shared data model for the kiln control loop.
//
// Units are carried in member names:
//   _C      degrees Celsius
//   _s      seconds
//   _kgph   kilograms per hour
//   _pct    percent of burner firing capacity (control output)
// ============================================================

enum class ControlMode : int {
    Auto   = 0,
    Manual = 1,
};

// Resting states of the driver. Reset is a transition back to Idle, not a state.
enum class RunPhase : int {
    Idle    = 0,
    Running = 1,
    Stopped = 2,
};

struct PidGains {
    double Kp = 1.0;
    double Ki = 0.1;
    double Kd = 0.0;
};

struct OutputBounds {
    double min = 0.0;
    double max = 100.0;
};

struct ControllerConfig {
    double setpoint_C = 1450.0;
    PidGains gains{};
    OutputBounds output_bounds{};
    // Used verbatim (clamped to output_bounds) while mode == Manual.
    double manual_output = 50.0;
    ControlMode mode = ControlMode::Auto;
};

// Controller memory. Persists across ticks within a run.
struct ControllerInternalState {
    double integral = 0.0;
    double previous_error = 0.0;
    // Mode seen by the previous compute; Manual at construction/reset so the
    // first AUTO compute reseeds previous_error.
    ControlMode last_mode = ControlMode::Manual;
};

struct PlantParameters {
    // First-order lag time constant (s).
    double time_constant_s = 600.0;
    double ambient_C = 20.0;
    // Equilibrium rise per percent of firing capacity at full efficiency.
    double process_gain_C_per_pct = 16.0;
    // Fraction of burner heat reaching the bed (see world::heatTransferEfficiency).
    double heat_transfer_efficiency_0_1 = 1.0;
    // Physical envelope. Results outside are clamped and flagged.
    double floor_C = 0.0;
    double ceiling_C = 1800.0;
    double initial_temperature_C = 20.0;
};

struct EmissionsParameters {
    // Pilot flame fuel at zero control output.
    double fuel_base_kgph = 100.0;
    double fuel_per_pct_kgph = 9.0;
    double fuel_max_kgph = 1000.0;
    // kg CO2 per kg coal burned.
    double co2_per_kg_fuel = 3.17;
    // Temperature-weighted term (kg/h per degree above the reference).
    double temperature_coeff_kgph_per_C = 0.05;
    double temperature_ref_C = 800.0;
};

// Per-sample condition bits.
enum SampleFlagBits : std::uint32_t {
    Flag_None                 = 0u,
    Flag_TemperatureSaturated = 1u << 0, // plant result clamped to [floor, ceiling]
    Flag_OutputSaturated      = 1u << 1, // controller output sits on a bound
    Flag_ManualMode           = 1u << 2,
};

struct Sample {
    double t_s = 0.0;
    double temperature_C = 0.0;
    double control_output = 0.0;
    double emission_rate_kgph = 0.0;
    double setpoint_C = 0.0;
    std::uint32_t flags_u32 = Flag_None;
};

struct SimulationState {
    double time_s = 0.0;
    std::uint64_t tick_count = 0;
    double temperature_C = 0.0;
    double control_output = 0.0;
    double emission_rate_kgph = 0.0;
    ControlMode mode = ControlMode::Auto;
    bool running = false;
    RunPhase phase = RunPhase::Idle;
};

enum class TickStatus : int {
    Ok            = 0,
    Saturated     = 1, // sample emitted, temperature clamped
    InvalidConfig = 2, // tick skipped, previous output held
    NotRunning    = 3, // no-op
};

struct TickResult {
    TickStatus status = TickStatus::NotRunning;
    bool has_sample = false;
    Sample sample{};
    // Queued configuration patches rejected while draining commands for this tick.
    int rejected_commands = 0;
};

enum class ConfigError : int {
    None = 0,
    NonFiniteValue,
    NegativeGain,
    InvertedBounds,
    InvalidMode,
    InvalidTimeConstant,
    InvalidEnvelope,
    InvalidEfficiency,
    NegativeCoefficient,
};

struct ConfigStatus {
    ConfigError error = ConfigError::None;
    // Static string naming the offending field; never null.
    const char* field = "";

    bool ok() const noexcept { return error == ConfigError::None; }
};

// Partial configuration update. Unset fields keep their current value.
struct ConfigPatch {
    std::optional<double> setpoint_C;
    std::optional<PidGains> gains;
    std::optional<ControlMode> mode;
    std::optional<double> manual_output;
    std::optional<OutputBounds> output_bounds;
};

// Latched diagnostics (read-and-clear via KilnSimulator::getLatestEvents()).
enum KilnEventBits : std::uint32_t {
    Event_None                = 0u,
    Event_Started             = 1u << 0,
    Event_Stopped             = 1u << 1,
    Event_Reset               = 1u << 2,
    Event_ModeChanged         = 1u << 3,
    Event_ConfigApplied       = 1u << 4,
    // Warnings
    Warn_ConfigRejected       = 1u << 16,
    Warn_InvalidTick          = 1u << 17,
    Warn_TemperatureSaturated = 1u << 18,
    Warn_OutputSaturated      = 1u << 19,
    Warn_TickWhileNotRunning  = 1u << 20,
};

const char* toString(ControlMode m);
const char* toString(RunPhase p);
const char* toString(TickStatus s);
const char* toString(ConfigError e);

ControllerConfig defaultControllerConfig();
PlantParameters defaultPlantParameters();
EmissionsParameters defaultEmissionsParameters();

} // namespace kiln
