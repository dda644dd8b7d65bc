#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <limits>
#include <string>
#include <vector>

#include "EmissionsModel.h"
#include "KilnMetrics.h"
#include "KilnSimulator.h"
#include "PidController.h"
#include "PlantModel.h"
#include "SensitivityAnalysis.h"
#include "../world/kiln_shell.h"

namespace {

// Always-on requirement: never compiled out in Release.
#define REQUIRE(cond, msg)                                                      \
    do {                                                                        \
        if (!(cond)) {                                                          \
            std::cerr << "[FAIL] " << __FILE__ << ":" << __LINE__ << " " << msg \
                      << "\n";                                                  \
            std::exit(1);                                                       \
        }                                                                       \
    } while (0)

static inline void REQUIRE_FINITE(double x, const char* name) {
    if (!std::isfinite(x)) {
        std::cerr << "[FAIL] Non-finite: " << name << " = " << x << "\n";
        std::exit(1);
    }
}

static inline double absd(double x) { return x < 0 ? -x : x; }

static void requireNear(const char* label, double a, double b, double tol) {
    REQUIRE_FINITE(a, label);
    REQUIRE_FINITE(b, label);
    if (!(absd(a - b) <= tol)) {
        std::cerr << "[FAIL] " << label << ": a=" << a << " b=" << b
                  << " diff=" << absd(a - b) << " (tol=" << tol << ")\n";
        std::exit(1);
    }
}

static void requireExact(const char* label, double a, double b) {
    if (!(a == b)) {
        std::cerr << "[FAIL] " << label << " changed unexpectedly: a=" << a << " b=" << b << "\n";
        std::exit(1);
    }
}

static void requireSampleExact(const char* context, const kiln::Sample& a, const kiln::Sample& b) {
    std::string prefix = std::string(context) + ": ";
    requireExact((prefix + "t_s").c_str(), a.t_s, b.t_s);
    requireExact((prefix + "temperature_C").c_str(), a.temperature_C, b.temperature_C);
    requireExact((prefix + "control_output").c_str(), a.control_output, b.control_output);
    requireExact((prefix + "emission_rate_kgph").c_str(), a.emission_rate_kgph, b.emission_rate_kgph);
    requireExact((prefix + "setpoint_C").c_str(), a.setpoint_C, b.setpoint_C);
    REQUIRE(a.flags_u32 == b.flags_u32, prefix + "flags_u32 changed");
}

static void requireStateExact(const char* context, const kiln::SimulationState& a, const kiln::SimulationState& b) {
    std::string prefix = std::string(context) + ": ";
    requireExact((prefix + "time_s").c_str(), a.time_s, b.time_s);
    requireExact((prefix + "temperature_C").c_str(), a.temperature_C, b.temperature_C);
    requireExact((prefix + "control_output").c_str(), a.control_output, b.control_output);
    requireExact((prefix + "emission_rate_kgph").c_str(), a.emission_rate_kgph, b.emission_rate_kgph);
    REQUIRE(a.tick_count == b.tick_count, prefix + "tick_count changed");
    REQUIRE(a.mode == b.mode, prefix + "mode changed");
    REQUIRE(a.running == b.running, prefix + "running changed");
    REQUIRE(a.phase == b.phase, prefix + "phase changed");
}

static void requireSampleSane(const kiln::Sample& s,
                              const kiln::ControllerConfig& cfg,
                              const kiln::PlantParameters& plant) {
    REQUIRE_FINITE(s.t_s, "t_s");
    REQUIRE_FINITE(s.temperature_C, "temperature_C");
    REQUIRE_FINITE(s.control_output, "control_output");
    REQUIRE_FINITE(s.emission_rate_kgph, "emission_rate_kgph");

    REQUIRE(s.control_output >= cfg.output_bounds.min, "control_output below min bound");
    REQUIRE(s.control_output <= cfg.output_bounds.max, "control_output above max bound");
    REQUIRE(s.temperature_C >= plant.floor_C, "temperature below floor");
    REQUIRE(s.temperature_C <= plant.ceiling_C, "temperature above ceiling");
    REQUIRE(s.emission_rate_kgph >= 0.0, "emission rate < 0");
}

// Fixed dt schedule with a setpoint step and a mode excursion, used by the replay tests.
static void driveScripted(kiln::KilnSimulator& sim, std::vector<kiln::Sample>& out) {
    const double dts[] = {1.0, 0.5, 2.0, 1.0, 0.25, 5.0, 1.0};
    const int n_dts = static_cast<int>(sizeof(dts) / sizeof(dts[0]));

    sim.start();
    for (int i = 0; i < 400; ++i) {
        if (i == 120) {
            kiln::ConfigPatch p;
            p.mode = kiln::ControlMode::Manual;
            p.manual_output = 35.0;
            sim.post(kiln::Command::setConfig(p));
        }
        if (i == 180) {
            kiln::ConfigPatch p;
            p.mode = kiln::ControlMode::Auto;
            p.setpoint_C = 1300.0;
            sim.post(kiln::Command::setConfig(p));
        }
        const kiln::TickResult r = sim.tick(dts[i % n_dts]);
        REQUIRE(r.has_sample, "scripted run: tick produced no sample");
        out.push_back(r.sample);
    }
}

// --------------------
// 1: Determinism & replay
// --------------------

static void runDeterministicReplay_1A() {
    kiln::KilnSimulator a;
    kiln::KilnSimulator b;
    std::vector<kiln::Sample> sa;
    std::vector<kiln::Sample> sb;

    driveScripted(a, sa);
    driveScripted(b, sb);

    REQUIRE(sa.size() == sb.size(), "1A: sample counts differ");
    for (std::size_t i = 0; i < sa.size(); ++i) {
        requireSampleExact("1A replay", sa[i], sb[i]);
    }

    const kiln::RunSignatures ga = a.getRunSignatures();
    const kiln::RunSignatures gb = b.getRunSignatures();
    REQUIRE(ga.config_hash_u32 == gb.config_hash_u32, "1A: config hash differs");
    REQUIRE(ga.history_crc_u32 == gb.history_crc_u32, "1A: history CRC differs");
    REQUIRE(ga.samples_emitted_u64 == sa.size(), "1A: samples_emitted mismatch");
    REQUIRE(ga.history_crc_u32 != 0u, "1A: history CRC never updated");
}

static void runResetReplayMatchesFresh_1B() {
    kiln::KilnSimulator fresh;
    std::vector<kiln::Sample> s_fresh;
    driveScripted(fresh, s_fresh);

    kiln::KilnSimulator reused;
    std::vector<kiln::Sample> s_first;
    driveScripted(reused, s_first);

    // Scripted config changes stay in place across reset; restore defaults.
    reused.reset(true);
    std::vector<kiln::Sample> s_second;
    driveScripted(reused, s_second);

    REQUIRE(s_fresh.size() == s_second.size(), "1B: sample counts differ");
    for (std::size_t i = 0; i < s_fresh.size(); ++i) {
        requireSampleExact("1B reset replay", s_fresh[i], s_second[i]);
    }
    REQUIRE(fresh.getRunSignatures().history_crc_u32 == reused.getRunSignatures().history_crc_u32,
            "1B: CRC after reset differs from fresh instance");
}

// --------------------
// 2: Controller
// --------------------

static void runAntiWindup_2A() {
    kiln::KilnSimulator sim;
    const kiln::ControllerConfig cfg = sim.config();
    REQUIRE(cfg.gains.Ki > 0.0, "2A: test requires Ki > 0");

    sim.start();
    for (int i = 0; i < 120; ++i) {
        const kiln::TickResult r = sim.tick(1.0);
        REQUIRE(r.has_sample, "2A: missing sample");
        requireExact("2A saturated output", r.sample.control_output, cfg.output_bounds.max);
        REQUIRE((r.sample.flags_u32 & kiln::Flag_OutputSaturated) != 0u, "2A: saturation flag missing");

        const kiln::ControllerInternalState st = sim.controllerState();
        REQUIRE(cfg.gains.Ki * st.integral <= cfg.output_bounds.max,
                "2A: integral contribution exceeds the value that holds output at max");
    }

    // Clear the error: step the setpoint below the current temperature.
    const double T = sim.currentState().temperature_C;
    kiln::ConfigPatch p;
    p.setpoint_C = T - 50.0;
    REQUIRE(sim.setConfig(p).ok(), "2A: setpoint step rejected");

    bool desaturated = false;
    for (int i = 0; i < 3 && !desaturated; ++i) {
        const kiln::TickResult r = sim.tick(1.0);
        REQUIRE(r.has_sample, "2A: missing sample after step");
        desaturated = r.sample.control_output < cfg.output_bounds.max;
    }
    REQUIRE(desaturated, "2A: output stayed at max after the error cleared");
}

static void runModeSwitchContinuity_2B() {
    const kiln::PidGains gains{0.5, 0.01, 20.0};
    const double dt = 1.0;

    // First AUTO output depends only on the new error, not on the MANUAL output.
    const double offsets_C[] = {10.0, 150.0};
    for (double offset : offsets_C) {
        kiln::KilnSimulator sim;
        sim.start();
        for (int i = 0; i < 30; ++i) (void)sim.tick(dt);

        kiln::ConfigPatch manual;
        manual.mode = kiln::ControlMode::Manual;
        manual.manual_output = 50.0;
        REQUIRE(sim.setConfig(manual).ok(), "2B: manual patch rejected");
        for (int i = 0; i < 60; ++i) {
            const kiln::TickResult r = sim.tick(dt);
            requireExact("2B manual output", r.sample.control_output, 50.0);
            REQUIRE((r.sample.flags_u32 & kiln::Flag_ManualMode) != 0u, "2B: manual flag missing");
        }

        const double T = sim.currentState().temperature_C;
        const double setpoint = T + offset;
        const double e = setpoint - T;

        kiln::ConfigPatch back;
        back.mode = kiln::ControlMode::Auto;
        back.gains = gains;
        back.setpoint_C = setpoint;
        sim.post(kiln::Command::setConfig(back));

        const kiln::TickResult r = sim.tick(dt);
        REQUIRE(r.has_sample, "2B: missing sample after switch");
        REQUIRE((r.sample.flags_u32 & kiln::Flag_ManualMode) == 0u, "2B: still flagged manual");
        requireNear("2B first AUTO output", r.sample.control_output, gains.Kp * e + gains.Ki * e * dt, 1e-9);

        const kiln::ControllerInternalState st = sim.controllerState();
        requireNear("2B integral restarted", st.integral, e * dt, 1e-9);
        requireNear("2B previous_error reseeded", st.previous_error, e, 1e-9);
    }

    // Stale MANUAL-era memory contributes no derivative kick and no old integral.
    kiln::ControllerConfig cfg;
    cfg.gains = gains;
    cfg.mode = kiln::ControlMode::Auto;
    kiln::ControllerInternalState stale;
    stale.integral = 4000.0;
    stale.previous_error = -500.0;
    stale.last_mode = kiln::ControlMode::Manual;

    const kiln::PidResult pr = kiln::computePid(1000.0, 990.0, 2.0, cfg, stale);
    REQUIRE(pr.status == kiln::PidStatus::Ok, "2B: compute rejected");
    requireExact("2B d_term", pr.d_term, 0.0);
    requireNear("2B p_term", pr.p_term, 0.5 * 10.0, 1e-12);
    requireNear("2B i_term", pr.i_term, 0.01 * 10.0 * 2.0, 1e-12);
    requireNear("2B output", pr.output, 5.0 + 0.2, 1e-12);
}

static void runManualFreezesMemory_2C() {
    kiln::ControllerConfig cfg;
    cfg.gains = kiln::PidGains{0.2, 0.05, 1.0};
    cfg.setpoint_C = 900.0;

    kiln::PidController pid;
    for (int i = 0; i < 5; ++i) {
        const kiln::PidResult r = pid.compute(cfg.setpoint_C, 880.0, 1.0, cfg);
        REQUIRE(r.status == kiln::PidStatus::Ok, "2C: auto compute failed");
    }
    const kiln::ControllerInternalState before = pid.state();
    REQUIRE(before.integral != 0.0, "2C: integral never accumulated");

    cfg.mode = kiln::ControlMode::Manual;
    cfg.manual_output = 250.0; // beyond bounds, clamps to 100
    const kiln::PidResult m = pid.compute(cfg.setpoint_C, 100.0, 1.0, cfg);
    REQUIRE(m.status == kiln::PidStatus::Ok, "2C: manual compute failed");
    requireExact("2C manual clamp", m.output, 100.0);
    REQUIRE(m.output_saturated, "2C: clamped manual output not flagged");
    requireExact("2C integral frozen", pid.state().integral, before.integral);
    requireExact("2C previous_error frozen", pid.state().previous_error, before.previous_error);
    REQUIRE(pid.state().last_mode == kiln::ControlMode::Manual, "2C: last_mode not recorded");
}

static void runPidInvalidInputs_2D() {
    kiln::ControllerConfig cfg;
    kiln::ControllerInternalState st;
    st.integral = 3.0;
    st.previous_error = 7.0;
    st.last_mode = kiln::ControlMode::Auto;

    const double bad_dts[] = {0.0, -1.0, std::numeric_limits<double>::quiet_NaN(),
                              std::numeric_limits<double>::infinity()};
    for (double dt : bad_dts) {
        const kiln::PidResult r = kiln::computePid(1450.0, 20.0, dt, cfg, st);
        REQUIRE(r.status == kiln::PidStatus::InvalidConfig, "2D: bad dt accepted");
        requireExact("2D state integral", r.state.integral, st.integral);
        requireExact("2D state previous_error", r.state.previous_error, st.previous_error);
    }

    const kiln::PidResult nan_meas = kiln::computePid(1450.0, std::nan(""), 1.0, cfg, st);
    REQUIRE(nan_meas.status == kiln::PidStatus::InvalidConfig, "2D: NaN measurement accepted");

    kiln::ControllerConfig inverted = cfg;
    inverted.output_bounds = kiln::OutputBounds{80.0, 20.0};
    REQUIRE(kiln::computePid(1450.0, 20.0, 1.0, inverted, st).status == kiln::PidStatus::InvalidConfig,
            "2D: inverted bounds accepted");

    kiln::ControllerConfig negative = cfg;
    negative.gains.Kd = -0.1;
    REQUIRE(kiln::computePid(1450.0, 20.0, 1.0, negative, st).status == kiln::PidStatus::InvalidConfig,
            "2D: negative gain accepted");

    // The wrapper must not commit state on failure.
    kiln::PidController pid;
    (void)pid.compute(1450.0, 1400.0, 1.0, cfg);
    const kiln::ControllerInternalState before = pid.state();
    (void)pid.compute(1450.0, 1400.0, 0.0, cfg);
    requireExact("2D wrapper integral", pid.state().integral, before.integral);
    requireExact("2D wrapper previous_error", pid.state().previous_error, before.previous_error);
}

// --------------------
// 3: Plant & emissions
// --------------------

static void runFirstTickScenario_3A() {
    kiln::KilnSimulator sim;
    const kiln::PlantParameters plant = sim.plantParameters();
    requireExact("3A initial temperature", sim.currentState().temperature_C, 20.0);

    sim.start();
    const kiln::TickResult r = sim.tick(1.0);
    REQUIRE(r.status == kiln::TickStatus::Ok, "3A: first tick not OK");
    REQUIRE(r.has_sample, "3A: first tick produced no sample");
    requireExact("3A output", r.sample.control_output, 100.0);
    REQUIRE(r.sample.temperature_C > 20.0, "3A: temperature did not rise");
    REQUIRE(r.sample.temperature_C < 1450.0, "3A: single tick reached setpoint");
    requireExact("3A t_s", r.sample.t_s, 1.0);

    const double expected_T = 20.0 + (kiln::plantEquilibrium(100.0, plant) - 20.0) / plant.time_constant_s;
    requireNear("3A temperature", r.sample.temperature_C, expected_T, 1e-9);

    // Fuel at full firing hits the 1000 kg/h cap; temperature is below the reference.
    requireNear("3A emissions", r.sample.emission_rate_kgph, 3.17 * 1000.0, 1e-9);
    requireExact("3A setpoint echo", r.sample.setpoint_C, 1450.0);
}

static void runManualMonotoneConvergence_3B() {
    kiln::KilnSimulator sim;
    kiln::ConfigPatch p;
    p.mode = kiln::ControlMode::Manual;
    p.manual_output = 50.0;
    REQUIRE(sim.setConfig(p).ok(), "3B: manual patch rejected");

    const double eq = kiln::plantEquilibrium(50.0, sim.plantParameters());
    sim.start();

    double prev = sim.currentState().temperature_C;
    for (int i = 0; i < 6000; ++i) {
        const kiln::TickResult r = sim.tick(1.0);
        REQUIRE(r.has_sample, "3B: missing sample");
        requireExact("3B manual output", r.sample.control_output, 50.0);
        REQUIRE(r.sample.temperature_C >= prev, "3B: temperature not monotone");
        REQUIRE(r.sample.temperature_C <= eq, "3B: temperature overshot equilibrium");
        prev = r.sample.temperature_C;
    }
    requireNear("3B converged", prev, eq, 0.5);
}

static void runPlantCoarseDtAndEnvelope_3C() {
    kiln::PlantParameters p;

    // dt beyond tau lands on the equilibrium.
    const kiln::PlantStep coarse = kiln::advancePlant(20.0, 30.0, 10.0 * p.time_constant_s, p);
    requireNear("3C coarse dt", coarse.temperature_C, kiln::plantEquilibrium(30.0, p), 1e-9);
    REQUIRE(!coarse.saturated, "3C: coarse step flagged saturated");

    const kiln::PlantStep held = kiln::advancePlant(500.0, 50.0, 0.0, p);
    requireExact("3C dt=0 holds", held.temperature_C, 500.0);

    // Cooling with zero heat toward ambient never crosses below it.
    const kiln::PlantStep cool = kiln::advancePlant(1000.0, 0.0, 60.0, p);
    REQUIRE(cool.temperature_C < 1000.0 && cool.temperature_C > p.ambient_C, "3C: cooling step out of range");

    kiln::PlantParameters bad = p;
    bad.time_constant_s = 0.0;
    REQUIRE(kiln::validatePlantParameters(bad).error == kiln::ConfigError::InvalidTimeConstant,
            "3C: tau=0 accepted");
    bad = p;
    bad.floor_C = 2000.0;
    REQUIRE(kiln::validatePlantParameters(bad).error == kiln::ConfigError::InvalidEnvelope,
            "3C: floor > ceiling accepted");
    bad = p;
    bad.heat_transfer_efficiency_0_1 = 1.5;
    REQUIRE(kiln::validatePlantParameters(bad).error == kiln::ConfigError::InvalidEfficiency,
            "3C: efficiency > 1 accepted");
}

static void runTemperatureSaturation_3D() {
    kiln::PlantParameters plant;
    plant.ceiling_C = 500.0;
    kiln::KilnSimulator sim(plant);
    sim.start();
    (void)sim.getLatestEvents();

    bool saturated = false;
    for (int i = 0; i < 6000 && !saturated; ++i) {
        const kiln::TickResult r = sim.tick(1.0);
        REQUIRE(r.has_sample, "3D: missing sample");
        REQUIRE(r.sample.temperature_C <= 500.0, "3D: ceiling exceeded");
        if (r.status == kiln::TickStatus::Saturated) {
            saturated = true;
            requireExact("3D clamped temperature", r.sample.temperature_C, 500.0);
            REQUIRE((r.sample.flags_u32 & kiln::Flag_TemperatureSaturated) != 0u, "3D: saturation flag missing");
        }
    }
    REQUIRE(saturated, "3D: never saturated against a 500 C ceiling");
    REQUIRE((sim.getLatestEvents() & kiln::Warn_TemperatureSaturated) != 0u, "3D: saturation warning not latched");

    // Saturation is recoverable: the run continues.
    const kiln::TickResult next = sim.tick(1.0);
    REQUIRE(next.has_sample, "3D: run did not continue after saturation");
    REQUIRE(sim.currentState().phase == kiln::RunPhase::Running, "3D: saturation stopped the run");
}

static void runEmissionsMonotone_3E() {
    const kiln::EmissionsParameters p;
    for (double T = 0.0; T <= 1800.0; T += 150.0) {
        double prev = -1.0;
        for (double u = 0.0; u <= 100.0; u += 5.0) {
            const double e = kiln::estimateEmissions(u, T, p);
            REQUIRE_FINITE(e, "emission");
            REQUIRE(e >= 0.0, "3E: negative emission");
            REQUIRE(e >= prev, "3E: emission decreased with output");
            prev = e;
        }
    }
    for (double u = 0.0; u <= 100.0; u += 25.0) {
        double prev = -1.0;
        for (double T = 0.0; T <= 1800.0; T += 50.0) {
            const double e = kiln::estimateEmissions(u, T, p);
            REQUIRE(e >= prev, "3E: emission decreased with temperature");
            prev = e;
        }
    }
    requireExact("3E NaN input", kiln::estimateEmissions(std::nan(""), 1000.0, p), 0.0);
    requireExact("3E fuel cap", kiln::fuelRateKgph(500.0, p), p.fuel_max_kgph);
    requireExact("3E pilot fuel", kiln::fuelRateKgph(0.0, p), p.fuel_base_kgph);
}

// --------------------
// 4: Lifecycle & commands
// --------------------

static void runTickWhileNotRunning_4A() {
    kiln::KilnSimulator sim;

    // Idle
    const kiln::SimulationState idle = sim.currentState();
    const kiln::TickResult r0 = sim.tick(1.0);
    REQUIRE(r0.status == kiln::TickStatus::NotRunning, "4A: tick in Idle not a no-op");
    REQUIRE(!r0.has_sample, "4A: Idle tick produced a sample");
    requireStateExact("4A idle", idle, sim.currentState());

    sim.start();
    for (int i = 0; i < 10; ++i) (void)sim.tick(1.0);
    sim.stop();
    REQUIRE(sim.currentState().phase == kiln::RunPhase::Stopped, "4A: stop did not stop");

    const kiln::SimulationState before = sim.currentState();
    const std::size_t hist_before = sim.history().size();
    const kiln::RunSignatures sig_before = sim.getRunSignatures();
    (void)sim.getLatestEvents();

    for (int i = 0; i < 5; ++i) {
        const kiln::TickResult r = sim.tick(1.0);
        REQUIRE(r.status == kiln::TickStatus::NotRunning, "4A: tick while stopped not a no-op");
        REQUIRE(!r.has_sample, "4A: stopped tick produced a sample");
    }
    requireStateExact("4A stopped", before, sim.currentState());
    REQUIRE(sim.history().size() == hist_before, "4A: history grew while stopped");

    // Config edits are legal while stopped but leave the state frozen.
    kiln::ConfigPatch to_manual;
    to_manual.mode = kiln::ControlMode::Manual;
    REQUIRE(sim.setConfig(to_manual).ok(), "4A: edit while stopped rejected");
    REQUIRE(sim.config().mode == kiln::ControlMode::Manual, "4A: edit while stopped not stored");
    requireStateExact("4A stopped after edit", before, sim.currentState());
    kiln::ConfigPatch to_auto;
    to_auto.mode = kiln::ControlMode::Auto;
    REQUIRE(sim.setConfig(to_auto).ok(), "4A: second edit while stopped rejected");
    requireStateExact("4A stopped after second edit", before, sim.currentState());
    REQUIRE(sim.getRunSignatures().history_crc_u32 == sig_before.history_crc_u32, "4A: CRC changed while stopped");
    REQUIRE((sim.getLatestEvents() & kiln::Warn_TickWhileNotRunning) != 0u, "4A: no-op warning not latched");
    REQUIRE(std::strcmp(kiln::toString(kiln::TickStatus::NotRunning), "NO_OP_NOT_RUNNING") == 0,
            "4A: status string");

    // Resume continues from the frozen state.
    sim.start();
    const kiln::TickResult resumed = sim.tick(1.0);
    REQUIRE(resumed.has_sample, "4A: resume produced no sample");
    requireExact("4A resumed t_s", resumed.sample.t_s, before.time_s + 1.0);
}

static void runInvalidDtSkipsTick_4B() {
    kiln::KilnSimulator sim;
    sim.start();
    for (int i = 0; i < 5; ++i) (void)sim.tick(1.0);

    const kiln::SimulationState before = sim.currentState();
    const kiln::ControllerInternalState pid_before = sim.controllerState();
    (void)sim.getLatestEvents();

    const double bad_dts[] = {0.0, -1.0, std::numeric_limits<double>::quiet_NaN()};
    for (double dt : bad_dts) {
        const kiln::TickResult r = sim.tick(dt);
        REQUIRE(r.status == kiln::TickStatus::InvalidConfig, "4B: bad dt not reported");
        REQUIRE(!r.has_sample, "4B: bad dt produced a sample");
    }
    requireStateExact("4B state", before, sim.currentState());
    requireExact("4B integral", sim.controllerState().integral, pid_before.integral);
    REQUIRE((sim.getLatestEvents() & kiln::Warn_InvalidTick) != 0u, "4B: invalid tick warning not latched");
    REQUIRE(sim.currentState().phase == kiln::RunPhase::Running, "4B: bad dt stopped the run");

    const kiln::TickResult ok = sim.tick(1.0);
    REQUIRE(ok.has_sample, "4B: valid dt after bad dt did not advance");
    requireExact("4B t_s", ok.sample.t_s, before.time_s + 1.0);
}

static void runResetIdempotence_4C() {
    kiln::KilnSimulator sim;
    sim.start();
    for (int i = 0; i < 50; ++i) (void)sim.tick(1.0);

    sim.reset();
    const kiln::SimulationState once = sim.currentState();
    const kiln::ControllerInternalState pid_once = sim.controllerState();
    const kiln::RunSignatures sig_once = sim.getRunSignatures();
    REQUIRE(sim.history().empty(), "4C: history not empty after reset");

    sim.reset();
    requireStateExact("4C reset twice", once, sim.currentState());
    requireExact("4C integral", sim.controllerState().integral, pid_once.integral);
    requireExact("4C previous_error", sim.controllerState().previous_error, pid_once.previous_error);
    REQUIRE(sim.history().empty(), "4C: history not empty after second reset");
    REQUIRE(sim.getRunSignatures().config_hash_u32 == sig_once.config_hash_u32, "4C: config hash changed");
    REQUIRE(sim.getRunSignatures().samples_emitted_u64 == 0u, "4C: samples_emitted not cleared");

    REQUIRE(once.phase == kiln::RunPhase::Idle, "4C: reset did not return to Idle");
    requireExact("4C temperature", once.temperature_C, sim.plantParameters().initial_temperature_C);
    requireExact("4C time", once.time_s, 0.0);
}

static void runResetKeepsOrRestoresConfig_4D() {
    kiln::KilnSimulator sim;
    kiln::ConfigPatch p;
    p.setpoint_C = 1300.0;
    REQUIRE(sim.setConfig(p).ok(), "4D: patch rejected");

    sim.reset();
    requireExact("4D kept setpoint", sim.config().setpoint_C, 1300.0);

    sim.post(kiln::Command{kiln::Command::Kind::ResetWithDefaults, {}});
    (void)sim.applyPendingCommands();
    requireExact("4D default setpoint", sim.config().setpoint_C, kiln::defaultControllerConfig().setpoint_C);

    kiln::PlantParameters hot;
    hot.initial_temperature_C = 900.0;
    REQUIRE(sim.resetToPlant(hot).ok(), "4D: resetToPlant rejected valid parameters");
    requireExact("4D resetToPlant temperature", sim.currentState().temperature_C, 900.0);

    kiln::PlantParameters bad = hot;
    bad.time_constant_s = -5.0;
    REQUIRE(!sim.resetToPlant(bad).ok(), "4D: resetToPlant accepted tau < 0");
    requireExact("4D plant untouched", sim.plantParameters().time_constant_s, hot.time_constant_s);
}

static void runConfigValidation_4E() {
    kiln::KilnSimulator sim;
    const kiln::ControllerConfig before = sim.config();
    (void)sim.getLatestEvents();

    kiln::ConfigPatch neg;
    neg.gains = kiln::PidGains{-1.0, 0.1, 0.0};
    const kiln::ConfigStatus s1 = sim.setConfig(neg);
    REQUIRE(s1.error == kiln::ConfigError::NegativeGain, "4E: negative Kp accepted");
    REQUIRE(std::strcmp(s1.field, "Kp") == 0, "4E: wrong field for negative Kp");

    kiln::ConfigPatch inv;
    inv.output_bounds = kiln::OutputBounds{60.0, 40.0};
    REQUIRE(sim.setConfig(inv).error == kiln::ConfigError::InvertedBounds, "4E: inverted bounds accepted");

    kiln::ConfigPatch nan_sp;
    nan_sp.setpoint_C = std::nan("");
    REQUIRE(sim.setConfig(nan_sp).error == kiln::ConfigError::NonFiniteValue, "4E: NaN setpoint accepted");

    // Mixed patch: one bad field rejects the whole patch.
    kiln::ConfigPatch mixed;
    mixed.setpoint_C = 1200.0;
    mixed.gains = kiln::PidGains{1.0, -0.5, 0.0};
    REQUIRE(!sim.setConfig(mixed).ok(), "4E: mixed patch accepted");

    const kiln::ControllerConfig after = sim.config();
    requireExact("4E setpoint kept", after.setpoint_C, before.setpoint_C);
    requireExact("4E Kp kept", after.gains.Kp, before.gains.Kp);
    requireExact("4E Ki kept", after.gains.Ki, before.gains.Ki);
    requireExact("4E min kept", after.output_bounds.min, before.output_bounds.min);
    REQUIRE((sim.getLatestEvents() & kiln::Warn_ConfigRejected) != 0u, "4E: rejection not latched");

    // Partial patch touches only its own field.
    kiln::ConfigPatch partial;
    partial.setpoint_C = 1380.0;
    REQUIRE(sim.setConfig(partial).ok(), "4E: partial patch rejected");
    requireExact("4E setpoint applied", sim.config().setpoint_C, 1380.0);
    requireExact("4E Kp untouched", sim.config().gains.Kp, before.gains.Kp);
    REQUIRE(sim.config().mode == before.mode, "4E: mode changed by partial patch");

    // Equal bounds are legal.
    kiln::ConfigPatch pinned;
    pinned.output_bounds = kiln::OutputBounds{40.0, 40.0};
    REQUIRE(sim.setConfig(pinned).ok(), "4E: min == max rejected");
    sim.start();
    const kiln::TickResult r = sim.tick(1.0);
    requireExact("4E pinned output", r.sample.control_output, 40.0);

    // Invalid plant at construction falls back to defaults.
    kiln::PlantParameters bad_plant;
    bad_plant.ceiling_C = -1.0;
    kiln::KilnSimulator fallback(bad_plant);
    requireExact("4E fallback ceiling", fallback.plantParameters().ceiling_C, kiln::defaultPlantParameters().ceiling_C);
    REQUIRE((fallback.getLatestEvents() & kiln::Warn_ConfigRejected) != 0u, "4E: fallback not reported");

    // Negative emissions coefficients would break monotonicity: same fallback.
    kiln::EmissionsParameters bad_em;
    bad_em.fuel_per_pct_kgph = -9.0;
    const kiln::ConfigStatus es = kiln::validateEmissionsParameters(bad_em);
    REQUIRE(es.error == kiln::ConfigError::NegativeCoefficient, "4E: negative fuel slope accepted");
    REQUIRE(std::strcmp(es.field, "fuel_per_pct_kgph") == 0, "4E: wrong field for fuel slope");
    kiln::EmissionsParameters nan_em;
    nan_em.co2_per_kg_fuel = std::nan("");
    REQUIRE(kiln::validateEmissionsParameters(nan_em).error == kiln::ConfigError::NonFiniteValue,
            "4E: NaN CO2 factor accepted");
    REQUIRE(kiln::validateEmissionsParameters(kiln::defaultEmissionsParameters()).ok(), "4E: defaults rejected");

    kiln::KilnSimulator em_fallback(kiln::defaultPlantParameters(), bad_em);
    requireExact("4E emissions fallback slope", em_fallback.emissionsParameters().fuel_per_pct_kgph,
                 kiln::defaultEmissionsParameters().fuel_per_pct_kgph);
    REQUIRE((em_fallback.getLatestEvents() & kiln::Warn_ConfigRejected) != 0u, "4E: emissions fallback not reported");

    kiln::KilnSimulator clean;
    REQUIRE((clean.getLatestEvents() & kiln::Warn_ConfigRejected) == 0u, "4E: default construction reported a rejection");
}

static void runCommandQueueOrdering_4F() {
    kiln::KilnSimulator sim;

    kiln::ConfigPatch a;
    a.setpoint_C = 1000.0;
    kiln::ConfigPatch b;
    b.setpoint_C = 1100.0;
    sim.post(kiln::Command::setConfig(a));
    sim.post(kiln::Command::setConfig(b));
    sim.post(kiln::Command::start());

    REQUIRE(sim.pendingCommandCount() == 3u, "4F: commands not queued");
    requireExact("4F not applied before tick", sim.config().setpoint_C, 1450.0);
    REQUIRE(sim.currentState().phase == kiln::RunPhase::Idle, "4F: start applied before tick");

    const kiln::TickResult r = sim.tick(1.0);
    REQUIRE(sim.pendingCommandCount() == 0u, "4F: queue not drained");
    REQUIRE(r.has_sample, "4F: queued start did not take effect before stepping");
    requireExact("4F last patch wins", sim.config().setpoint_C, 1100.0);
    requireExact("4F sample setpoint", r.sample.setpoint_C, 1100.0);

    sim.post(kiln::Command::stop());
    sim.post(kiln::Command::start());
    (void)sim.applyPendingCommands();
    REQUIRE(sim.currentState().phase == kiln::RunPhase::Running, "4F: stop+start not applied in order");

    sim.post(kiln::Command::start());
    sim.post(kiln::Command::stop());
    (void)sim.applyPendingCommands();
    REQUIRE(sim.currentState().phase == kiln::RunPhase::Stopped, "4F: start+stop not applied in order");

    kiln::ConfigPatch bad;
    bad.gains = kiln::PidGains{0.0, -1.0, 0.0};
    sim.post(kiln::Command::setConfig(bad));
    sim.post(kiln::Command::setConfig(bad));
    sim.post(kiln::Command::start());
    const kiln::TickResult r2 = sim.tick(1.0);
    REQUIRE(r2.rejected_commands == 2, "4F: rejected patches not counted");
    REQUIRE(r2.has_sample, "4F: start after rejected patches ignored");

    sim.post(kiln::Command::reset());
    const kiln::TickResult r3 = sim.tick(1.0);
    REQUIRE(r3.status == kiln::TickStatus::NotRunning, "4F: tick after queued reset not a no-op");
    REQUIRE(sim.history().empty(), "4F: queued reset kept history");
}

static void runEventLatching_4G() {
    kiln::KilnSimulator sim;
    REQUIRE(sim.getLatestEvents() == 0u, "4G: fresh instance has events");

    sim.start();
    sim.start(); // idempotent
    std::uint32_t ev = sim.getLatestEvents();
    REQUIRE((ev & kiln::Event_Started) != 0u, "4G: start not latched");
    REQUIRE(sim.getLatestEvents() == 0u, "4G: events not cleared on read");

    kiln::ConfigPatch m;
    m.mode = kiln::ControlMode::Manual;
    REQUIRE(sim.setConfig(m).ok(), "4G: manual patch rejected");
    ev = sim.getLatestEvents();
    REQUIRE((ev & kiln::Event_ModeChanged) != 0u, "4G: mode change not latched");
    REQUIRE((ev & kiln::Event_ConfigApplied) != 0u, "4G: config apply not latched");

    sim.stop();
    sim.reset();
    ev = sim.getLatestEvents();
    REQUIRE((ev & kiln::Event_Stopped) != 0u, "4G: stop not latched");
    REQUIRE((ev & kiln::Event_Reset) != 0u, "4G: reset not latched");
}

// --------------------
// 5: Observation surface
// --------------------

static void runHistoryRingBuffer_5A() {
    kiln::KilnSimulator sim(kiln::PlantParameters{}, kiln::EmissionsParameters{}, 8);
    REQUIRE(sim.historyCapacity() == 8, "5A: capacity not applied");
    sim.start();
    for (int i = 0; i < 20; ++i) (void)sim.tick(1.0);

    const std::vector<kiln::Sample> h = sim.history();
    REQUIRE(h.size() == 8u, "5A: history not bounded");
    requireExact("5A oldest", h.front().t_s, 13.0);
    requireExact("5A newest", h.back().t_s, 20.0);
    for (std::size_t i = 1; i < h.size(); ++i) {
        REQUIRE(h[i].t_s > h[i - 1].t_s, "5A: history not ordered oldest to newest");
    }

    kiln::Sample buf[3];
    const int n = sim.getHistory(buf, 3);
    REQUIRE(n == 3, "5A: bulk read count");
    requireExact("5A bulk oldest", buf[0].t_s, 13.0);
    requireExact("5A bulk third", buf[2].t_s, 15.0);
    REQUIRE(sim.getHistory(nullptr, 3) == 0, "5A: null buffer accepted");

    REQUIRE(sim.getRunSignatures().samples_emitted_u64 == 20u, "5A: eviction changed emitted count");

    kiln::KilnSimulator zero(kiln::PlantParameters{}, kiln::EmissionsParameters{}, 0);
    REQUIRE(zero.historyCapacity() >= 1, "5A: zero capacity not sanitized");
}

static void runBoundsInvariantSoak_5B() {
    const kiln::PidGains gain_sets[] = {
        {1.0, 0.1, 0.0},
        {50.0, 5.0, 200.0},
        {0.01, 0.0, 0.0},
        {3.0, 0.5, 30.0},
    };
    const double dts[] = {0.1, 1.0, 30.0, 900.0};

    for (const kiln::PidGains& g : gain_sets) {
        for (double dt : dts) {
            kiln::KilnSimulator sim;
            kiln::ConfigPatch p;
            p.gains = g;
            p.output_bounds = kiln::OutputBounds{10.0, 90.0};
            REQUIRE(sim.setConfig(p).ok(), "5B: patch rejected");
            sim.start();
            const kiln::ControllerConfig cfg = sim.config();
            const kiln::PlantParameters plant = sim.plantParameters();
            for (int i = 0; i < 500; ++i) {
                if (i == 250) {
                    kiln::ConfigPatch step;
                    step.setpoint_C = 300.0;
                    sim.post(kiln::Command::setConfig(step));
                }
                const kiln::TickResult r = sim.tick(dt);
                REQUIRE(r.has_sample, "5B: missing sample");
                requireSampleSane(r.sample, cfg, plant);
            }
        }
    }
}

static void runConfigExport_5C() {
    kiln::KilnSimulator a;
    kiln::KilnSimulator b;

    char buf_a[4096];
    char buf_b[4096];
    const int na = a.exportConfigText(buf_a, static_cast<int>(sizeof(buf_a)));
    const int nb = b.exportConfigText(buf_b, static_cast<int>(sizeof(buf_b)));
    REQUIRE(na > 0 && na < static_cast<int>(sizeof(buf_a)), "5C: export length");
    REQUIRE(na == static_cast<int>(std::strlen(buf_a)), "5C: length is not strlen");
    REQUIRE(na == nb && std::strcmp(buf_a, buf_b) == 0, "5C: export not deterministic");
    REQUIRE(std::strstr(buf_a, "KilnConfigV1") != nullptr, "5C: missing header");
    REQUIRE(std::strstr(buf_a, "setpoint_C=1450.000000") != nullptr, "5C: missing setpoint");
    REQUIRE(std::strstr(buf_a, "ExportTextHash(FNV-1a32)=0x") != nullptr, "5C: missing export hash");

    REQUIRE(a.exportConfig().fnv_hash_u32 == a.getRunSignatures().config_hash_u32, "5C: hash mismatch");

    kiln::ConfigPatch p;
    p.gains = kiln::PidGains{1.5, 0.1, 0.0};
    REQUIRE(b.setConfig(p).ok(), "5C: patch rejected");
    REQUIRE(a.exportConfig().fnv_hash_u32 != b.exportConfig().fnv_hash_u32, "5C: hash blind to Kp");

    char small[16];
    const int ns = a.exportConfigText(small, static_cast<int>(sizeof(small)));
    REQUIRE(ns == static_cast<int>(sizeof(small)) - 1, "5C: truncated length");
    REQUIRE(ns == static_cast<int>(std::strlen(small)), "5C: truncated length is not strlen");
    REQUIRE(std::strncmp(small, buf_a, sizeof(small) - 1) == 0, "5C: truncated text is not a prefix");

    // Cut inside the body: no export hash describing partial text.
    char mid[256];
    const int nm = a.exportConfigText(mid, static_cast<int>(sizeof(mid)));
    REQUIRE(nm == static_cast<int>(std::strlen(mid)) && nm < static_cast<int>(sizeof(mid)), "5C: mid length");
    REQUIRE(std::strstr(mid, "ExportTextHash") == nullptr, "5C: hash emitted for truncated text");

    char one[1];
    REQUIRE(a.exportConfigText(one, 1) == 0 && one[0] == '\0', "5C: single-byte buffer");
    REQUIRE(a.exportConfigText(nullptr, 16) == 0, "5C: null buffer accepted");
}

// --------------------
// 6: Metrics & shell
// --------------------

static void runMetrics_6A() {
    REQUIRE(kiln::classifyClinker(1400.0) == kiln::ClinkerQuality::Good, "6A: 1400 not good");
    REQUIRE(kiln::classifyClinker(1250.0) == kiln::ClinkerQuality::Partial, "6A: 1250 not partial");
    REQUIRE(kiln::classifyClinker(900.0) == kiln::ClinkerQuality::Poor, "6A: 900 not poor");
    REQUIRE(kiln::classifyClinker(std::nan("")) == kiln::ClinkerQuality::Poor, "6A: NaN not poor");

    std::vector<kiln::Sample> s(4);
    const double temps[] = {900.0, 1000.0, 1010.0, 995.0};
    for (int i = 0; i < 4; ++i) {
        s[static_cast<std::size_t>(i)].t_s = 10.0 * (i + 1);
        s[static_cast<std::size_t>(i)].temperature_C = temps[i];
        s[static_cast<std::size_t>(i)].setpoint_C = 1000.0;
        s[static_cast<std::size_t>(i)].control_output = 50.0;
        s[static_cast<std::size_t>(i)].emission_rate_kgph = 3600.0;
    }
    s[0].flags_u32 = kiln::Flag_OutputSaturated;

    const kiln::EmissionsParameters ep;
    const kiln::RunSummary m = kiln::summarizeRun(s, ep);
    REQUIRE(m.sample_count == 4, "6A: sample_count");
    requireExact("6A duration", m.duration_s, 40.0);
    requireExact("6A peak", m.peak_temperature_C, 1010.0);
    requireExact("6A final", m.final_temperature_C, 995.0);
    requireNear("6A overshoot", m.overshoot_C, 10.0, 1e-12);
    requireNear("6A iae", m.iae_C_s, (100.0 + 0.0 + 10.0 + 5.0) * 10.0, 1e-9);
    requireNear("6A co2", m.total_co2_kg, 40.0, 1e-9);
    requireNear("6A mean output", m.mean_control_output, 50.0, 1e-12);
    requireNear("6A mean fuel", m.mean_fuel_kgph, kiln::fuelRateKgph(50.0, ep), 1e-9);
    requireExact("6A settling", m.settling_time_s, 20.0);
    REQUIRE(m.output_saturated_samples == 1, "6A: saturated count");

    const kiln::RunSummary empty = kiln::summarizeRun({}, ep);
    REQUIRE(empty.sample_count == 0, "6A: empty summary");

    const kiln::EfficiencyEstimate none = kiln::estimateEfficiency(700.0);
    requireExact("6A baseline savings", none.fuel_saved_kg_per_year, 0.0);
    const kiln::EfficiencyEstimate eff = kiln::estimateEfficiency(600.0);
    requireNear("6A fuel saved", eff.fuel_saved_kg_per_year, 100.0 * 330.0 * 24.0, 1e-6);
    requireNear("6A co2 avoided", eff.co2_avoided_kg_per_year, 100.0 * 330.0 * 24.0 * 3.17, 1e-3);
    requireNear("6A money", eff.money_saved_per_year, 792.0 * 15.0, 1e-6);
}

static void runKilnShell_6B() {
    const double pi = 3.14159265358979323846;
    requireNear("6B quarter turn", kiln::world::KilnShell::rotationPhase(15.0, 1.0), 0.5 * pi, 1e-12);
    const double full = kiln::world::KilnShell::rotationPhase(60.0, 1.0);
    REQUIRE(full < 1e-9 || (2.0 * pi - full) < 1e-9, "6B: full turn did not wrap");
    requireExact("6B stopped motor", kiln::world::KilnShell::rotationPhase(123.0, 0.0), 0.0);
    const double long_run = kiln::world::KilnShell::rotationPhase(1.0e7, 2.5);
    REQUIRE(long_run >= 0.0 && long_run < 2.0 * pi, "6B: phase not wrapped");

    requireExact("6B residence", kiln::world::residenceTimeMinutes(2.0), 15.0);
    requireExact("6B efficiency fast", kiln::world::heatTransferEfficiency(2.0), 0.5);
    requireExact("6B efficiency slow", kiln::world::heatTransferEfficiency(0.5), 1.0);
    requireExact("6B efficiency stopped", kiln::world::heatTransferEfficiency(0.0), 0.0);

    kiln::world::KilnShell shell;
    kiln::world::KilnShellInputs in;
    in.time_s = 10.0;
    shell.recompute(in);
    REQUIRE(shell.isValid(), "6B: default shell invalid");
    const kiln::world::KilnShellGeometry& g = shell.geometry();
    REQUIRE(g.feed_end_m.y > g.burner_end_m.y, "6B: feed end not raised");
    REQUIRE(static_cast<int>(g.rings_m.size()) == g.ring_count * g.ring_segments, "6B: ring vertex count");

    const kiln::world::Vec3d& v = g.ringVertex(0, 5);
    const double dy = v.y - g.feed_end_m.y;
    const double dz = v.z - g.feed_end_m.z;
    requireNear("6B ring radius", std::sqrt(dy * dy + dz * dz), shell.config().radius_m, 1e-9);

    kiln::world::KilnShellConfig bad;
    bad.ring_segments = 2;
    kiln::world::KilnShell invalid(bad);
    invalid.recompute(in);
    REQUIRE(!invalid.isValid(), "6B: 2-segment ring accepted");
}

// --------------------
// 7: Tuning sweeps
// --------------------

static void runSensitivitySweep_7A() {
    kiln::SensitivityAnalyzer analyzer;
    kiln::SensitivityAnalyzer::ScenarioConfig sc;
    sc.t_end_s = 600.0;
    sc.dt_s = 5.0;
    analyzer.setScenario(sc);

    kiln::SensitivityAnalyzer::ParameterRange range;
    range.nominal = 1.0;
    range.min = 0.5;
    range.max = 1.5;
    range.samples = 3;
    analyzer.analyzeProportionalGain(range);

    const auto& rows = analyzer.results();
    REQUIRE(rows.size() == 3u, "7A: row count");
    requireExact("7A first value", rows.front().parameter_value, 0.5);
    requireExact("7A last value", rows.back().parameter_value, 1.5);
    for (const auto& row : rows) {
        REQUIRE(row.parameter_name == "Kp", "7A: parameter name");
        REQUIRE(row.metrics.sample_count == 120, "7A: scenario length");
        REQUIRE(row.metrics.peak_temperature_C > sc.plant.initial_temperature_C, "7A: kiln never heated");
        REQUIRE_FINITE(row.metrics.total_co2_kg, "total_co2_kg");
    }

    // Slower shell means longer residence and more heat into the bed.
    analyzer.analyzeMotorSpeed(kiln::SensitivityAnalyzer::ParameterRange{2.0, 1.0, 4.0, 2});
    REQUIRE(analyzer.results().size() == 2u, "7A: rpm sweep row count");
    REQUIRE(analyzer.results()[0].metrics.final_temperature_C >
                analyzer.results()[1].metrics.final_temperature_C,
            "7A: faster shell did not lower temperature");

    // Invalid swept values are flagged, never silently replaced by defaults.
    analyzer.analyzeTimeConstant(kiln::SensitivityAnalyzer::ParameterRange{600.0, -600.0, 600.0, 3});
    {
        const auto& tau_rows = analyzer.results();
        REQUIRE(tau_rows.size() == 3u, "7A: tau sweep row count");
        for (int i = 0; i < 2; ++i) {
            REQUIRE(tau_rows[i].status.error == kiln::ConfigError::InvalidTimeConstant, "7A: bad tau not flagged");
            REQUIRE(std::strcmp(tau_rows[i].status.field, "time_constant_s") == 0, "7A: bad tau field");
            REQUIRE(tau_rows[i].metrics.sample_count == 0, "7A: bad tau row has metrics");
        }
        REQUIRE(tau_rows[2].status.ok(), "7A: nominal tau rejected");
        REQUIRE(tau_rows[2].metrics.sample_count == 120, "7A: nominal tau scenario length");
    }

    kiln::SensitivityAnalyzer::ScenarioConfig bad_sc = sc;
    bad_sc.plant.time_constant_s = 0.0;
    REQUIRE(!kiln::SensitivityAnalyzer::validateScenario(bad_sc).ok(), "7A: tau 0 scenario accepted");
    REQUIRE(kiln::SensitivityAnalyzer::runScenario(bad_sc).sample_count == 0, "7A: tau 0 scenario ran");
    bad_sc = sc;
    bad_sc.motor_rpm = -1.0;
    REQUIRE(kiln::SensitivityAnalyzer::validateScenario(bad_sc).error == kiln::ConfigError::NegativeCoefficient,
            "7A: negative rpm accepted");

    const kiln::RunSummary r1 = kiln::SensitivityAnalyzer::runScenario(sc);
    const kiln::RunSummary r2 = kiln::SensitivityAnalyzer::runScenario(sc);
    requireExact("7A scenario replay", r1.final_temperature_C, r2.final_temperature_C);

    const std::string path = "kiln_sensitivity_test.csv";
    REQUIRE(analyzer.exportSensitivityMatrixCSV(path), "7A: CSV export failed");
    std::ifstream in(path);
    std::string header;
    std::getline(in, header);
    REQUIRE(header.rfind("parameter,value,", 0) == 0, "7A: CSV header");
    REQUIRE(header.size() >= 7 && header.compare(header.size() - 7, 7, ",status") == 0, "7A: CSV status column");
    std::string line;
    int rejected_lines = 0;
    while (std::getline(in, line)) {
        if (line.size() >= 16 && line.compare(line.size() - 16, 16, ",time_constant_s") == 0) ++rejected_lines;
    }
    REQUIRE(rejected_lines == 2, "7A: rejected rows not marked in CSV");
    in.close();
    std::remove(path.c_str());
}

} // namespace

int main() {
    // Canary: prove the test fails in Release when checks are active.
    if (std::getenv("KILNSIM_CANARY_NAN")) {
        REQUIRE_FINITE(std::nan(""), "CANARY_NAN");
        return 0; // unreachable
    }

    // =======================
    // 1: Determinism
    // =======================
    runDeterministicReplay_1A();
    runResetReplayMatchesFresh_1B();

    // =======================
    // 2: Controller
    // =======================
    runAntiWindup_2A();
    runModeSwitchContinuity_2B();
    runManualFreezesMemory_2C();
    runPidInvalidInputs_2D();

    // =======================
    // 3: Plant & emissions
    // =======================
    runFirstTickScenario_3A();
    runManualMonotoneConvergence_3B();
    runPlantCoarseDtAndEnvelope_3C();
    runTemperatureSaturation_3D();
    runEmissionsMonotone_3E();

    // =======================
    // 4: Lifecycle & commands
    // =======================
    runTickWhileNotRunning_4A();
    runInvalidDtSkipsTick_4B();
    runResetIdempotence_4C();
    runResetKeepsOrRestoresConfig_4D();
    runConfigValidation_4E();
    runCommandQueueOrdering_4F();
    runEventLatching_4G();

    // =======================
    // 5: Observation surface
    // =======================
    runHistoryRingBuffer_5A();
    runBoundsInvariantSoak_5B();
    runConfigExport_5C();

    // =======================
    // 6-7: Metrics, shell, sweeps
    // =======================
    runMetrics_6A();
    runKilnShell_6B();
    runSensitivitySweep_7A();

    std::cout << "[PASS] TestKilnIntegrity\n";
    return 0;
}
