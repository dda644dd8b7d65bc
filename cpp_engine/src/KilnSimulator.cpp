#include "KilnSimulator.h"

#include "EmissionsModel.h"
#include "PlantModel.h"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdio>
#include <cstring>

namespace kiln {

namespace {

// --------------------
// Audit hashing (FNV-1a32 for parameters, CRC32 for the sample stream)
// --------------------

static inline std::uint32_t fnv1a32_update(std::uint32_t h, const void* data, std::size_t len) {
    const std::uint8_t* p = reinterpret_cast<const std::uint8_t*>(data);
    for (std::size_t i = 0; i < len; ++i) {
        h ^= static_cast<std::uint32_t>(p[i]);
        h *= 16777619u;
    }
    return h;
}

static inline std::uint32_t fnv1a32_begin() { return 2166136261u; }

static inline std::uint32_t fnv1a32_add_u32(std::uint32_t h, std::uint32_t v) {
    return fnv1a32_update(h, &v, sizeof(v));
}
static inline std::uint32_t fnv1a32_add_i32(std::uint32_t h, std::int32_t v) {
    return fnv1a32_update(h, &v, sizeof(v));
}
static inline std::uint32_t fnv1a32_add_f64(std::uint32_t h, double v) {
    std::uint64_t bits = 0;
    static_assert(sizeof(bits) == sizeof(v), "unexpected double size");
    std::memcpy(&bits, &v, sizeof(v));
    return fnv1a32_update(h, &bits, sizeof(bits));
}

static std::array<std::uint32_t, 256> makeCrcTable() {
    std::array<std::uint32_t, 256> table{};
    for (std::uint32_t i = 0; i < 256; ++i) {
        std::uint32_t c = i;
        for (int k = 0; k < 8; ++k) {
            c = (c & 1u) ? (0xEDB88320u ^ (c >> 1)) : (c >> 1);
        }
        table[i] = c;
    }
    return table;
}

static inline std::uint32_t crc32_update(std::uint32_t crc, const void* data, std::size_t len) {
    static const std::array<std::uint32_t, 256> table = makeCrcTable();
    const std::uint8_t* p = reinterpret_cast<const std::uint8_t*>(data);
    std::uint32_t c = crc ^ 0xFFFFFFFFu;
    for (std::size_t i = 0; i < len; ++i) {
        c = table[(c ^ p[i]) & 0xFFu] ^ (c >> 8);
    }
    return c ^ 0xFFFFFFFFu;
}

static inline std::uint32_t crc32_add_f64(std::uint32_t crc, double v) {
    std::uint64_t bits = 0;
    static_assert(sizeof(bits) == sizeof(v), "unexpected double size");
    std::memcpy(&bits, &v, sizeof(v));
    return crc32_update(crc, &bits, sizeof(bits));
}

static inline std::uint32_t crc32_add_u32(std::uint32_t crc, std::uint32_t v) {
    return crc32_update(crc, &v, sizeof(v));
}

static inline std::uint32_t crc32_add_sample(std::uint32_t crc, const Sample& s) {
    // Field-wise, fixed order (struct padding never enters the stream).
    crc = crc32_add_f64(crc, s.t_s);
    crc = crc32_add_f64(crc, s.temperature_C);
    crc = crc32_add_f64(crc, s.control_output);
    crc = crc32_add_f64(crc, s.emission_rate_kgph);
    crc = crc32_add_f64(crc, s.setpoint_C);
    crc = crc32_add_u32(crc, s.flags_u32);
    return crc;
}

static inline std::uint32_t fnv_hash_text_u32(const char* s) {
    if (!s) return 0;
    std::uint32_t h = fnv1a32_begin();
    h = fnv1a32_update(h, s, std::strlen(s));
    return h;
}

static int sanitizeCapacity(int cap) {
    return (cap < 1) ? 1 : cap;
}

} // namespace

KilnSimulator::KilnSimulator()
    : KilnSimulator(defaultPlantParameters(), defaultEmissionsParameters(), kDefaultHistoryCapacity) {}

KilnSimulator::KilnSimulator(const PlantParameters& plant,
                             const EmissionsParameters& emissions,
                             int history_capacity)
    : config_(defaultControllerConfig()),
      plant_(validatePlantParameters(plant).ok() ? plant : defaultPlantParameters()),
      emissions_(validateEmissionsParameters(emissions).ok() ? emissions : defaultEmissionsParameters()),
      history_capacity_(sanitizeCapacity(history_capacity)) {
    history_rb_.resize(static_cast<std::size_t>(history_capacity_));
    std::lock_guard<std::mutex> lk(mu_);
    resetLocked(false);
    const bool accepted = validatePlantParameters(plant).ok() && validateEmissionsParameters(emissions).ok();
    latest_events_bits_ = accepted ? Event_None : Warn_ConfigRejected;
}

// --------------------
// Lifecycle
// --------------------

void KilnSimulator::start() {
    std::lock_guard<std::mutex> lk(mu_);
    if (state_.phase == RunPhase::Running) return;
    state_.phase = RunPhase::Running;
    state_.running = true;
    latest_events_bits_ |= Event_Started;
}

void KilnSimulator::stop() {
    std::lock_guard<std::mutex> lk(mu_);
    if (state_.phase != RunPhase::Running) return;
    state_.phase = RunPhase::Stopped;
    state_.running = false;
    latest_events_bits_ |= Event_Stopped;
}

void KilnSimulator::reset(bool restore_default_config) {
    std::lock_guard<std::mutex> lk(mu_);
    resetLocked(restore_default_config);
}

ConfigStatus KilnSimulator::resetToPlant(const PlantParameters& plant) {
    const ConfigStatus st = validatePlantParameters(plant);
    std::lock_guard<std::mutex> lk(mu_);
    if (!st.ok()) {
        latest_events_bits_ |= Warn_ConfigRejected;
        return st;
    }
    plant_ = plant;
    resetLocked(false);
    return st;
}

void KilnSimulator::resetLocked(bool restore_default_config) {
    if (restore_default_config) {
        config_ = defaultControllerConfig();
    }

    state_ = SimulationState{};
    state_.temperature_C = plant_.initial_temperature_C;
    state_.mode = config_.mode;
    state_.phase = RunPhase::Idle;
    state_.running = false;

    pid_.reset();

    std::fill(history_rb_.begin(), history_rb_.end(), Sample{});
    history_head_ = 0;
    history_count_ = 0;

    signatures_ = {};
    signatures_.config_hash_u32 = configHashLocked();

    latest_events_bits_ |= Event_Reset;
}

// --------------------
// Configuration
// --------------------

ConfigStatus KilnSimulator::setConfig(const ConfigPatch& patch) {
    std::lock_guard<std::mutex> lk(mu_);
    return setConfigLocked(patch);
}

ConfigStatus KilnSimulator::setConfigLocked(const ConfigPatch& patch) {
    ControllerConfig next = config_;
    if (patch.setpoint_C) next.setpoint_C = *patch.setpoint_C;
    if (patch.gains) next.gains = *patch.gains;
    if (patch.mode) next.mode = *patch.mode;
    if (patch.manual_output) next.manual_output = *patch.manual_output;
    if (patch.output_bounds) next.output_bounds = *patch.output_bounds;

    const ConfigStatus st = validateControllerConfig(next);
    if (!st.ok()) {
        latest_events_bits_ |= Warn_ConfigRejected;
        return st;
    }

    if (next.mode != config_.mode) {
        latest_events_bits_ |= Event_ModeChanged;
    }
    config_ = next;
    // State is frozen while stopped; the next tick picks the mode up.
    if (state_.phase != RunPhase::Stopped) {
        state_.mode = config_.mode;
    }
    signatures_.config_hash_u32 = configHashLocked();
    latest_events_bits_ |= Event_ConfigApplied;
    return st;
}

ControllerConfig KilnSimulator::config() const {
    std::lock_guard<std::mutex> lk(mu_);
    return config_;
}

PlantParameters KilnSimulator::plantParameters() const {
    std::lock_guard<std::mutex> lk(mu_);
    return plant_;
}

EmissionsParameters KilnSimulator::emissionsParameters() const {
    std::lock_guard<std::mutex> lk(mu_);
    return emissions_;
}

// --------------------
// Command queue
// --------------------

void KilnSimulator::post(const Command& cmd) {
    std::lock_guard<std::mutex> lk(queue_mu_);
    pending_.push_back(cmd);
}

std::size_t KilnSimulator::pendingCommandCount() const {
    std::lock_guard<std::mutex> lk(queue_mu_);
    return pending_.size();
}

int KilnSimulator::applyPendingCommands() {
    std::deque<Command> cmds;
    {
        std::lock_guard<std::mutex> lk(queue_mu_);
        cmds.swap(pending_);
    }
    std::lock_guard<std::mutex> lk(mu_);
    return applyCommandsLocked(cmds);
}

int KilnSimulator::applyCommandsLocked(std::deque<Command>& cmds) {
    int rejected = 0;
    for (const Command& c : cmds) {
        switch (c.kind) {
            case Command::Kind::Start:
                if (state_.phase != RunPhase::Running) {
                    state_.phase = RunPhase::Running;
                    state_.running = true;
                    latest_events_bits_ |= Event_Started;
                }
                break;
            case Command::Kind::Stop:
                if (state_.phase == RunPhase::Running) {
                    state_.phase = RunPhase::Stopped;
                    state_.running = false;
                    latest_events_bits_ |= Event_Stopped;
                }
                break;
            case Command::Kind::Reset:
                resetLocked(false);
                break;
            case Command::Kind::ResetWithDefaults:
                resetLocked(true);
                break;
            case Command::Kind::SetConfig:
                if (!setConfigLocked(c.patch).ok()) ++rejected;
                break;
        }
    }
    cmds.clear();
    return rejected;
}

// --------------------
// Stepping
// --------------------

TickResult KilnSimulator::tick(double dt_s) {
    std::deque<Command> cmds;
    {
        std::lock_guard<std::mutex> lk(queue_mu_);
        cmds.swap(pending_);
    }

    std::lock_guard<std::mutex> lk(mu_);

    TickResult r;
    r.rejected_commands = applyCommandsLocked(cmds);

    if (state_.phase != RunPhase::Running) {
        r.status = TickStatus::NotRunning;
        latest_events_bits_ |= Warn_TickWhileNotRunning;
        return r;
    }

    // Controller. Nothing is mutated before this succeeds.
    const PidResult pid = pid_.compute(config_.setpoint_C, state_.temperature_C, dt_s, config_);
    if (pid.status != PidStatus::Ok) {
        r.status = TickStatus::InvalidConfig;
        latest_events_bits_ |= Warn_InvalidTick;
        return r;
    }

    // Plant
    const PlantStep plant = advancePlant(state_.temperature_C, pid.output, dt_s, plant_);

    // Emissions
    const double co2_kgph = estimateEmissions(pid.output, plant.temperature_C, emissions_);

    state_.time_s += dt_s;
    state_.tick_count += 1;
    state_.temperature_C = plant.temperature_C;
    state_.control_output = pid.output;
    state_.emission_rate_kgph = co2_kgph;
    state_.mode = config_.mode;

    Sample s;
    s.t_s = state_.time_s;
    s.temperature_C = plant.temperature_C;
    s.control_output = pid.output;
    s.emission_rate_kgph = co2_kgph;
    s.setpoint_C = config_.setpoint_C;
    if (plant.saturated) s.flags_u32 |= Flag_TemperatureSaturated;
    if (pid.output_saturated) s.flags_u32 |= Flag_OutputSaturated;
    if (config_.mode == ControlMode::Manual) s.flags_u32 |= Flag_ManualMode;

    appendSampleLocked(s);

    if (plant.saturated) latest_events_bits_ |= Warn_TemperatureSaturated;
    if (pid.output_saturated) latest_events_bits_ |= Warn_OutputSaturated;

    r.status = plant.saturated ? TickStatus::Saturated : TickStatus::Ok;
    r.has_sample = true;
    r.sample = s;
    return r;
}

void KilnSimulator::appendSampleLocked(const Sample& s) {
    history_rb_[static_cast<std::size_t>(history_head_)] = s;
    history_head_ = (history_head_ + 1) % history_capacity_;
    if (history_count_ < history_capacity_) ++history_count_;

    signatures_.history_crc_u32 = crc32_add_sample(signatures_.history_crc_u32, s);
    signatures_.samples_emitted_u64 += 1;
}

// --------------------
// Observation
// --------------------

SimulationState KilnSimulator::currentState() const {
    std::lock_guard<std::mutex> lk(mu_);
    return state_;
}

ControllerInternalState KilnSimulator::controllerState() const {
    std::lock_guard<std::mutex> lk(mu_);
    return pid_.state();
}

std::vector<Sample> KilnSimulator::history() const {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<Sample> out;
    out.reserve(static_cast<std::size_t>(history_count_));
    // Oldest sample index = head - count (mod capacity)
    int idx = history_head_ - history_count_;
    while (idx < 0) idx += history_capacity_;
    for (int i = 0; i < history_count_; ++i) {
        out.push_back(history_rb_[static_cast<std::size_t>((idx + i) % history_capacity_)]);
    }
    return out;
}

int KilnSimulator::getHistory(Sample* out_ptr, int cap) const {
    if (!out_ptr || cap <= 0) return 0;
    std::lock_guard<std::mutex> lk(mu_);
    const int n = std::min<int>(history_count_, cap);
    int idx = history_head_ - history_count_;
    while (idx < 0) idx += history_capacity_;
    for (int i = 0; i < n; ++i) {
        out_ptr[i] = history_rb_[static_cast<std::size_t>((idx + i) % history_capacity_)];
    }
    return n;
}

RunSignatures KilnSimulator::getRunSignatures() const {
    std::lock_guard<std::mutex> lk(mu_);
    return signatures_;
}

std::uint32_t KilnSimulator::getLatestEvents() {
    std::lock_guard<std::mutex> lk(mu_);
    const std::uint32_t out = latest_events_bits_;
    latest_events_bits_ = 0;
    return out;
}

// --------------------
// Configuration export
// --------------------

std::uint32_t KilnSimulator::configHashLocked() const {
    // Explicit field list, fixed order.
    std::uint32_t h = fnv1a32_begin();
    h = fnv1a32_add_u32(h, 1u); // KilnConfigV1 version
    h = fnv1a32_add_f64(h, config_.setpoint_C);
    h = fnv1a32_add_f64(h, config_.gains.Kp);
    h = fnv1a32_add_f64(h, config_.gains.Ki);
    h = fnv1a32_add_f64(h, config_.gains.Kd);
    h = fnv1a32_add_f64(h, config_.output_bounds.min);
    h = fnv1a32_add_f64(h, config_.output_bounds.max);
    h = fnv1a32_add_f64(h, config_.manual_output);
    h = fnv1a32_add_i32(h, static_cast<std::int32_t>(config_.mode));

    h = fnv1a32_add_f64(h, plant_.time_constant_s);
    h = fnv1a32_add_f64(h, plant_.ambient_C);
    h = fnv1a32_add_f64(h, plant_.process_gain_C_per_pct);
    h = fnv1a32_add_f64(h, plant_.heat_transfer_efficiency_0_1);
    h = fnv1a32_add_f64(h, plant_.floor_C);
    h = fnv1a32_add_f64(h, plant_.ceiling_C);
    h = fnv1a32_add_f64(h, plant_.initial_temperature_C);

    h = fnv1a32_add_f64(h, emissions_.fuel_base_kgph);
    h = fnv1a32_add_f64(h, emissions_.fuel_per_pct_kgph);
    h = fnv1a32_add_f64(h, emissions_.fuel_max_kgph);
    h = fnv1a32_add_f64(h, emissions_.co2_per_kg_fuel);
    h = fnv1a32_add_f64(h, emissions_.temperature_coeff_kgph_per_C);
    h = fnv1a32_add_f64(h, emissions_.temperature_ref_C);

    h = fnv1a32_add_u32(h, static_cast<std::uint32_t>(history_capacity_));
    return h;
}

KilnConfigV1 KilnSimulator::exportConfig() const {
    std::lock_guard<std::mutex> lk(mu_);
    KilnConfigV1 c;
    c.controller = config_;
    c.plant = plant_;
    c.emissions = emissions_;
    c.history_capacity_u32 = static_cast<std::uint32_t>(history_capacity_);
    c.fnv_hash_u32 = configHashLocked();
    return c;
}

int KilnSimulator::exportConfigText(char* buf, int cap) const {
    if (!buf || cap <= 0) return 0;

    const KilnConfigV1 c = exportConfig();
    buf[0] = '\0';

    // Stable export text (deterministic order). n never exceeds cap - 1,
    // the number of characters actually written before the terminator.
    int n = 0;
    bool truncated = false;
    auto app = [&](const char* fmt, auto... args) {
        if (truncated) return;
        const int w = std::snprintf(buf + n, (size_t)(cap - n), fmt, args...);
        if (w < 0) return;
        if (w > cap - 1 - n) {
            n = cap - 1;
            truncated = true;
            return;
        }
        n += w;
    };

    app("KilnConfigV1\n");
    app("  version_u32=%u\n", c.version_u32);
    app("  size_bytes_u32=%u\n", c.size_bytes_u32);
    app("  history_capacity_u32=%u\n", c.history_capacity_u32);

    app("Controller\n");
    app("  mode=%s\n", toString(c.controller.mode));
    app("  setpoint_C=%.6f\n", c.controller.setpoint_C);
    app("  Kp=%.9g\n", c.controller.gains.Kp);
    app("  Ki_per_s=%.9g\n", c.controller.gains.Ki);
    app("  Kd_s=%.9g\n", c.controller.gains.Kd);
    app("  output_min_pct=%.6f\n", c.controller.output_bounds.min);
    app("  output_max_pct=%.6f\n", c.controller.output_bounds.max);
    app("  manual_output_pct=%.6f\n", c.controller.manual_output);

    app("Plant\n");
    app("  time_constant_s=%.9g\n", c.plant.time_constant_s);
    app("  ambient_C=%.6f\n", c.plant.ambient_C);
    app("  process_gain_C_per_pct=%.9g\n", c.plant.process_gain_C_per_pct);
    app("  heat_transfer_efficiency_0_1=%.6f\n", c.plant.heat_transfer_efficiency_0_1);
    app("  floor_C=%.6f\n", c.plant.floor_C);
    app("  ceiling_C=%.6f\n", c.plant.ceiling_C);
    app("  initial_temperature_C=%.6f\n", c.plant.initial_temperature_C);

    app("Emissions\n");
    app("  fuel_base_kgph=%.6f\n", c.emissions.fuel_base_kgph);
    app("  fuel_per_pct_kgph=%.6f\n", c.emissions.fuel_per_pct_kgph);
    app("  fuel_max_kgph=%.6f\n", c.emissions.fuel_max_kgph);
    app("  co2_per_kg_fuel=%.6f\n", c.emissions.co2_per_kg_fuel);
    app("  temperature_coeff_kgph_per_C=%.9g\n", c.emissions.temperature_coeff_kgph_per_C);
    app("  temperature_ref_C=%.6f\n", c.emissions.temperature_ref_C);

    app("  fnv_hash_u32=0x%08X\n", c.fnv_hash_u32);

    // Convenience: full export hash for copy/paste audits. Omitted when the
    // text above was cut short, so a hash never describes a partial export.
    if (!truncated) {
        const std::uint32_t export_hash = fnv_hash_text_u32(buf);
        app("ExportTextHash(FNV-1a32)=0x%08X\n", export_hash);
    }

    return n;
}

} // namespace kiln
