#pragma once

#include <cstdint>
#include <deque>
#include <mutex>
#include <vector>

#include "KilnTypes.h"
#include "PidController.h"

namespace kiln {

// ============================================================
// Versioned, hashable configuration contract.
// Covers every parameter that influences the sample stream.
// ============================================================
struct KilnConfigV1 {
    std::uint32_t version_u32 = 1;
    std::uint32_t size_bytes_u32 = sizeof(KilnConfigV1);
    std::uint32_t fnv_hash_u32 = 0;

    ControllerConfig controller{};
    PlantParameters plant{};
    EmissionsParameters emissions{};
    std::uint32_t history_capacity_u32 = 0;
};

struct RunSignatures {
    std::uint32_t config_hash_u32 = 0; // FNV-1a32 over effective parameters
    std::uint32_t history_crc_u32 = 0; // CRC32 over every sample emitted since reset
    std::uint64_t samples_emitted_u64 = 0;
};

// UI-side command, applied atomically between ticks.
struct Command {
    enum class Kind : int {
        Start = 0,
        Stop,
        Reset,
        ResetWithDefaults, // also restores the default ControllerConfig
        SetConfig,
    };

    Kind kind = Kind::Start;
    ConfigPatch patch{}; // SetConfig only

    static Command start() { return Command{Kind::Start, {}}; }
    static Command stop() { return Command{Kind::Stop, {}}; }
    static Command reset() { return Command{Kind::Reset, {}}; }
    static Command setConfig(const ConfigPatch& p) { return Command{Kind::SetConfig, p}; }
};

class KilnSimulator {
public:
    static constexpr int kDefaultHistoryCapacity = 4096;

    KilnSimulator();
    // Invalid plant parameters fall back to defaultPlantParameters() and latch Warn_ConfigRejected.
    explicit KilnSimulator(const PlantParameters& plant,
                           const EmissionsParameters& emissions = EmissionsParameters{},
                           int history_capacity = kDefaultHistoryCapacity);

    // Owns a mutex and is handed to UI code by reference; keep it in place.
    KilnSimulator(const KilnSimulator&) = delete;
    KilnSimulator& operator=(const KilnSimulator&) = delete;
    KilnSimulator(KilnSimulator&&) = delete;
    KilnSimulator& operator=(KilnSimulator&&) = delete;

    // ---- Lifecycle (idempotent) ----
    void start();
    void stop();
    // Clears state, controller memory and history. ControllerConfig is kept
    // unless restore_default_config is set.
    void reset(bool restore_default_config = false);
    // Reset with new plant parameters. Rejected parameters leave everything untouched.
    ConfigStatus resetToPlant(const PlantParameters& plant);

    // ---- Configuration ----
    // Partial update, validated as a whole; previous config kept on rejection.
    ConfigStatus setConfig(const ConfigPatch& patch);
    ControllerConfig config() const;
    PlantParameters plantParameters() const;
    EmissionsParameters emissionsParameters() const;

    // ---- Cross-thread command queue ----
    void post(const Command& cmd);
    // Applies queued commands now; returns the number of rejected config patches.
    int applyPendingCommands();
    std::size_t pendingCommandCount() const;

    // ---- Stepping ----
    // Drains queued commands, then advances one step if running.
    TickResult tick(double dt_s);

    // ---- Observation (copies taken under the lock) ----
    SimulationState currentState() const;
    // Oldest -> newest, bounded by historyCapacity().
    std::vector<Sample> history() const;
    // Bulk read into caller storage (oldest first); returns the count written.
    int getHistory(Sample* out_ptr, int cap) const;
    int historyCapacity() const noexcept { return history_capacity_; }
    ControllerInternalState controllerState() const;

    RunSignatures getRunSignatures() const;
    KilnConfigV1 exportConfig() const;
    // Writes NUL-terminated text; returns strlen(buf), at most cap - 1.
    int exportConfigText(char* buf, int cap) const;
    std::uint32_t getLatestEvents();

private:
    // All private helpers expect mu_ to be held.
    void resetLocked(bool restore_default_config);
    ConfigStatus setConfigLocked(const ConfigPatch& patch);
    int applyCommandsLocked(std::deque<Command>& cmds);
    void appendSampleLocked(const Sample& s);
    std::uint32_t configHashLocked() const;

    mutable std::mutex mu_;

    ControllerConfig config_{};
    PlantParameters plant_{};
    EmissionsParameters emissions_{};

    SimulationState state_{};
    PidController pid_{};

    // History ring buffer (fixed capacity, allocated once)
    int history_capacity_ = kDefaultHistoryCapacity;
    std::vector<Sample> history_rb_{};
    int history_head_ = 0;  // next write
    int history_count_ = 0; // number valid

    RunSignatures signatures_{};
    std::uint32_t latest_events_bits_ = 0;

    // Guarded by queue_mu_, never held together with mu_.
    mutable std::mutex queue_mu_;
    std::deque<Command> pending_{};
};

} // namespace kiln
