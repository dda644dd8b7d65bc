#include "KilnTypes.h"

namespace kiln {

const char* toString(ControlMode m) {
    switch (m) {
        case ControlMode::Auto:   return "AUTO";
        case ControlMode::Manual: return "MANUAL";
    }
    return "UNKNOWN";
}

const char* toString(RunPhase p) {
    switch (p) {
        case RunPhase::Idle:    return "IDLE";
        case RunPhase::Running: return "RUNNING";
        case RunPhase::Stopped: return "STOPPED";
    }
    return "UNKNOWN";
}

const char* toString(TickStatus s) {
    switch (s) {
        case TickStatus::Ok:            return "OK";
        case TickStatus::Saturated:     return "SATURATION";
        case TickStatus::InvalidConfig: return "INVALID_CONFIG";
        case TickStatus::NotRunning:    return "NO_OP_NOT_RUNNING";
    }
    return "UNKNOWN";
}

const char* toString(ConfigError e) {
    switch (e) {
        case ConfigError::None:                return "none";
        case ConfigError::NonFiniteValue:      return "non-finite value";
        case ConfigError::NegativeGain:        return "negative gain";
        case ConfigError::InvertedBounds:      return "output bounds min > max";
        case ConfigError::InvalidMode:         return "invalid mode";
        case ConfigError::InvalidTimeConstant: return "time constant must be > 0";
        case ConfigError::InvalidEnvelope:     return "temperature floor > ceiling";
        case ConfigError::InvalidEfficiency:   return "efficiency outside [0,1]";
        case ConfigError::NegativeCoefficient: return "negative coefficient";
    }
    return "unknown";
}

ControllerConfig defaultControllerConfig() {
    return ControllerConfig{};
}

PlantParameters defaultPlantParameters() {
    return PlantParameters{};
}

EmissionsParameters defaultEmissionsParameters() {
    return EmissionsParameters{};
}

} // namespace kiln
