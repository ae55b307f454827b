#pragma once

#include <string>

namespace core::jobs {
    enum class RollState {
        Idle, // "IDL" - Roll not started yet
        Running, // "RUN" - Roll printing, progress follows the printer counters
        Paused, // "PAU" - Roll paused, note entry open
        Stopped, // "STP" - Roll stopped by the operator (terminal)
        Completed, // "CMP" - Roll reached its label goal (terminal)
    };

    /**
     * @brief Convert RollState enum to string code
     */
    inline std::string rollStateToCode(RollState state) {
        switch (state) {
            case RollState::Idle: return "IDL";
            case RollState::Running: return "RUN";
            case RollState::Paused: return "PAU";
            case RollState::Stopped: return "STP";
            case RollState::Completed: return "CMP";
            default: return "UNK";
        }
    }

    inline bool isTerminal(RollState state) {
        return state == RollState::Stopped || state == RollState::Completed;
    }
}
