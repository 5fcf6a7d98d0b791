#pragma once

// =============================================================================
// stochsim v1 - Step Logging Hook for Debugging
// =============================================================================
// Opt-in record of every attempted step. The logger is handed to a run through
// SolveOptions::step_logger; there is no process-wide instance.
// =============================================================================

#include "stochsim/v1/numeric_types.hpp"

#include <algorithm>
#include <cstddef>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace stochsim::v1 {

enum class StepEvent {
    Accepted,
    RejectedError,      // Error norm above one
    RejectedNonFinite,  // Candidate state contained NaN/Inf
    FinalStep           // Accepted step that reached the end time
};

[[nodiscard]] constexpr const char* to_string(StepEvent event) noexcept {
    switch (event) {
        case StepEvent::Accepted: return "accepted";
        case StepEvent::RejectedError: return "rejected_error";
        case StepEvent::RejectedNonFinite: return "rejected_non_finite";
        case StepEvent::FinalStep: return "final_step";
        default: return "unknown";
    }
}

/// Step log entry
struct StepLogEntry {
    Real time = 0.0;          // Step start time
    Real dt = 0.0;            // Attempted step size
    Real error_norm = 0.0;    // Scaled error norm (0 when not estimated)
    Real dt_next = 0.0;       // Step size proposed for the next attempt
    StepEvent event = StepEvent::Accepted;

    [[nodiscard]] bool accepted() const {
        return event == StepEvent::Accepted || event == StepEvent::FinalStep;
    }

    [[nodiscard]] std::string to_csv() const {
        return std::to_string(time) + "," +
               std::to_string(dt) + "," +
               std::to_string(error_norm) + "," +
               std::to_string(dt_next) + "," +
               (accepted() ? "1" : "0") + "," +
               to_string(event);
    }

    [[nodiscard]] static std::string csv_header() {
        return "time,dt,error_norm,dt_next,accepted,event";
    }
};

using StepLogCallback = std::function<void(const StepLogEntry&)>;

/// Disabled by default, enable with set_enabled(true)
class StepLogger {
public:
    StepLogger() = default;

    void set_enabled(bool enabled) { enabled_ = enabled; }
    [[nodiscard]] bool is_enabled() const { return enabled_; }

    void set_callback(StepLogCallback callback) {
        callback_ = std::move(callback);
    }

    /// No-op if disabled
    void log(const StepLogEntry& entry) {
        if (!enabled_) return;

        if (buffer_.size() < max_buffer_size_) {
            buffer_.push_back(entry);
        }

        if (callback_) {
            callback_(entry);
        }

        ++total_entries_;
        if (!entry.accepted()) ++rejected_steps_;
        if (entry.event == StepEvent::RejectedNonFinite) ++nonfinite_steps_;
        max_error_ = std::max(max_error_, entry.error_norm);
    }

    void log(Real time, Real dt, Real error_norm, Real dt_next, StepEvent event) {
        if (!enabled_) return;
        log(StepLogEntry{time, dt, error_norm, dt_next, event});
    }

    [[nodiscard]] const std::vector<StepLogEntry>& buffer() const { return buffer_; }

    void clear_buffer() { buffer_.clear(); }

    [[nodiscard]] std::string to_csv() const {
        std::string result = StepLogEntry::csv_header() + "\n";
        for (const auto& entry : buffer_) {
            result += entry.to_csv() + "\n";
        }
        return result;
    }

    [[nodiscard]] std::size_t total_entries() const { return total_entries_; }
    [[nodiscard]] std::size_t rejected_steps() const { return rejected_steps_; }
    [[nodiscard]] std::size_t nonfinite_steps() const { return nonfinite_steps_; }
    [[nodiscard]] Real max_error() const { return max_error_; }
    [[nodiscard]] Real rejection_rate() const {
        return total_entries_ > 0 ? static_cast<Real>(rejected_steps_) / total_entries_ : 0.0;
    }

    void reset() {
        buffer_.clear();
        total_entries_ = 0;
        rejected_steps_ = 0;
        nonfinite_steps_ = 0;
        max_error_ = 0.0;
    }

    void set_max_buffer_size(std::size_t size) { max_buffer_size_ = size; }

private:
    bool enabled_ = false;
    StepLogCallback callback_;
    std::vector<StepLogEntry> buffer_;
    std::size_t max_buffer_size_ = 10000;

    std::size_t total_entries_ = 0;
    std::size_t rejected_steps_ = 0;
    std::size_t nonfinite_steps_ = 0;
    Real max_error_ = 0.0;
};

}  // namespace stochsim::v1
