#pragma once

#include "types.hpp"
#include <chrono>
#include <map>
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

namespace speckle_track::core {

using json = nlohmann::json;

// JSON-lines event log. Every record carries "type", "seq", "run_id" and "ts";
// phase_end also reports the seconds elapsed since the matching phase_start.
class EventEmitter {
public:
    EventEmitter() = default;

    void run_start(const std::string& run_id, const json& extra, std::ostream& out);
    void run_end(const std::string& run_id, bool success, const std::string& status, std::ostream& out);

    void phase_start(const std::string& run_id, Phase phase, std::ostream& out);
    void phase_progress(const std::string& run_id, Phase phase, int current, int total,
                        const std::string& message, const json& extra, std::ostream& out);
    void phase_end(const std::string& run_id, Phase phase, const std::string& status,
                   const json& extra, std::ostream& out);

    void warning(const std::string& run_id, const std::string& message, std::ostream& out);
    void error(const std::string& run_id, const std::string& message, std::ostream& out);

    long events_written() const { return seq_; }

private:
    using Clock = std::chrono::steady_clock;

    json record(const std::string& type, const std::string& run_id);
    json phase_record(const std::string& type, const std::string& run_id, Phase phase);
    void write(json event, const json& extra, std::ostream& out);

    long seq_ = 0;
    Clock::time_point run_started_{};
    std::map<Phase, Clock::time_point> phase_started_;
};

} // namespace speckle_track::core
