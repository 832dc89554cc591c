#include "speckle_track/core/events.hpp"
#include "speckle_track/core/utils.hpp"

#include <iostream>
#include <utility>

namespace speckle_track::core {

namespace {

double seconds_since(std::chrono::steady_clock::time_point t0) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
}

} // namespace

json EventEmitter::record(const std::string& type, const std::string& run_id) {
    return {{"type", type}, {"seq", seq_++}, {"run_id", run_id}, {"ts", get_iso_timestamp()}};
}

json EventEmitter::phase_record(const std::string& type, const std::string& run_id, Phase phase) {
    json event = record(type, run_id);
    event["phase"] = phase_to_int(phase);
    event["phase_name"] = phase_to_string(phase);
    return event;
}

// Payload keys never overwrite the envelope
void EventEmitter::write(json event, const json& extra, std::ostream& out) {
    if (extra.is_object()) {
        for (auto it = extra.begin(); it != extra.end(); ++it) {
            if (!event.contains(it.key())) {
                event[it.key()] = it.value();
            }
        }
    }
    out << event.dump() << '\n';
    out.flush();
}

void EventEmitter::run_start(const std::string& run_id, const json& extra, std::ostream& out) {
    run_started_ = Clock::now();
    phase_started_.clear();
    write(record("run_start", run_id), extra, out);
}

void EventEmitter::run_end(const std::string& run_id, bool success,
                           const std::string& status, std::ostream& out) {
    write(record("run_end", run_id),
          {{"success", success}, {"status", status}, {"elapsed_s", seconds_since(run_started_)}},
          out);
}

void EventEmitter::phase_start(const std::string& run_id, Phase phase, std::ostream& out) {
    phase_started_[phase] = Clock::now();
    write(phase_record("phase_start", run_id, phase), json::object(), out);
}

void EventEmitter::phase_progress(const std::string& run_id, Phase phase, int current,
                                  int total, const std::string& message,
                                  const json& extra, std::ostream& out) {
    json event = phase_record("phase_progress", run_id, phase);
    event["current"] = current;
    event["total"] = total;
    event["progress"] = total > 0 ? static_cast<double>(current) / total : 1.0;
    event["substep"] = message;
    write(std::move(event), extra, out);
}

void EventEmitter::phase_end(const std::string& run_id, Phase phase,
                             const std::string& status, const json& extra, std::ostream& out) {
    json event = phase_record("phase_end", run_id, phase);
    event["status"] = status;
    auto it = phase_started_.find(phase);
    if (it != phase_started_.end()) {
        event["elapsed_s"] = seconds_since(it->second);
        phase_started_.erase(it);
    }
    write(std::move(event), extra, out);
}

void EventEmitter::warning(const std::string& run_id, const std::string& message,
                           std::ostream& out) {
    write(record("warning", run_id), {{"message", message}}, out);
    std::cerr << "[WARN] " << message << std::endl;
}

void EventEmitter::error(const std::string& run_id, const std::string& message,
                         std::ostream& out) {
    write(record("error", run_id), {{"message", message}}, out);
}

} // namespace speckle_track::core
