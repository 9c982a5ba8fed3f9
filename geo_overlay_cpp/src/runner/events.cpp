#include "geo_overlay/runner/events.hpp"
#include "geo_overlay/core/utils.hpp"

namespace geo_overlay::runner {

EventEmitter::EventEmitter(std::ostream& out, std::ofstream* log_file)
    : out_(out), log_file_(log_file) {}

nlohmann::json EventEmitter::make_event(const char* type, const std::string& run_id) const {
    nlohmann::json event;
    event["type"] = type;
    event["run_id"] = run_id;
    event["ts"] = core::get_iso_timestamp();
    return event;
}

void EventEmitter::merge(nlohmann::json& event, const nlohmann::json& extra) {
    if (extra.empty() || !extra.is_object()) return;
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
}

void EventEmitter::emit(const nlohmann::json& event) {
    const std::string line = event.dump();
    out_ << line << std::endl;

    if (log_file_ && log_file_->is_open()) {
        (*log_file_) << line << std::endl;
    }
}

void EventEmitter::run_start(const std::string& run_id, const nlohmann::json& data) {
    auto event = make_event("run_start", run_id);
    merge(event, data);
    emit(event);
}

void EventEmitter::run_end(const std::string& run_id, bool success, const nlohmann::json& data) {
    auto event = make_event("run_end", run_id);
    event["success"] = success;
    event["status"] = success ? "ok" : "partial";
    merge(event, data);
    emit(event);
}

void EventEmitter::item_start(const std::string& run_id, size_t index, size_t total,
                              const std::string& name) {
    auto event = make_event("item_start", run_id);
    event["index"] = index;
    event["total"] = total;
    event["name"] = name;
    emit(event);
}

void EventEmitter::item_end(const std::string& run_id, size_t index, const std::string& name,
                            const std::string& status, const nlohmann::json& extra) {
    auto event = make_event("item_end", run_id);
    event["index"] = index;
    event["name"] = name;
    event["status"] = status;
    merge(event, extra);
    emit(event);
}

void EventEmitter::warning(const std::string& run_id, const std::string& message) {
    auto event = make_event("warning", run_id);
    event["message"] = message;
    emit(event);
}

void EventEmitter::error(const std::string& run_id, const std::string& message) {
    auto event = make_event("error", run_id);
    event["message"] = message;
    emit(event);
}

} // namespace geo_overlay::runner
