#include "mono_cbp/core/events.hpp"
#include "mono_cbp/core/utils.hpp"

namespace mono_cbp::core {

namespace {

void merge_extra(json& event, const json& extra) {
    if (!extra.empty() && extra.is_object()) {
        for (auto& [key, value] : extra.items()) {
            event[key] = value;
        }
    }
}

} // namespace

EventEmitter::EventEmitter(std::ostream& out, std::ofstream* log_file)
    : out_(out), log_file_(log_file) {}

json EventEmitter::base_event(const std::string& type, const std::string& run_id) const {
    return {
        {"type", type},
        {"run_id", run_id},
        {"ts", get_iso_timestamp()}
    };
}

void EventEmitter::emit(const json& event) {
    const std::string line = event.dump();

    std::lock_guard<std::mutex> lock(mutex_);
    out_ << line << "\n";
    out_.flush();

    if (log_file_ && log_file_->is_open()) {
        (*log_file_) << line << "\n";
        log_file_->flush();
    }
}

void EventEmitter::run_start(const std::string& run_id, const json& extra) {
    json event = base_event("run_start", run_id);
    merge_extra(event, extra);
    emit(event);
}

void EventEmitter::run_end(const std::string& run_id, bool success,
                           const std::string& status, const json& extra) {
    json event = base_event("run_end", run_id);
    event["success"] = success;
    event["status"] = status;
    merge_extra(event, extra);
    emit(event);
}

void EventEmitter::stage_start(const std::string& run_id, Stage stage, const json& extra) {
    json event = base_event("stage_start", run_id);
    event["stage"] = stage_to_int(stage);
    event["stage_name"] = stage_to_string(stage);
    merge_extra(event, extra);
    emit(event);
}

void EventEmitter::stage_progress(const std::string& run_id, Stage stage, int current,
                                  int total, const std::string& message) {
    json event = base_event("stage_progress", run_id);
    event["stage"] = stage_to_int(stage);
    event["stage_name"] = stage_to_string(stage);
    event["current"] = current;
    event["total"] = total;
    event["substep"] = message;
    emit(event);
}

void EventEmitter::stage_end(const std::string& run_id, Stage stage,
                             const std::string& status, const json& extra) {
    json event = base_event("stage_end", run_id);
    event["stage"] = stage_to_int(stage);
    event["stage_name"] = stage_to_string(stage);
    event["status"] = status;
    merge_extra(event, extra);
    emit(event);
}

void EventEmitter::info(const std::string& run_id, const std::string& message,
                        const json& extra) {
    json event = base_event("info", run_id);
    event["message"] = message;
    merge_extra(event, extra);
    emit(event);
}

void EventEmitter::warning(const std::string& run_id, const std::string& message) {
    json event = base_event("warning", run_id);
    event["message"] = message;
    emit(event);
}

void EventEmitter::error(const std::string& run_id, const std::string& message) {
    json event = base_event("error", run_id);
    event["message"] = message;
    emit(event);
}

} // namespace mono_cbp::core
