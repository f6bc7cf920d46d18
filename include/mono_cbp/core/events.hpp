#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <mutex>
#include <ostream>
#include <string>

namespace mono_cbp::core {

using json = nlohmann::json;

/**
 * JSON-lines event log. One emitter is handed to every component that
 * reports progress; nothing logs through process-wide state.
 * Emission is serialized, so masking workers may share an emitter.
 */
class EventEmitter {
public:
    explicit EventEmitter(std::ostream& out, std::ofstream* log_file = nullptr);

    void run_start(const std::string& run_id, const json& extra);
    void run_end(const std::string& run_id, bool success, const std::string& status,
                 const json& extra = json::object());

    void stage_start(const std::string& run_id, Stage stage, const json& extra = json::object());
    void stage_progress(const std::string& run_id, Stage stage, int current, int total,
                        const std::string& message);
    void stage_end(const std::string& run_id, Stage stage, const std::string& status,
                   const json& extra = json::object());

    void info(const std::string& run_id, const std::string& message,
              const json& extra = json::object());
    void warning(const std::string& run_id, const std::string& message);
    void error(const std::string& run_id, const std::string& message);

    void emit(const json& event);

private:
    json base_event(const std::string& type, const std::string& run_id) const;

    std::ostream& out_;
    std::ofstream* log_file_;
    std::mutex mutex_;
};

} // namespace mono_cbp::core
