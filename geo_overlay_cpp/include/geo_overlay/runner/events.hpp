#pragma once

#include <nlohmann/json.hpp>

#include <fstream>
#include <ostream>
#include <string>

namespace geo_overlay::runner {

/**
 * JSON-lines progress events of a batch render.
 * One object per line on `out` (stdout by default), mirrored into the log
 * file when one is open. Every event carries type, run_id and ts.
 */
class EventEmitter {
public:
    explicit EventEmitter(std::ostream& out, std::ofstream* log_file = nullptr);

    void emit(const nlohmann::json& event);

    void run_start(const std::string& run_id, const nlohmann::json& data);
    void run_end(const std::string& run_id, bool success, const nlohmann::json& data = nlohmann::json::object());

    void item_start(const std::string& run_id, size_t index, size_t total, const std::string& name);
    void item_end(const std::string& run_id, size_t index, const std::string& name,
                  const std::string& status, const nlohmann::json& extra = nlohmann::json::object());

    void warning(const std::string& run_id, const std::string& message);
    void error(const std::string& run_id, const std::string& message);

private:
    nlohmann::json make_event(const char* type, const std::string& run_id) const;
    static void merge(nlohmann::json& event, const nlohmann::json& extra);

    std::ostream& out_;
    std::ofstream* log_file_;
};

} // namespace geo_overlay::runner
