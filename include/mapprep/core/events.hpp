#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <functional>
#include <iosfwd>
#include <mutex>
#include <string>
#include <vector>

namespace mapprep::core {

using json = nlohmann::json;

/**
 * Session event log.
 * Writes one JSON object per line to an output stream and an optional log file.
 * Safe to call from worker threads.
 */
class EventLog {
public:
    explicit EventLog(std::ostream* out = nullptr, std::ofstream* log_file = nullptr);

    void emit(const json& event);

    void session_created(const std::string& session_id, SessionKind kind,
                         const std::string& subject_ref, const std::string& user);
    void session_start(const std::string& session_id, SessionKind kind,
                       const std::string& subject_ref);
    void session_end(const std::string& session_id, bool success,
                     const json& extra = json::object());
    void session_error(const std::string& session_id, const std::string& error);
    void session_undone(const std::string& session_id, bool kept);
    void lock_rejected(const std::string& session_id, const std::string& subject_ref,
                       const std::string& message);
    void warning(const std::string& session_id, const std::string& message);

private:
    json base_event(const std::string& type, const std::string& session_id) const;

    std::ostream* out_;
    std::ofstream* log_file_;
    std::mutex mutex_;
};

// Published whenever a subject's status changes through a session.
struct SessionCompleted {
    std::string session_id;
    SessionKind kind = SessionKind::PREPARATION;
    std::string subject_ref;
    SessionStatus status = SessionStatus::UNSTARTED;
    std::string subject_status;
};

class EventBus {
public:
    using Handler = std::function<void(const SessionCompleted&)>;

    void subscribe(Handler handler);
    void publish(const SessionCompleted& event);

private:
    std::mutex mutex_;
    std::vector<Handler> handlers_;
};

} // namespace mapprep::core
