#include "mapprep/core/events.hpp"
#include "mapprep/core/utils.hpp"

#include <iostream>

namespace mapprep::core {

EventLog::EventLog(std::ostream* out, std::ofstream* log_file)
    : out_(out), log_file_(log_file) {}

json EventLog::base_event(const std::string& type, const std::string& session_id) const {
    return {
        {"type", type},
        {"session_id", session_id},
        {"ts", get_iso_timestamp()}
    };
}

void EventLog::emit(const json& event) {
    std::string line = event.dump();

    std::lock_guard<std::mutex> lock(mutex_);
    if (out_) {
        (*out_) << line << "\n";
        out_->flush();
    }
    if (log_file_ && log_file_->is_open()) {
        (*log_file_) << line << "\n";
        log_file_->flush();
    }
}

void EventLog::session_created(const std::string& session_id, SessionKind kind,
                               const std::string& subject_ref, const std::string& user) {
    json event = base_event("session_created", session_id);
    event["kind"] = session_kind_to_string(kind);
    event["subject"] = subject_ref;
    event["user"] = user;
    emit(event);
}

void EventLog::session_start(const std::string& session_id, SessionKind kind,
                             const std::string& subject_ref) {
    json event = base_event("session_start", session_id);
    event["kind"] = session_kind_to_string(kind);
    event["subject"] = subject_ref;
    emit(event);
}

void EventLog::session_end(const std::string& session_id, bool success, const json& extra) {
    json event = base_event("session_end", session_id);
    event["success"] = success;
    if (extra.is_object()) {
        for (auto& [key, value] : extra.items()) {
            event[key] = value;
        }
    }
    emit(event);
}

void EventLog::session_error(const std::string& session_id, const std::string& error) {
    json event = base_event("session_error", session_id);
    event["error"] = error;
    emit(event);
}

void EventLog::session_undone(const std::string& session_id, bool kept) {
    json event = base_event("session_undone", session_id);
    event["kept"] = kept;
    emit(event);
}

void EventLog::lock_rejected(const std::string& session_id, const std::string& subject_ref,
                             const std::string& message) {
    json event = base_event("lock_rejected", session_id);
    event["subject"] = subject_ref;
    event["message"] = message;
    emit(event);
}

void EventLog::warning(const std::string& session_id, const std::string& message) {
    json event = base_event("warning", session_id);
    event["message"] = message;
    emit(event);
}

void EventBus::subscribe(Handler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_.push_back(std::move(handler));
}

void EventBus::publish(const SessionCompleted& event) {
    std::vector<Handler> handlers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handlers = handlers_;
    }
    for (const auto& handler : handlers) {
        handler(event);
    }
}

} // namespace mapprep::core
