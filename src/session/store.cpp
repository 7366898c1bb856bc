#include "mapprep/session/store.hpp"
#include "mapprep/core/errors.hpp"
#include "mapprep/core/utils.hpp"

#include <algorithm>

namespace mapprep::session {

SessionStore::SessionStore(fs::path file) : file_(std::move(file)) {
    if (!file_.empty() && fs::exists(file_)) {
        load();
    }
}

void SessionStore::load() {
    json j;
    try {
        j = json::parse(core::read_text(file_));
    } catch (const json::exception& e) {
        throw IOError("cannot parse session store " + file_.string() + ": " + e.what());
    }

    next_id_ = j.value("next_id", static_cast<uint64_t>(1));
    for (const auto& item : j.value("sessions", json::array())) {
        Session s = session_from_json(item);
        sessions_[s.id] = std::move(s);
    }
    for (const auto& item : j.value("control_points", json::array())) {
        auto group = georeference::ControlPointGroup::from_json(item);
        groups_[group.document_ref()] = std::move(group);
    }
    if (j.contains("segmentations")) {
        for (auto& [doc, seg] : j["segmentations"].items()) {
            segmentations_[doc] = split::segmentation_from_json(seg);
        }
    }
}

void SessionStore::persist_locked() const {
    if (file_.empty()) return;

    json sessions = json::array();
    for (const auto& [id, s] : sessions_) {
        sessions.push_back(session_to_json(s));
    }
    json groups = json::array();
    for (const auto& [doc, g] : groups_) {
        groups.push_back(g.to_json());
    }
    json segs = json::object();
    for (const auto& [doc, seg] : segmentations_) {
        segs[doc] = split::segmentation_to_json(seg);
    }

    json j = {
        {"next_id", next_id_},
        {"sessions", sessions},
        {"control_points", groups},
        {"segmentations", segs}
    };
    core::write_text_atomic(file_, j.dump(2));
}

Session& SessionStore::at_locked(const std::string& id) {
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        throw SessionError(SessionError::Reason::NOT_FOUND, "no session " + id);
    }
    return it->second;
}

const Session* SessionStore::live_lease_locked(const std::string& subject_ref, Timestamp now,
                                               const std::string& exclude_id) const {
    for (const auto& [id, s] : sessions_) {
        if (id == exclude_id || s.subject_ref != subject_ref) continue;
        if (s.lock.active(now)) return &s;
    }
    return nullptr;
}

Session SessionStore::insert(Session session, Timestamp now, std::chrono::seconds ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (const Session* holder = live_lease_locked(session.subject_ref, now, {})) {
        throw SessionError(SessionError::Reason::LOCKED,
                           session.subject_ref + " is locked by session " + holder->id +
                           " (" + holder->lock.holder + ")");
    }

    session.id = std::to_string(next_id_++);
    session.lock = {true, session.user, now + ttl};
    sessions_[session.id] = session;
    persist_locked();
    return session;
}

std::optional<Session> SessionStore::find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) return std::nullopt;
    return it->second;
}

Session SessionStore::get(const std::string& id) const {
    auto s = find(id);
    if (!s) {
        throw SessionError(SessionError::Reason::NOT_FOUND, "no session " + id);
    }
    return *s;
}

Session SessionStore::edit(const std::string& id, const std::string& user, Timestamp now,
                           std::chrono::seconds ttl, const Mutator& mutate) {
    std::lock_guard<std::mutex> lock(mutex_);
    Session& s = at_locked(id);
    if (s.stage != SessionStage::INPUT) {
        throw SessionError(SessionError::Reason::INVALID_TRANSITION,
                           "session " + id + " no longer accepts input (" +
                           session_stage_to_string(s.stage) + ")");
    }
    for (const auto& [other_id, other] : sessions_) {
        if (other_id == id || other.subject_ref != s.subject_ref) continue;
        if (other.lock.active(now) && other.lock.holder != user) {
            throw SessionError(SessionError::Reason::LOCKED,
                               s.subject_ref + " is being edited by " + other.lock.holder);
        }
    }
    if (s.lock.active(now) && s.lock.holder != user) {
        throw SessionError(SessionError::Reason::LOCKED,
                           "session " + id + " is held by " + s.lock.holder);
    }

    Session updated = s;
    mutate(updated);
    updated.lock = {true, user, now + ttl};
    s = updated;
    persist_locked();
    return s;
}

Session SessionStore::begin_run(const std::string& id, Timestamp now, std::chrono::seconds ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    Session& s = at_locked(id);
    if (s.status == SessionStatus::RUNNING) {
        if (s.lock.active(now)) {
            throw SessionError(SessionError::Reason::LOCKED,
                               "session " + id + " is already running for " + s.lock.holder);
        }
        throw SessionError(SessionError::Reason::INVALID_TRANSITION,
                           "session " + id + " stalled while running, reclaim it first");
    }
    if (s.kind == SessionKind::PREPARATION && s.status == SessionStatus::SUCCESS) {
        throw SessionError(SessionError::Reason::INVALID_TRANSITION,
                           "session " + id + " already split its document, undo it first");
    }
    if (const Session* holder = live_lease_locked(s.subject_ref, now, id)) {
        throw SessionError(SessionError::Reason::LOCKED,
                           s.subject_ref + " is locked by session " + holder->id +
                           " (" + holder->lock.holder + ")");
    }

    s.status = SessionStatus::RUNNING;
    s.stage = SessionStage::PROCESSING;
    s.note.clear();
    if (!s.user_input_duration_s) {
        s.user_input_duration_s = std::chrono::duration_cast<std::chrono::seconds>(
            now - s.created_at).count();
    }
    s.run_at = now;
    s.lock = {true, s.user, now + ttl};
    persist_locked();
    return s;
}

Session SessionStore::update(const std::string& id, const Mutator& mutate) {
    std::lock_guard<std::mutex> lock(mutex_);
    Session& s = at_locked(id);
    Session updated = s;
    mutate(updated);
    s = updated;
    persist_locked();
    return s;
}

void SessionStore::erase(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sessions_.erase(id) == 0) {
        throw SessionError(SessionError::Reason::NOT_FOUND, "no session " + id);
    }
    persist_locked();
}

std::vector<Session> SessionStore::list(const std::string& subject_ref,
                                        std::optional<SessionKind> kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Session> out;
    for (const auto& [id, s] : sessions_) {
        if (!subject_ref.empty() && s.subject_ref != subject_ref) continue;
        if (kind && s.kind != *kind) continue;
        out.push_back(s);
    }
    std::sort(out.begin(), out.end(), [](const Session& a, const Session& b) {
        if (a.created_at != b.created_at) return a.created_at < b.created_at;
        return std::stoull(a.id) < std::stoull(b.id);
    });
    return out;
}

std::optional<Session> SessionStore::lease_holder(const std::string& subject_ref, Timestamp now,
                                                  const std::string& exclude_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (const Session* s = live_lease_locked(subject_ref, now, exclude_id)) {
        return *s;
    }
    return std::nullopt;
}

void SessionStore::put_control_points(const georeference::ControlPointGroup& group) {
    std::lock_guard<std::mutex> lock(mutex_);
    groups_[group.document_ref()] = group;
    persist_locked();
}

std::optional<georeference::ControlPointGroup> SessionStore::control_points(
    const std::string& document_ref) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = groups_.find(document_ref);
    if (it == groups_.end()) return std::nullopt;
    return it->second;
}

void SessionStore::put_segmentation(const std::string& document_ref, const split::Segmentation& seg) {
    std::lock_guard<std::mutex> lock(mutex_);
    segmentations_[document_ref] = seg;
    persist_locked();
}

std::optional<split::Segmentation> SessionStore::segmentation(const std::string& document_ref) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = segmentations_.find(document_ref);
    if (it == segmentations_.end()) return std::nullopt;
    return it->second;
}

} // namespace mapprep::session
