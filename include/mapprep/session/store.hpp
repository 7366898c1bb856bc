#pragma once

#include "mapprep/georeference/control_points.hpp"
#include "mapprep/session/session.hpp"
#include "mapprep/split/splitter.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mapprep::session {

/**
 * Session records plus the canonical per-document inputs (control point
 * groups, segmentations). Every method is one critical section under a
 * single mutex, so lease checks and their updates are atomic. With a file
 * path the store is persisted as JSON after every mutation.
 */
class SessionStore {
public:
  using Mutator = std::function<void(Session&)>;

  explicit SessionStore(fs::path file = {});

  // Assigns an id and gives the new session the edit lease.
  // Throws SessionError LOCKED if any session on the subject holds a live lease.
  Session insert(Session session, Timestamp now, std::chrono::seconds ttl);

  std::optional<Session> find(const std::string& id) const;
  Session get(const std::string& id) const;

  // Input edit by user: refused while a different user's session holds a
  // live lease on the subject; extends the session's own lease.
  Session edit(const std::string& id, const std::string& user, Timestamp now,
               std::chrono::seconds ttl, const Mutator& mutate);

  // Test-and-set of the run lease; the session moves to running/processing.
  Session begin_run(const std::string& id, Timestamp now, std::chrono::seconds ttl);

  Session update(const std::string& id, const Mutator& mutate);
  void erase(const std::string& id);

  std::vector<Session> list(const std::string& subject_ref = {},
                            std::optional<SessionKind> kind = std::nullopt) const;

  // Session (other than exclude_id) currently holding a live lease on the subject.
  std::optional<Session> lease_holder(const std::string& subject_ref, Timestamp now,
                                      const std::string& exclude_id = {}) const;

  void put_control_points(const georeference::ControlPointGroup& group);
  std::optional<georeference::ControlPointGroup> control_points(const std::string& document_ref) const;

  void put_segmentation(const std::string& document_ref, const split::Segmentation& seg);
  std::optional<split::Segmentation> segmentation(const std::string& document_ref) const;

private:
  void load();
  void persist_locked() const;
  Session& at_locked(const std::string& id);
  const Session* live_lease_locked(const std::string& subject_ref, Timestamp now,
                                   const std::string& exclude_id) const;

  mutable std::mutex mutex_;
  fs::path file_;
  uint64_t next_id_ = 1;
  std::map<std::string, Session> sessions_;
  std::map<std::string, georeference::ControlPointGroup> groups_;
  std::map<std::string, split::Segmentation> segmentations_;
};

} // namespace mapprep::session
