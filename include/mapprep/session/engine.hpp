#pragma once

#include "mapprep/core/events.hpp"
#include "mapprep/session/dispatcher.hpp"
#include "mapprep/session/gateway.hpp"
#include "mapprep/session/session.hpp"
#include "mapprep/session/status_vocabulary.hpp"
#include "mapprep/session/store.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace mapprep::session {

// Committed result of a session's operation.
struct RunResult {
  std::vector<std::string> outputs;   // refs of created subjects
  std::string output_sha256;
  std::string note;
  std::string subject_status;         // empty: the kind's "after" tag
};

/**
 * Raster side of the session kinds. run() either commits all of its
 * outputs or throws after removing whatever it created.
 */
class SessionOperations {
public:
  virtual ~SessionOperations() = default;

  virtual RunResult run(const Session& session) = 0;
  // Reverses the side effects of a successful run.
  virtual void undo(const Session& session) = 0;
  virtual ImageBounds image_bounds(const std::string& subject_ref) = 0;
};

struct EngineOptions {
  std::chrono::seconds lock_ttl{600};
  int target_epsg = 3857;
  TransformKind default_transformation = TransformKind::POLY1;
};

/**
 * Session lifecycle: input edits under a lease, runs, undo/redo and
 * reclamation of expired sessions. All methods may be called from
 * several threads; the store serialises lease decisions.
 */
class SessionEngine {
public:
  using Clock = std::function<Timestamp()>;

  SessionEngine(SessionStore& store, ResourceGateway& gateway, SessionOperations& operations,
                const StatusVocabulary& vocabulary, core::EventLog& log, core::EventBus& bus,
                EngineOptions options = {}, Clock clock = {});

  Session create_session(SessionKind kind, const std::string& subject_ref,
                         const std::string& user);

  Session update_control_points(const std::string& id, const std::string& user,
                                const json& feature_collection,
                                std::optional<TransformKind> transformation = std::nullopt);
  Session update_cutlines(const std::string& id, const std::string& user,
                          const std::vector<Cutline>& cutlines);
  Session mark_no_split(const std::string& id, const std::string& user);
  Session update_mask(const std::string& id, const std::string& user, const std::string& wkt);

  // Operation failures are recorded on the returned session, not thrown.
  Session run(const std::string& id);
  Session undo(const std::string& id, bool keep_session = false);
  Session redo(const std::string& id);
  void delete_session(const std::string& id);
  // Removes idle sessions whose lease expired and fails stalled runs in
  // place. Returns the ids of both.
  std::vector<std::string> delete_expired_sessions();

  void submit(const std::string& id, TaskDispatcher& dispatcher);

  std::vector<Session> list(const std::string& subject_ref,
                            std::optional<SessionKind> kind = std::nullopt) const;
  std::optional<Session> find(const std::string& id) const { return store_.find(id); }

private:
  Timestamp now() const { return clock_(); }
  Session require_kind(const std::string& id, SessionKind kind) const;
  void ensure_no_downstream(const Session& s) const;
  std::string stable_status(const Session& s) const;
  std::string run_restore_status(const Session& s) const;
  void restore_subject(const Session& s, const std::string& status);
  void notify(const core::SessionCompleted& event);
  // Never throws: removes outputs the run added, records the failure and
  // restores the subject's status from before the run.
  Session fail_run(const Session& running, const Session& before,
                   const std::vector<std::string>& produced, const std::string& message);

  SessionStore& store_;
  ResourceGateway& gateway_;
  SessionOperations& operations_;
  const StatusVocabulary& vocabulary_;
  core::EventLog& log_;
  core::EventBus& bus_;
  EngineOptions options_;
  Clock clock_;
};

} // namespace mapprep::session
