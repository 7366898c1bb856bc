#include "mapprep/core/errors.hpp"
#include "mapprep/core/events.hpp"
#include "mapprep/session/engine.hpp"
#include "mapprep/session/status_vocabulary.hpp"
#include "mapprep/session/store.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <optional>
#include <sstream>
#include <thread>
#include <vector>

#include <catch2/catch_test_macros.hpp>

using namespace mapprep;
using namespace mapprep::session;

namespace {

class FakeGateway : public ResourceGateway {
public:
  void add(const std::string& ref, const std::string& status) {
    std::lock_guard<std::mutex> lock(mutex_);
    subjects_[ref] = {ref, "document", ref, status, "", "/rasters/" + ref};
  }

  std::string status(const std::string& ref) {
    std::lock_guard<std::mutex> lock(mutex_);
    return subjects_.at(ref).status;
  }

  bool exists(const std::string& ref) {
    std::lock_guard<std::mutex> lock(mutex_);
    return subjects_.count(ref) > 0;
  }

  fs::path fetch_raster(const std::string& ref) override { return describe(ref).raster; }

  std::string store_derived_raster(const std::string& ref, const fs::path& raster,
                                   const std::string& kind) override {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string child = kind + ":" + std::to_string(++counter_);
    subjects_[child] = {child, kind, child, "", ref, raster};
    return child;
  }

  std::string create_child_subject(const std::string& parent, const fs::path& raster,
                                   const std::string& title) override {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string child = "document:" + std::to_string(100 + ++counter_);
    subjects_[child] = {child, "document", title, "", parent, raster};
    return child;
  }

  void link(const std::string&, const std::string&, const std::string&) override {}
  std::vector<std::string> linked(const std::string&, const std::string&) override { return {}; }

  void delete_subject(const std::string& ref) override {
    std::lock_guard<std::mutex> lock(mutex_);
    subjects_.erase(ref);
  }

  // Makes setting ref to status throw once.
  void fail_status_for(const std::string& ref, const std::string& status) {
    std::lock_guard<std::mutex> lock(mutex_);
    failing_status_ = {ref, status};
  }

  void set_status(const std::string& ref, const std::string& status) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (failing_status_.first == ref && failing_status_.second == status) {
      failing_status_ = {};
      throw IOError("registry unavailable");
    }
    auto it = subjects_.find(ref);
    if (it == subjects_.end()) throw IOError("unknown subject " + ref);
    it->second.status = status;
  }

  SubjectInfo describe(const std::string& ref) override {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = subjects_.find(ref);
    if (it == subjects_.end()) throw IOError("unknown subject " + ref);
    return it->second;
  }

private:
  std::mutex mutex_;
  std::map<std::string, SubjectInfo> subjects_;
  std::pair<std::string, std::string> failing_status_;
  int counter_ = 0;
};

class FakeOperations : public SessionOperations {
public:
  explicit FakeOperations(FakeGateway& gateway) : gateway_(gateway) {}

  RunResult run(const Session& s) override {
    ++runs;
    if (during_run) during_run(s);
    if (!fail_with.empty()) throw GeoreferenceError(GeoreferenceError::Reason::IO, fail_with);

    RunResult r;
    if (s.kind == SessionKind::PREPARATION) {
      const auto& d = std::get<PreparationData>(s.data);
      if (d.divisions.size() > 1) {
        for (size_t i = 0; i < d.divisions.size(); ++i) {
          r.outputs.push_back(gateway_.create_child_subject(s.subject_ref, "/tmp/part.png", "part"));
        }
        r.subject_status = "split";
      }
    } else {
      r.outputs.push_back(gateway_.store_derived_raster(
          s.subject_ref, "/tmp/out.tif", session_kind_to_string(s.kind)));
      r.output_sha256 = sha;
    }
    return r;
  }

  void undo(const Session& s) override {
    undone.push_back(s.id);
    for (const auto& ref : s.outputs) gateway_.delete_subject(ref);
  }

  ImageBounds image_bounds(const std::string&) override { return {1000, 800}; }

  std::atomic<int> runs{0};
  std::string fail_with;
  std::string sha = "aaaa";
  std::function<void(const Session&)> during_run;
  std::vector<std::string> undone;

private:
  FakeGateway& gateway_;
};

struct Fixture {
  Timestamp now = std::chrono::system_clock::now();
  SessionStore store;
  FakeGateway gateway;
  FakeOperations operations{gateway};
  StatusVocabulary vocabulary;
  std::ostringstream events;
  core::EventLog log{&events};
  core::EventBus bus;
  std::mutex completed_mutex;
  std::vector<core::SessionCompleted> completed;
  SessionEngine engine{store, gateway, operations, vocabulary, log, bus, EngineOptions{},
                       [this] { return now; }};

  Fixture() {
    gateway.add("document:1", "prepared");
    bus.subscribe([this](const core::SessionCompleted& e) {
      std::lock_guard<std::mutex> lock(completed_mutex);
      completed.push_back(e);
    });
  }

  void advance(int seconds) { now += std::chrono::seconds(seconds); }

  bool logged(const std::string& type) const {
    return events.str().find("\"type\":\"" + type + "\"") != std::string::npos;
  }
};

SessionError::Reason session_reason(const std::function<void()>& fn) {
  try {
    fn();
  } catch (const SessionError& e) {
    return e.reason();
  }
  FAIL("expected a SessionError");
  return SessionError::Reason::NOT_FOUND;
}

json three_points() {
  json features = json::array();
  const int px[3][2] = {{0, 0}, {1000, 0}, {0, 800}};
  const double geo[3][2] = {{7.0, 51.0}, {7.1, 51.0}, {7.0, 50.92}};
  for (int i = 0; i < 3; ++i) {
    features.push_back({
        {"type", "Feature"},
        {"properties", {{"id", "p" + std::to_string(i)}, {"image", {px[i][0], px[i][1]}}}},
        {"geometry", {{"type", "Point"}, {"coordinates", {geo[i][0], geo[i][1]}}}}});
  }
  return {{"type", "FeatureCollection"}, {"features", features}};
}

} // namespace

TEST_CASE("successful_run_finishes_session_and_moves_subject") {
  Fixture f;
  Session s = f.engine.create_session(SessionKind::GEOREFERENCE, "document:1", "alice");
  REQUIRE(s.stage == SessionStage::INPUT);
  REQUIRE(s.lock.active(f.now));

  f.advance(30);
  Session done = f.engine.run(s.id);

  REQUIRE(done.status == SessionStatus::SUCCESS);
  REQUIRE(done.stage == SessionStage::FINISHED);
  REQUIRE_FALSE(done.lock.enabled);
  REQUIRE(done.outputs.size() == 1);
  REQUIRE(done.prior_subject_status == "prepared");
  REQUIRE(done.user_input_duration_s.value() == 30);
  REQUIRE(std::get<GeoreferenceData>(done.data).output_sha256 == "aaaa");
  REQUIRE(f.gateway.status("document:1") == "georeferenced");

  REQUIRE(f.completed.size() == 1);
  REQUIRE(f.completed[0].status == SessionStatus::SUCCESS);
  REQUIRE(f.completed[0].subject_status == "georeferenced");
  REQUIRE(f.logged("session_created"));
  REQUIRE(f.logged("session_start"));
  REQUIRE(f.logged("session_end"));
}

TEST_CASE("failed_run_records_note_and_restores_subject") {
  Fixture f;
  f.operations.fail_with = "warp failed";
  Session s = f.engine.create_session(SessionKind::GEOREFERENCE, "document:1", "alice");

  Session failed = f.engine.run(s.id);

  REQUIRE(failed.status == SessionStatus::FAILED);
  REQUIRE(failed.stage == SessionStage::FINISHED);
  REQUIRE(failed.note.find("warp failed") != std::string::npos);
  REQUIRE_FALSE(failed.lock.enabled);
  REQUIRE(f.gateway.status("document:1") == "prepared");
  REQUIRE(f.logged("session_error"));
  REQUIRE(f.completed.back().status == SessionStatus::FAILED);

  // A failed session can be retried.
  f.operations.fail_with.clear();
  REQUIRE(f.engine.run(s.id).status == SessionStatus::SUCCESS);
}

TEST_CASE("undo_and_delete_are_refused_while_running") {
  Fixture f;
  Session s = f.engine.create_session(SessionKind::GEOREFERENCE, "document:1", "alice");

  std::vector<SessionError::Reason> seen;
  f.operations.during_run = [&](const Session& running) {
    REQUIRE(f.gateway.status("document:1") == "georeferencing");
    seen.push_back(session_reason([&] { f.engine.undo(running.id); }));
    seen.push_back(session_reason([&] { f.engine.delete_session(running.id); }));
    seen.push_back(session_reason([&] { f.engine.run(running.id); }));
  };
  f.engine.run(s.id);

  REQUIRE(seen.size() == 3);
  REQUIRE(seen[0] == SessionError::Reason::INVALID_TRANSITION);
  REQUIRE(seen[1] == SessionError::Reason::INVALID_TRANSITION);
  REQUIRE(seen[2] == SessionError::Reason::LOCKED);
}

TEST_CASE("undo_requires_finished_session") {
  Fixture f;
  Session s = f.engine.create_session(SessionKind::TRIM, "document:1", "alice");
  REQUIRE(session_reason([&] { f.engine.undo(s.id); }) ==
          SessionError::Reason::INVALID_TRANSITION);
  REQUIRE(session_reason([&] { f.engine.undo("404"); }) == SessionError::Reason::NOT_FOUND);
}

TEST_CASE("undo_removes_outputs_and_restores_status") {
  Fixture f;
  Session s = f.engine.create_session(SessionKind::GEOREFERENCE, "document:1", "alice");
  Session done = f.engine.run(s.id);
  const std::string layer = done.outputs.at(0);
  REQUIRE(f.gateway.exists(layer));

  SECTION("delete session") {
    f.engine.undo(s.id);
    REQUIRE_FALSE(f.store.find(s.id));
  }
  SECTION("keep session") {
    Session reset = f.engine.undo(s.id, true);
    REQUIRE(reset.status == SessionStatus::UNSTARTED);
    REQUIRE(reset.stage == SessionStage::INPUT);
    REQUIRE(reset.outputs.empty());
  }

  REQUIRE_FALSE(f.gateway.exists(layer));
  REQUIRE(f.gateway.status("document:1") == "prepared");
  REQUIRE(f.operations.undone == std::vector<std::string>{s.id});
  REQUIRE(f.logged("session_undone"));
}

TEST_CASE("live_lease_blocks_other_sessions") {
  Fixture f;
  Session a = f.engine.create_session(SessionKind::GEOREFERENCE, "document:1", "alice");

  REQUIRE(session_reason([&] {
            f.engine.create_session(SessionKind::GEOREFERENCE, "document:1", "bob");
          }) == SessionError::Reason::LOCKED);
  REQUIRE(f.logged("lock_rejected"));

  // Once alice's lease expires bob may start, and then alice is locked out.
  f.advance(601);
  Session b = f.engine.create_session(SessionKind::GEOREFERENCE, "document:1", "bob");
  REQUIRE(session_reason([&] { f.engine.run(a.id); }) == SessionError::Reason::LOCKED);
  REQUIRE(session_reason([&] {
            f.engine.update_control_points(a.id, "alice", three_points());
          }) == SessionError::Reason::LOCKED);

  REQUIRE(f.engine.run(b.id).status == SessionStatus::SUCCESS);
}

TEST_CASE("overlapping_run_of_one_session_is_locked") {
  Fixture f;
  Session s = f.engine.create_session(SessionKind::GEOREFERENCE, "document:1", "alice");

  std::promise<void> entered;
  std::promise<void> second_done;
  std::shared_future<void> second_done_future = second_done.get_future().share();
  std::atomic<int> entries{0};
  f.operations.during_run = [&](const Session&) {
    if (++entries == 1) {
      entered.set_value();
      second_done_future.wait();
    }
  };

  std::atomic<int> succeeded{0};
  std::thread first([&] {
    if (f.engine.run(s.id).status == SessionStatus::SUCCESS) ++succeeded;
  });

  entered.get_future().wait();
  std::optional<SessionError::Reason> second_reason;
  try {
    if (f.engine.run(s.id).status == SessionStatus::SUCCESS) ++succeeded;
  } catch (const SessionError& e) {
    second_reason = e.reason();
  }
  second_done.set_value();
  first.join();

  REQUIRE(succeeded.load() == 1);
  REQUIRE(f.operations.runs.load() == 1);
  REQUIRE(second_reason.has_value());
  REQUIRE(*second_reason == SessionError::Reason::LOCKED);
  REQUIRE(f.logged("lock_rejected"));
  REQUIRE(f.store.get(s.id).status == SessionStatus::SUCCESS);
}

TEST_CASE("concurrent_runs_of_one_session_run_once") {
  Fixture f;
  Session s = f.engine.create_session(SessionKind::GEOREFERENCE, "document:1", "alice");
  f.operations.during_run = [](const Session&) {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
  };

  std::atomic<int> succeeded{0};
  std::atomic<int> locked{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 4; ++i) {
    threads.emplace_back([&] {
      try {
        if (f.engine.run(s.id).status == SessionStatus::SUCCESS) ++succeeded;
      } catch (const SessionError& e) {
        if (e.reason() == SessionError::Reason::LOCKED) ++locked;
      }
    });
  }
  for (auto& t : threads) t.join();

  // Later runs after the first finished are plain re-runs and succeed too.
  REQUIRE(f.operations.runs.load() == succeeded.load());
  REQUIRE(succeeded.load() + locked.load() == 4);
  REQUIRE(succeeded.load() >= 1);
  REQUIRE(f.store.get(s.id).status == SessionStatus::SUCCESS);
}

TEST_CASE("control_point_edits_update_session_and_document_group") {
  Fixture f;
  Session s = f.engine.create_session(SessionKind::GEOREFERENCE, "document:1", "alice");

  Session updated = f.engine.update_control_points(s.id, "alice", three_points(),
                                                   TransformKind::POLY1);
  const auto& d = std::get<GeoreferenceData>(updated.data);
  REQUIRE(d.gcps["features"].size() == 3);
  REQUIRE(f.store.control_points("document:1")->size() == 3);
  REQUIRE(updated.lock.holder == "alice");

  json bad = three_points();
  bad["features"][1]["geometry"]["coordinates"] = "nowhere";
  REQUIRE_THROWS_AS(f.engine.update_control_points(s.id, "alice", bad), ValidationError);
  REQUIRE(f.store.control_points("document:1")->size() == 3);

  f.engine.run(s.id);
  f.engine.undo(s.id);

  // The document's points survive undo and seed the next session.
  Session next = f.engine.create_session(SessionKind::GEOREFERENCE, "document:1", "bob");
  REQUIRE(std::get<GeoreferenceData>(next.data).gcps["features"].size() == 3);
}

TEST_CASE("redo_warns_when_checksum_changes") {
  Fixture f;
  Session s = f.engine.create_session(SessionKind::GEOREFERENCE, "document:1", "alice");
  f.engine.run(s.id);
  REQUIRE_FALSE(f.logged("warning"));

  f.engine.redo(s.id);
  REQUIRE_FALSE(f.logged("warning"));

  f.operations.sha = "bbbb";
  Session again = f.engine.redo(s.id);
  REQUIRE(again.status == SessionStatus::SUCCESS);
  REQUIRE(f.logged("warning"));
  REQUIRE(again.prior_subject_status == "prepared");
}

TEST_CASE("failed_redo_keeps_previous_layer_undoable") {
  Fixture f;
  Session s = f.engine.create_session(SessionKind::GEOREFERENCE, "document:1", "alice");
  Session done = f.engine.run(s.id);
  const std::string layer = done.outputs.at(0);
  REQUIRE(f.gateway.status("document:1") == "georeferenced");

  f.operations.fail_with = "warp failed";
  Session failed = f.engine.redo(s.id);
  REQUIRE(failed.status == SessionStatus::FAILED);
  REQUIRE(failed.outputs == std::vector<std::string>{layer});
  REQUIRE(std::get<GeoreferenceData>(failed.data).output_sha256 == "aaaa");
  REQUIRE(f.gateway.status("document:1") == "georeferenced");
  REQUIRE(f.gateway.exists(layer));

  f.engine.undo(s.id);
  REQUIRE_FALSE(f.store.find(s.id));
  REQUIRE_FALSE(f.gateway.exists(layer));
  REQUIRE(f.gateway.status("document:1") == "prepared");
}

TEST_CASE("retry_after_failed_redo_keeps_first_prior_status") {
  Fixture f;
  Session s = f.engine.create_session(SessionKind::GEOREFERENCE, "document:1", "alice");
  f.engine.run(s.id);

  f.operations.fail_with = "warp failed";
  f.engine.redo(s.id);
  f.operations.fail_with.clear();
  Session again = f.engine.redo(s.id);

  REQUIRE(again.status == SessionStatus::SUCCESS);
  REQUIRE(again.prior_subject_status == "prepared");
  f.engine.undo(s.id);
  REQUIRE(f.gateway.status("document:1") == "prepared");
}

TEST_CASE("stalled_run_is_failed_by_sweep_and_cleaned_up") {
  Fixture f;
  Session s = f.engine.create_session(SessionKind::GEOREFERENCE, "document:1", "alice");

  std::vector<std::string> reclaimed;
  f.operations.during_run = [&](const Session&) {
    f.advance(601);
    reclaimed = f.engine.delete_expired_sessions();
  };
  Session result;
  REQUIRE_NOTHROW(result = f.engine.run(s.id));

  REQUIRE(reclaimed == std::vector<std::string>{s.id});
  REQUIRE(result.status == SessionStatus::FAILED);
  REQUIRE(result.stage == SessionStage::FINISHED);
  REQUIRE(result.outputs.empty());
  REQUIRE(f.operations.undone.size() == 1);

  auto stored = f.store.find(s.id);
  REQUIRE(stored);
  REQUIRE(stored->status == SessionStatus::FAILED);
  REQUIRE_FALSE(stored->lock.enabled);
  REQUIRE(f.gateway.status("document:1") == "prepared");
  REQUIRE(f.logged("session_error"));

  // The failed session can be run again once reclaimed.
  f.operations.during_run = nullptr;
  REQUIRE(f.engine.run(s.id).status == SessionStatus::SUCCESS);
}

TEST_CASE("status_failure_after_commit_removes_new_outputs") {
  Fixture f;
  Session s = f.engine.create_session(SessionKind::GEOREFERENCE, "document:1", "alice");
  f.operations.during_run = [&](const Session&) {
    f.gateway.fail_status_for("document:1", "georeferenced");
  };

  Session result;
  REQUIRE_NOTHROW(result = f.engine.run(s.id));
  REQUIRE(result.status == SessionStatus::FAILED);
  REQUIRE(result.outputs.empty());
  REQUIRE(f.operations.undone.size() == 1);
  REQUIRE(f.store.get(s.id).status == SessionStatus::FAILED);
  REQUIRE(f.gateway.status("document:1") == "prepared");
}

TEST_CASE("submit_runs_session_on_worker_pool") {
  Fixture f;
  Session s = f.engine.create_session(SessionKind::GEOREFERENCE, "document:1", "alice");

  std::mutex mutex;
  std::vector<std::string> errors;
  WorkerPool pool(
      2, [&](const std::string& id) { f.engine.run(id); },
      [&](const std::string& id, const std::string& error) {
        std::lock_guard<std::mutex> lock(mutex);
        errors.push_back(id + ": " + error);
      });

  f.engine.submit(s.id, pool);
  REQUIRE(session_reason([&] { f.engine.submit("404", pool); }) ==
          SessionError::Reason::NOT_FOUND);
  pool.wait_idle();

  REQUIRE(errors.empty());
  REQUIRE(f.store.get(s.id).status == SessionStatus::SUCCESS);
  REQUIRE(f.gateway.status("document:1") == "georeferenced");
}

TEST_CASE("preparation_split_and_redo") {
  Fixture f;
  f.gateway.add("document:2", "unprepared");
  Session s = f.engine.create_session(SessionKind::PREPARATION, "document:2", "alice");

  Session edited = f.engine.update_cutlines(s.id, "alice", {{{500.0, 0.0}, {500.0, 800.0}}});
  REQUIRE(std::get<PreparationData>(edited.data).divisions.size() == 2);
  REQUIRE(f.store.segmentation("document:2")->divisions.size() == 2);

  REQUIRE_THROWS_AS(f.engine.update_cutlines(s.id, "alice", {{{500.0, 0.0}, {500.0, 900.0}}}),
                    SplitError);

  Session done = f.engine.run(s.id);
  REQUIRE(done.outputs.size() == 2);
  REQUIRE(f.gateway.status("document:2") == "split");

  // A finished split cannot simply be run again.
  REQUIRE(session_reason([&] { f.engine.run(s.id); }) ==
          SessionError::Reason::INVALID_TRANSITION);

  Session redone = f.engine.redo(s.id);
  REQUIRE(redone.status == SessionStatus::SUCCESS);
  REQUIRE(f.operations.undone.size() == 1);
  for (const auto& ref : done.outputs) {
    REQUIRE_FALSE(f.gateway.exists(ref));
  }
}

TEST_CASE("undo_refused_while_outputs_are_in_use") {
  Fixture f;
  f.gateway.add("document:2", "unprepared");
  Session prep = f.engine.create_session(SessionKind::PREPARATION, "document:2", "alice");
  f.engine.update_cutlines(prep.id, "alice", {{{500.0, 0.0}, {500.0, 800.0}}});
  Session done = f.engine.run(prep.id);

  const std::string child = done.outputs.at(0);
  Session georef = f.engine.create_session(SessionKind::GEOREFERENCE, child, "bob");

  REQUIRE(session_reason([&] { f.engine.undo(prep.id); }) ==
          SessionError::Reason::INVALID_TRANSITION);

  f.engine.delete_session(georef.id);
  REQUIRE_NOTHROW(f.engine.undo(prep.id));
  REQUIRE(f.gateway.status("document:2") == "unprepared");
}

TEST_CASE("no_split_preparation_marks_document_prepared") {
  Fixture f;
  f.gateway.add("document:3", "unprepared");
  Session s = f.engine.create_session(SessionKind::PREPARATION, "document:3", "alice");
  f.engine.mark_no_split(s.id, "alice");

  Session done = f.engine.run(s.id);
  REQUIRE(done.status == SessionStatus::SUCCESS);
  REQUIRE(done.outputs.empty());
  REQUIRE(f.gateway.status("document:3") == "prepared");
}

TEST_CASE("expired_sessions_are_removed") {
  Fixture f;
  Session idle = f.engine.create_session(SessionKind::GEOREFERENCE, "document:1", "alice");
  f.gateway.add("document:2", "unprepared");
  Session finished = f.engine.create_session(SessionKind::PREPARATION, "document:2", "bob");
  f.engine.mark_no_split(finished.id, "bob");
  f.engine.run(finished.id);

  REQUIRE(f.engine.delete_expired_sessions().empty());

  f.advance(601);
  auto removed = f.engine.delete_expired_sessions();
  REQUIRE(removed == std::vector<std::string>{idle.id});
  REQUIRE_FALSE(f.store.find(idle.id));
  REQUIRE(f.store.find(finished.id));
  REQUIRE(f.gateway.status("document:1") == "prepared");
}

TEST_CASE("mask_edit_requires_geometry") {
  Fixture f;
  Session s = f.engine.create_session(SessionKind::TRIM, "document:1", "alice");
  REQUIRE_THROWS_AS(f.engine.update_mask(s.id, "alice", ""), ValidationError);

  Session updated = f.engine.update_mask(s.id, "alice", "POLYGON((0 0, 10 0, 10 10, 0 0))");
  REQUIRE(std::get<TrimData>(updated.data).mask_geometry_wkt.rfind("POLYGON", 0) == 0);

  REQUIRE(session_reason([&] { f.engine.update_cutlines(s.id, "alice", {}); }) ==
          SessionError::Reason::INVALID_TRANSITION);
}

TEST_CASE("list_filters_by_subject_and_kind") {
  Fixture f;
  f.gateway.add("document:2", "unprepared");
  f.engine.create_session(SessionKind::GEOREFERENCE, "document:1", "alice");
  f.engine.create_session(SessionKind::PREPARATION, "document:2", "alice");

  REQUIRE(f.engine.list("document:1").size() == 1);
  REQUIRE(f.engine.list("document:2", SessionKind::GEOREFERENCE).empty());
  REQUIRE(f.engine.list("").size() == 2);
}
