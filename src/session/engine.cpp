#include "mapprep/session/engine.hpp"
#include "mapprep/core/errors.hpp"
#include "mapprep/georeference/control_points.hpp"
#include "mapprep/split/splitter.hpp"

#include <algorithm>

namespace mapprep::session {

SessionEngine::SessionEngine(SessionStore& store, ResourceGateway& gateway,
                             SessionOperations& operations, const StatusVocabulary& vocabulary,
                             core::EventLog& log, core::EventBus& bus, EngineOptions options,
                             Clock clock)
    : store_(store),
      gateway_(gateway),
      operations_(operations),
      vocabulary_(vocabulary),
      log_(log),
      bus_(bus),
      options_(options),
      clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = [] { return std::chrono::system_clock::now(); };
    }
}

// ─── Input ──────────────────────────────────────────────────────────────

Session SessionEngine::create_session(SessionKind kind, const std::string& subject_ref,
                                      const std::string& user) {
    if (user.empty()) {
        throw ValidationError("session needs a user");
    }
    gateway_.describe(subject_ref);

    const Timestamp t = now();
    Session s = make_session(kind, subject_ref, user, t);

    // Seed the inputs from the document's canonical state.
    if (kind == SessionKind::PREPARATION) {
        if (auto seg = store_.segmentation(subject_ref)) {
            auto& d = std::get<PreparationData>(s.data);
            d.cutlines = seg->cutlines;
            d.divisions = seg->divisions;
            d.split_needed = seg->split_needed;
        }
    } else if (kind == SessionKind::GEOREFERENCE) {
        auto& d = std::get<GeoreferenceData>(s.data);
        d.epsg = options_.target_epsg;
        d.transformation = options_.default_transformation;
        if (auto group = store_.control_points(subject_ref)) {
            d.gcps = group->as_geojson();
            d.epsg = group->crs_epsg();
            d.transformation = group->transformation();
        }
    }

    try {
        s = store_.insert(std::move(s), t, options_.lock_ttl);
    } catch (const SessionError& e) {
        if (e.reason() == SessionError::Reason::LOCKED) {
            log_.lock_rejected("", subject_ref, e.what());
        }
        throw;
    }

    log_.session_created(s.id, kind, subject_ref, user);
    return s;
}

Session SessionEngine::require_kind(const std::string& id, SessionKind kind) const {
    Session s = store_.get(id);
    if (s.kind != kind) {
        throw SessionError(SessionError::Reason::INVALID_TRANSITION,
                           "session " + id + " is a " + session_kind_to_string(s.kind) +
                           " session, not " + session_kind_to_string(kind));
    }
    return s;
}

Session SessionEngine::update_control_points(const std::string& id, const std::string& user,
                                             const json& feature_collection,
                                             std::optional<TransformKind> transformation) {
    Session s = require_kind(id, SessionKind::GEOREFERENCE);
    const auto& current = std::get<GeoreferenceData>(s.data);
    const Timestamp t = now();

    auto group = store_.control_points(s.subject_ref)
        .value_or(georeference::ControlPointGroup(s.subject_ref, current.epsg,
                                                  current.transformation));
    if (transformation) {
        group.set_transformation(*transformation);
    }
    georeference::DiffSummary diff = group.apply_geojson(feature_collection, user, t);

    Session updated = store_.edit(id, user, t, options_.lock_ttl, [&](Session& x) {
        auto& d = std::get<GeoreferenceData>(x.data);
        d.gcps = group.as_geojson();
        d.epsg = group.crs_epsg();
        d.transformation = group.transformation();
    });
    store_.put_control_points(group);

    log_.emit({
        {"type", "control_points_updated"},
        {"session_id", id},
        {"added", diff.added},
        {"updated", diff.updated},
        {"deleted", diff.deleted},
        {"unchanged", diff.unchanged}
    });
    return updated;
}

Session SessionEngine::update_cutlines(const std::string& id, const std::string& user,
                                       const std::vector<Cutline>& cutlines) {
    Session s = require_kind(id, SessionKind::PREPARATION);

    split::Segmentation seg;
    seg.cutlines = cutlines;
    seg.divisions = split::Splitter().generate_divisions(
        cutlines, operations_.image_bounds(s.subject_ref));
    seg.split_needed = true;

    Session updated = store_.edit(id, user, now(), options_.lock_ttl, [&](Session& x) {
        auto& d = std::get<PreparationData>(x.data);
        d.cutlines = seg.cutlines;
        d.divisions = seg.divisions;
        d.split_needed = true;
    });
    store_.put_segmentation(s.subject_ref, seg);
    return updated;
}

Session SessionEngine::mark_no_split(const std::string& id, const std::string& user) {
    Session s = require_kind(id, SessionKind::PREPARATION);

    Session updated = store_.edit(id, user, now(), options_.lock_ttl, [](Session& x) {
        x.data = PreparationData{{}, {}, false};
    });
    store_.put_segmentation(s.subject_ref, split::Segmentation{{}, {}, false});
    return updated;
}

Session SessionEngine::update_mask(const std::string& id, const std::string& user,
                                   const std::string& wkt) {
    require_kind(id, SessionKind::TRIM);
    if (wkt.empty()) {
        throw ValidationError("mask geometry is empty");
    }
    return store_.edit(id, user, now(), options_.lock_ttl, [&](Session& x) {
        std::get<TrimData>(x.data).mask_geometry_wkt = wkt;
    });
}

// ─── Run ────────────────────────────────────────────────────────────────

std::string SessionEngine::stable_status(const Session& s) const {
    const StatusTags& tags = vocabulary_.tags(s.kind);
    if (!s.prior_subject_status.empty()) return s.prior_subject_status;
    return tags.before;
}

std::string SessionEngine::run_restore_status(const Session& s) const {
    if (!s.run_subject_status.empty()) return s.run_subject_status;
    return stable_status(s);
}

void SessionEngine::restore_subject(const Session& s, const std::string& status) {
    try {
        gateway_.set_status(s.subject_ref, status);
    } catch (const std::exception& e) {
        log_.warning(s.id, "cannot restore status of " + s.subject_ref + ": " + e.what());
    }
}

void SessionEngine::notify(const core::SessionCompleted& event) {
    try {
        bus_.publish(event);
    } catch (const std::exception& e) {
        log_.warning(event.session_id, std::string("session subscriber failed: ") + e.what());
    }
}

Session SessionEngine::run(const std::string& id) {
    const Session before = store_.get(id);
    const std::string previous_sha = output_checksum(before);
    const StatusTags& tags = vocabulary_.tags(before.kind);

    Session running;
    try {
        running = store_.begin_run(id, now(), options_.lock_ttl);
    } catch (const SessionError& e) {
        if (e.reason() == SessionError::Reason::LOCKED) {
            log_.lock_rejected(id, before.subject_ref, e.what());
        }
        throw;
    }
    running.run_subject_status.clear();

    std::vector<std::string> produced;
    try {
        const std::string current = gateway_.describe(running.subject_ref).status;
        const std::string stable = vocabulary_.is_in_progress(current) ? tags.before : current;
        running = store_.update(id, [&](Session& x) {
            x.run_subject_status = stable;
            // Undo goes back to the status before the run whose outputs are still live.
            if (x.prior_subject_status.empty() || before.outputs.empty()) {
                x.prior_subject_status = stable;
            }
        });

        gateway_.set_status(running.subject_ref, tags.during);
        log_.session_start(id, running.kind, running.subject_ref);

        RunResult result = operations_.run(running);
        produced = result.outputs;
        const std::string subject_status =
            result.subject_status.empty() ? tags.after : result.subject_status;

        Session done = store_.update(id, [&](Session& x) {
            if (x.status != SessionStatus::RUNNING || x.run_at != running.run_at) {
                throw SessionError(SessionError::Reason::INVALID_TRANSITION,
                                   "session " + id + " was reclaimed while running");
            }
            x.status = SessionStatus::SUCCESS;
            x.stage = SessionStage::FINISHED;
            x.lock = {};
            x.note = result.note;
            x.outputs = result.outputs;
            if (auto* d = std::get_if<GeoreferenceData>(&x.data)) {
                d->output_sha256 = result.output_sha256;
            } else if (auto* d = std::get_if<TrimData>(&x.data)) {
                d->output_sha256 = result.output_sha256;
            }
        });
        gateway_.set_status(running.subject_ref, subject_status);

        if (!previous_sha.empty() && !result.output_sha256.empty() &&
            previous_sha != result.output_sha256) {
            log_.warning(id, "output checksum changed on re-run: " + previous_sha + " -> " +
                             result.output_sha256);
        }

        log_.session_end(id, true, {
            {"outputs", done.outputs},
            {"subject_status", subject_status},
            {"note", done.note}
        });
        notify({id, done.kind, done.subject_ref, done.status, subject_status});
        return done;
    } catch (const std::exception& e) {
        return fail_run(running, before, produced, e.what());
    }
}

Session SessionEngine::fail_run(const Session& running, const Session& before,
                                const std::vector<std::string>& produced,
                                const std::string& message) {
    const std::string& id = running.id;

    // Outputs this run added on top of the last committed ones.
    std::vector<std::string> fresh;
    for (const auto& ref : produced) {
        if (std::find(before.outputs.begin(), before.outputs.end(), ref) == before.outputs.end()) {
            fresh.push_back(ref);
        }
    }
    if (!fresh.empty()) {
        Session partial = running;
        partial.outputs = fresh;
        try {
            operations_.undo(partial);
        } catch (const std::exception& e) {
            log_.warning(id, std::string("cannot remove outputs of failed run: ") + e.what());
        }
    }

    Session failed = running;
    failed.status = SessionStatus::FAILED;
    failed.stage = SessionStage::FINISHED;
    failed.lock = {};
    failed.note = message;
    failed.outputs = before.outputs;
    failed.data = before.data;

    bool owned = true;
    try {
        failed = store_.update(id, [&](Session& x) {
            if (x.run_at != running.run_at) {
                throw SessionError(SessionError::Reason::INVALID_TRANSITION,
                                   "session " + id + " was started again");
            }
            x.status = SessionStatus::FAILED;
            x.stage = SessionStage::FINISHED;
            x.lock = {};
            x.note = message;
            x.outputs = before.outputs;
            x.data = before.data;
        });
    } catch (const std::exception& e) {
        owned = false;
        log_.warning(id, std::string("cannot record failed run: ") + e.what());
    }

    const std::string restored = run_restore_status(running);
    if (owned) {
        restore_subject(failed, restored);
    }

    log_.session_error(id, message);
    log_.session_end(id, false, {{"subject_status", restored}});
    notify({id, failed.kind, failed.subject_ref, failed.status, restored});
    return failed;
}

// ─── Undo / redo ────────────────────────────────────────────────────────

void SessionEngine::ensure_no_downstream(const Session& s) const {
    const Timestamp t = now();
    for (const auto& ref : s.outputs) {
        for (const auto& other : store_.list(ref)) {
            if (other.status == SessionStatus::SUCCESS ||
                other.status == SessionStatus::RUNNING || other.lock.active(t)) {
                throw SessionError(SessionError::Reason::INVALID_TRANSITION,
                                   ref + " is still used by " +
                                   session_kind_to_string(other.kind) + " session " + other.id);
            }
        }
    }
}

Session SessionEngine::undo(const std::string& id, bool keep_session) {
    Session s = store_.get(id);
    if (s.stage != SessionStage::FINISHED) {
        throw SessionError(SessionError::Reason::INVALID_TRANSITION,
                           "session " + id + " is " + session_stage_to_string(s.stage) +
                           ", only finished sessions can be undone");
    }
    if (auto holder = store_.lease_holder(s.subject_ref, now(), id)) {
        if (holder->lock.holder != s.user) {
            log_.lock_rejected(id, s.subject_ref, "locked by session " + holder->id);
            throw SessionError(SessionError::Reason::LOCKED,
                               s.subject_ref + " is locked by session " + holder->id +
                               " (" + holder->lock.holder + ")");
        }
    }

    // A failed re-run keeps the outputs of the last successful one.
    const bool committed = s.status == SessionStatus::SUCCESS || !s.outputs.empty();
    std::string restored;
    if (committed) {
        ensure_no_downstream(s);
        operations_.undo(s);
        restored = stable_status(s);
        gateway_.set_status(s.subject_ref, restored);
    }

    Session result = s;
    if (keep_session) {
        result = store_.update(id, [](Session& x) {
            x.status = SessionStatus::UNSTARTED;
            x.stage = SessionStage::INPUT;
            x.outputs.clear();
            x.note.clear();
            x.lock = {};
        });
    } else {
        store_.erase(id);
    }

    log_.session_undone(id, keep_session);
    if (committed) {
        notify({id, s.kind, s.subject_ref, SessionStatus::UNSTARTED, restored});
    }
    return result;
}

Session SessionEngine::redo(const std::string& id) {
    Session s = store_.get(id);
    if (s.kind == SessionKind::PREPARATION && s.stage == SessionStage::FINISHED) {
        undo(id, true);
    }
    return run(id);
}

void SessionEngine::delete_session(const std::string& id) {
    Session s = store_.get(id);
    if (s.status == SessionStatus::RUNNING) {
        throw SessionError(SessionError::Reason::INVALID_TRANSITION,
                           "session " + id + " is running");
    }
    if (s.stage == SessionStage::FINISHED) {
        undo(id, false);
        return;
    }
    store_.erase(id);
    log_.session_undone(id, false);
}

std::vector<std::string> SessionEngine::delete_expired_sessions() {
    const Timestamp t = now();
    std::vector<std::string> reclaimed;

    for (const auto& s : store_.list()) {
        if (s.stage == SessionStage::FINISHED || !s.lock.enabled || s.lock.active(t)) continue;

        if (s.status == SessionStatus::RUNNING) {
            // The worker may still be alive and write back, so the record stays.
            Session failed;
            try {
                failed = store_.update(s.id, [&](Session& x) {
                    if (x.status != SessionStatus::RUNNING || x.lock.active(t)) {
                        throw SessionError(SessionError::Reason::INVALID_TRANSITION,
                                           "session " + s.id + " is no longer stalled");
                    }
                    x.status = SessionStatus::FAILED;
                    x.stage = SessionStage::FINISHED;
                    x.lock = {};
                    x.note = "lease expired while running";
                });
            } catch (const SessionError&) {
                continue;
            }
            const std::string restored = run_restore_status(failed);
            restore_subject(failed, restored);
            log_.session_error(s.id, failed.note);
            log_.session_end(s.id, false, {{"subject_status", restored}});
            reclaimed.push_back(s.id);
            continue;
        }

        try {
            store_.erase(s.id);
        } catch (const SessionError& e) {
            if (e.reason() != SessionError::Reason::NOT_FOUND) throw;
            continue;
        }
        log_.warning(s.id, "lease expired, session removed");
        reclaimed.push_back(s.id);
    }
    return reclaimed;
}

void SessionEngine::submit(const std::string& id, TaskDispatcher& dispatcher) {
    store_.get(id);
    dispatcher.enqueue(id);
}

std::vector<Session> SessionEngine::list(const std::string& subject_ref,
                                         std::optional<SessionKind> kind) const {
    return store_.list(subject_ref, kind);
}

} // namespace mapprep::session
