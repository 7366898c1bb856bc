#pragma once

#include "mapprep/core/types.hpp"
#include "mapprep/split/splitter.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace mapprep::session {

using json = nlohmann::json;

// Edit lease on a subject. An expired lease counts as absent.
struct Lease {
  bool enabled = false;
  std::string holder;
  Timestamp expires_at{};

  bool active(Timestamp now) const { return enabled && now < expires_at; }
};

struct PreparationData {
  std::vector<Cutline> cutlines;
  std::vector<Division> divisions;
  bool split_needed = true;
};

struct GeoreferenceData {
  json gcps = {{"type", "FeatureCollection"}, {"features", json::array()}};
  int epsg = 3857;
  TransformKind transformation = TransformKind::POLY1;
  std::string output_sha256;
};

struct TrimData {
  std::string mask_geometry_wkt;
  std::string output_sha256;
};

using SessionData = std::variant<PreparationData, GeoreferenceData, TrimData>;

namespace detail {

template <typename... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <typename... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

} // namespace detail

SessionData default_data(SessionKind kind);

struct Session {
  std::string id;
  SessionKind kind = SessionKind::PREPARATION;
  std::string subject_ref;
  std::string user;
  Timestamp created_at{};
  std::optional<Timestamp> run_at;
  std::optional<int64_t> user_input_duration_s;
  SessionStage stage = SessionStage::INPUT;
  SessionStatus status = SessionStatus::UNSTARTED;
  std::string note;
  SessionData data;
  std::vector<std::string> outputs;
  // Stable subject status captured before the first run; undo restores it.
  std::string prior_subject_status;
  // Subject status when the current run began; a failed run restores it.
  std::string run_subject_status;
  Lease lock;
};

Session make_session(SessionKind kind, std::string subject_ref, std::string user, Timestamp now);

// Checksum of the committed output for Georeference / Trim sessions, empty otherwise.
std::string output_checksum(const Session& s);

json session_to_json(const Session& s);
Session session_from_json(const json& j);

} // namespace mapprep::session
