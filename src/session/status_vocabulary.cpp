#include "mapprep/session/status_vocabulary.hpp"
#include "mapprep/core/errors.hpp"

namespace mapprep::session {

StatusVocabulary::StatusVocabulary()
    : StatusVocabulary({
          {SessionKind::PREPARATION, {"unprepared", "splitting", "prepared"}},
          {SessionKind::GEOREFERENCE, {"prepared", "georeferencing", "georeferenced"}},
          {SessionKind::TRIM, {"georeferenced", "trimming", "trimmed"}}
      }, "split") {}

StatusVocabulary::StatusVocabulary(std::map<SessionKind, StatusTags> tags, std::string split_parent)
    : tags_(std::move(tags)), split_parent_(std::move(split_parent)) {
    for (SessionKind kind : {SessionKind::PREPARATION, SessionKind::GEOREFERENCE, SessionKind::TRIM}) {
        if (tags_.find(kind) == tags_.end()) {
            throw ConfigError("status vocabulary has no tags for " + session_kind_to_string(kind));
        }
    }
}

const StatusTags& StatusVocabulary::tags(SessionKind kind) const {
    return tags_.at(kind);
}

bool StatusVocabulary::is_in_progress(const std::string& tag) const {
    for (const auto& [kind, t] : tags_) {
        if (t.during == tag) return true;
    }
    return false;
}

} // namespace mapprep::session
