#pragma once

#include "mapprep/core/types.hpp"

#include <map>
#include <string>

namespace mapprep::session {

// Subject status tags a session kind moves a subject through.
struct StatusTags {
  std::string before;
  std::string during;
  std::string after;
};

class StatusVocabulary {
public:
  StatusVocabulary();
  StatusVocabulary(std::map<SessionKind, StatusTags> tags, std::string split_parent);

  const StatusTags& tags(SessionKind kind) const;
  // Status of a document that was split into several children.
  const std::string& split_parent() const { return split_parent_; }

  bool is_in_progress(const std::string& tag) const;

private:
  std::map<SessionKind, StatusTags> tags_;
  std::string split_parent_;
};

} // namespace mapprep::session
