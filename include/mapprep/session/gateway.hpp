#pragma once

#include "mapprep/core/types.hpp"

#include <nlohmann/json.hpp>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace mapprep::session {

struct SubjectInfo {
  std::string ref;
  std::string kind;     // document | layer | trim
  std::string title;
  std::string status;
  std::string parent;
  fs::path raster;
};

/**
 * Access to the document/layer resources sessions work on. Implementations
 * must be safe to call from several worker threads.
 */
class ResourceGateway {
public:
  virtual ~ResourceGateway() = default;

  virtual fs::path fetch_raster(const std::string& ref) = 0;
  // Registers raster as the derived resource of `kind` for ref, replacing
  // an existing one of that kind. Returns the derived resource's ref.
  virtual std::string store_derived_raster(const std::string& ref, const fs::path& raster,
                                           const std::string& kind) = 0;
  virtual std::string create_child_subject(const std::string& parent, const fs::path& raster,
                                           const std::string& title) = 0;
  virtual void link(const std::string& parent, const std::string& child, const std::string& kind) = 0;
  virtual std::vector<std::string> linked(const std::string& parent, const std::string& kind) = 0;
  virtual void delete_subject(const std::string& ref) = 0;
  virtual void set_status(const std::string& ref, const std::string& status) = 0;
  virtual SubjectInfo describe(const std::string& ref) = 0;
};

/**
 * Gateway over a directory: rasters are copied under <root>/subjects and
 * the subject registry and links live in <root>/registry.json.
 */
class LocalResourceGateway : public ResourceGateway {
public:
  explicit LocalResourceGateway(fs::path root);

  // Registers an existing raster as a new document subject.
  std::string import_document(const fs::path& raster, const std::string& title,
                              const std::string& status = "unprepared");

  fs::path fetch_raster(const std::string& ref) override;
  std::string store_derived_raster(const std::string& ref, const fs::path& raster,
                                   const std::string& kind) override;
  std::string create_child_subject(const std::string& parent, const fs::path& raster,
                                   const std::string& title) override;
  void link(const std::string& parent, const std::string& child, const std::string& kind) override;
  std::vector<std::string> linked(const std::string& parent, const std::string& kind) override;
  void delete_subject(const std::string& ref) override;
  void set_status(const std::string& ref, const std::string& status) override;
  SubjectInfo describe(const std::string& ref) override;

  std::vector<SubjectInfo> subjects();

private:
  struct Link {
    std::string parent;
    std::string child;
    std::string kind;
  };

  std::string add_subject_locked(const std::string& kind, const fs::path& raster,
                                 const std::string& title, const std::string& status,
                                 const std::string& parent);
  fs::path copy_raster_locked(const std::string& ref, const fs::path& raster);
  SubjectInfo& at_locked(const std::string& ref);
  void load();
  void persist_locked() const;

  std::mutex mutex_;
  fs::path root_;
  uint64_t next_id_ = 1;
  std::map<std::string, SubjectInfo> subjects_;
  std::vector<Link> links_;
};

} // namespace mapprep::session
