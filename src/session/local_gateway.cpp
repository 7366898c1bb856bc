#include "mapprep/core/errors.hpp"
#include "mapprep/core/utils.hpp"
#include "mapprep/session/gateway.hpp"

#include <algorithm>

namespace mapprep::session {

using json = nlohmann::json;

namespace {

// "document:3" -> "document_3"
std::string file_key(const std::string& ref) {
    std::string key = ref;
    std::replace(key.begin(), key.end(), ':', '_');
    return key;
}

} // namespace

LocalResourceGateway::LocalResourceGateway(fs::path root) : root_(std::move(root)) {
    std::error_code ec;
    fs::create_directories(root_ / "subjects", ec);
    if (ec) {
        throw IOError("cannot create " + (root_ / "subjects").string() + ": " + ec.message());
    }
    if (fs::exists(root_ / "registry.json")) {
        load();
    }
}

void LocalResourceGateway::load() {
    json j;
    try {
        j = json::parse(core::read_text(root_ / "registry.json"));
    } catch (const json::exception& e) {
        throw IOError("cannot parse registry: " + std::string(e.what()));
    }
    next_id_ = j.value("next_id", static_cast<uint64_t>(1));
    for (const auto& item : j.value("subjects", json::array())) {
        SubjectInfo info;
        info.ref = item.at("ref").get<std::string>();
        info.kind = item.value("kind", "document");
        info.title = item.value("title", "");
        info.status = item.value("status", "");
        info.parent = item.value("parent", "");
        info.raster = item.value("raster", "");
        subjects_[info.ref] = info;
    }
    for (const auto& item : j.value("links", json::array())) {
        links_.push_back({item.at("parent").get<std::string>(), item.at("child").get<std::string>(),
                          item.at("kind").get<std::string>()});
    }
}

void LocalResourceGateway::persist_locked() const {
    json subjects = json::array();
    for (const auto& [ref, info] : subjects_) {
        subjects.push_back({
            {"ref", info.ref},
            {"kind", info.kind},
            {"title", info.title},
            {"status", info.status},
            {"parent", info.parent},
            {"raster", info.raster.string()}
        });
    }
    json links = json::array();
    for (const auto& l : links_) {
        links.push_back({{"parent", l.parent}, {"child", l.child}, {"kind", l.kind}});
    }
    json j = {{"next_id", next_id_}, {"subjects", subjects}, {"links", links}};
    core::write_text_atomic(root_ / "registry.json", j.dump(2));
}

SubjectInfo& LocalResourceGateway::at_locked(const std::string& ref) {
    auto it = subjects_.find(ref);
    if (it == subjects_.end()) {
        throw IOError("unknown subject " + ref);
    }
    return it->second;
}

fs::path LocalResourceGateway::copy_raster_locked(const std::string& ref, const fs::path& raster) {
    if (!fs::exists(raster)) {
        throw IOError("raster not found: " + raster.string());
    }
    fs::path dst = root_ / "subjects" / (file_key(ref) + raster.extension().string());
    core::copy_file_atomic(raster, dst);
    return dst;
}

std::string LocalResourceGateway::add_subject_locked(const std::string& kind, const fs::path& raster,
                                                     const std::string& title, const std::string& status,
                                                     const std::string& parent) {
    SubjectInfo info;
    info.ref = kind + ":" + std::to_string(next_id_);
    info.kind = kind;
    info.title = title;
    info.status = status;
    info.parent = parent;
    info.raster = copy_raster_locked(info.ref, raster);
    ++next_id_;
    subjects_[info.ref] = info;
    return info.ref;
}

std::string LocalResourceGateway::import_document(const fs::path& raster, const std::string& title,
                                                  const std::string& status) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string ref = add_subject_locked("document", raster, title, status, "");
    persist_locked();
    return ref;
}

fs::path LocalResourceGateway::fetch_raster(const std::string& ref) {
    std::lock_guard<std::mutex> lock(mutex_);
    const SubjectInfo& info = at_locked(ref);
    if (info.raster.empty() || !fs::exists(info.raster)) {
        throw IOError("subject " + ref + " has no raster");
    }
    return info.raster;
}

std::string LocalResourceGateway::store_derived_raster(const std::string& ref, const fs::path& raster,
                                                       const std::string& kind) {
    std::lock_guard<std::mutex> lock(mutex_);
    const SubjectInfo& owner = at_locked(ref);

    for (const auto& l : links_) {
        if (l.parent == ref && l.kind == kind && subjects_.count(l.child)) {
            SubjectInfo& existing = at_locked(l.child);
            fs::path previous = existing.raster;
            existing.raster = copy_raster_locked(existing.ref, raster);
            if (!previous.empty() && previous != existing.raster) {
                std::error_code ec;
                fs::remove(previous, ec);
            }
            persist_locked();
            return existing.ref;
        }
    }

    const std::string derived_kind = kind == "georeference" ? "layer" : kind;
    std::string child = add_subject_locked(derived_kind, raster, owner.title, "", ref);
    links_.push_back({ref, child, kind});
    persist_locked();
    return child;
}

std::string LocalResourceGateway::create_child_subject(const std::string& parent, const fs::path& raster,
                                                       const std::string& title) {
    std::lock_guard<std::mutex> lock(mutex_);
    at_locked(parent);
    std::string child = add_subject_locked("document", raster, title, "", parent);
    persist_locked();
    return child;
}

void LocalResourceGateway::link(const std::string& parent, const std::string& child,
                                const std::string& kind) {
    std::lock_guard<std::mutex> lock(mutex_);
    at_locked(parent);
    at_locked(child);
    for (const auto& l : links_) {
        if (l.parent == parent && l.child == child && l.kind == kind) return;
    }
    links_.push_back({parent, child, kind});
    persist_locked();
}

std::vector<std::string> LocalResourceGateway::linked(const std::string& parent, const std::string& kind) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    for (const auto& l : links_) {
        if (l.parent == parent && l.kind == kind) out.push_back(l.child);
    }
    return out;
}

void LocalResourceGateway::delete_subject(const std::string& ref) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = subjects_.find(ref);
    if (it == subjects_.end()) {
        return;
    }
    if (!it->second.raster.empty()) {
        std::error_code ec;
        fs::remove(it->second.raster, ec);
    }
    subjects_.erase(it);
    links_.erase(std::remove_if(links_.begin(), links_.end(), [&](const Link& l) {
        return l.parent == ref || l.child == ref;
    }), links_.end());
    persist_locked();
}

void LocalResourceGateway::set_status(const std::string& ref, const std::string& status) {
    std::lock_guard<std::mutex> lock(mutex_);
    at_locked(ref).status = status;
    persist_locked();
}

SubjectInfo LocalResourceGateway::describe(const std::string& ref) {
    std::lock_guard<std::mutex> lock(mutex_);
    return at_locked(ref);
}

std::vector<SubjectInfo> LocalResourceGateway::subjects() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SubjectInfo> out;
    for (const auto& [ref, info] : subjects_) {
        out.push_back(info);
    }
    return out;
}

} // namespace mapprep::session
