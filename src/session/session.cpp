#include "mapprep/session/session.hpp"
#include "mapprep/core/errors.hpp"
#include "mapprep/core/utils.hpp"

namespace mapprep::session {

namespace {

json data_to_json(const SessionData& data) {
    return std::visit(detail::Overloaded{
        [](const PreparationData& d) -> json {
            return {
                {"cutlines", split::rings_to_json(d.cutlines)},
                {"divisions", split::rings_to_json(d.divisions)},
                {"split_needed", d.split_needed}
            };
        },
        [](const GeoreferenceData& d) -> json {
            return {
                {"gcps", d.gcps},
                {"epsg", d.epsg},
                {"transformation", transform_kind_to_string(d.transformation)},
                {"output_sha256", d.output_sha256}
            };
        },
        [](const TrimData& d) -> json {
            return {
                {"mask_geometry_wkt", d.mask_geometry_wkt},
                {"output_sha256", d.output_sha256}
            };
        }
    }, data);
}

SessionData data_from_json(SessionKind kind, const json& j) {
    switch (kind) {
        case SessionKind::PREPARATION: {
            PreparationData d;
            if (j.contains("cutlines")) d.cutlines = split::rings_from_json(j.at("cutlines"));
            if (j.contains("divisions")) d.divisions = split::rings_from_json(j.at("divisions"));
            d.split_needed = j.value("split_needed", true);
            return d;
        }
        case SessionKind::GEOREFERENCE: {
            GeoreferenceData d;
            if (j.contains("gcps")) d.gcps = j.at("gcps");
            d.epsg = j.value("epsg", 3857);
            auto kind_value = parse_transform_kind(j.value("transformation", "poly1"));
            if (!kind_value) {
                throw ValidationError("unknown transformation " + j.value("transformation", ""));
            }
            d.transformation = *kind_value;
            d.output_sha256 = j.value("output_sha256", "");
            return d;
        }
        case SessionKind::TRIM:
        default: {
            TrimData d;
            d.mask_geometry_wkt = j.value("mask_geometry_wkt", "");
            d.output_sha256 = j.value("output_sha256", "");
            return d;
        }
    }
}

} // namespace

SessionData default_data(SessionKind kind) {
    switch (kind) {
        case SessionKind::GEOREFERENCE: return GeoreferenceData{};
        case SessionKind::TRIM: return TrimData{};
        case SessionKind::PREPARATION:
        default: return PreparationData{};
    }
}

Session make_session(SessionKind kind, std::string subject_ref, std::string user, Timestamp now) {
    Session s;
    s.kind = kind;
    s.subject_ref = std::move(subject_ref);
    s.user = std::move(user);
    s.created_at = now;
    s.data = default_data(kind);
    return s;
}

std::string output_checksum(const Session& s) {
    if (const auto* g = std::get_if<GeoreferenceData>(&s.data)) return g->output_sha256;
    if (const auto* t = std::get_if<TrimData>(&s.data)) return t->output_sha256;
    return {};
}

json session_to_json(const Session& s) {
    json j = {
        {"id", s.id},
        {"type", session_kind_to_string(s.kind)},
        {"subject", s.subject_ref},
        {"user", s.user},
        {"created_at", core::format_iso_timestamp(s.created_at)},
        {"created_at_ms", core::to_epoch_ms(s.created_at)},
        {"stage", session_stage_to_string(s.stage)},
        {"status", session_status_to_string(s.status)},
        {"note", s.note},
        {"data", data_to_json(s.data)},
        {"outputs", s.outputs},
        {"prior_subject_status", s.prior_subject_status},
        {"run_subject_status", s.run_subject_status},
        {"lock", {
            {"enabled", s.lock.enabled},
            {"holder", s.lock.holder},
            {"expires_at_ms", core::to_epoch_ms(s.lock.expires_at)}
        }}
    };
    if (s.run_at) {
        j["run_at"] = core::format_iso_timestamp(*s.run_at);
        j["run_at_ms"] = core::to_epoch_ms(*s.run_at);
    } else {
        j["run_at"] = nullptr;
    }
    if (s.user_input_duration_s) {
        j["user_input_duration"] = *s.user_input_duration_s;
    } else {
        j["user_input_duration"] = nullptr;
    }
    return j;
}

Session session_from_json(const json& j) {
    Session s;
    s.id = j.at("id").get<std::string>();

    auto kind = parse_session_kind(j.at("type").get<std::string>());
    auto stage = parse_session_stage(j.value("stage", "input"));
    auto status = parse_session_status(j.value("status", "unstarted"));
    if (!kind || !stage || !status) {
        throw ValidationError("session " + s.id + " has an unknown type, stage or status");
    }
    s.kind = *kind;
    s.stage = *stage;
    s.status = *status;

    s.subject_ref = j.value("subject", "");
    s.user = j.value("user", "");
    s.created_at = core::from_epoch_ms(j.value("created_at_ms", static_cast<int64_t>(0)));
    if (j.contains("run_at_ms") && j["run_at_ms"].is_number()) {
        s.run_at = core::from_epoch_ms(j["run_at_ms"].get<int64_t>());
    }
    if (j.contains("user_input_duration") && j["user_input_duration"].is_number()) {
        s.user_input_duration_s = j["user_input_duration"].get<int64_t>();
    }
    s.note = j.value("note", "");
    s.data = data_from_json(s.kind, j.value("data", json::object()));
    s.outputs = j.value("outputs", std::vector<std::string>{});
    s.prior_subject_status = j.value("prior_subject_status", "");
    s.run_subject_status = j.value("run_subject_status", "");
    if (j.contains("lock")) {
        const auto& l = j["lock"];
        s.lock.enabled = l.value("enabled", false);
        s.lock.holder = l.value("holder", "");
        s.lock.expires_at = core::from_epoch_ms(l.value("expires_at_ms", static_cast<int64_t>(0)));
    }
    return s;
}

} // namespace mapprep::session
