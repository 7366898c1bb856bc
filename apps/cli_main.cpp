#include "mapprep/config/configuration.hpp"
#include "mapprep/core/errors.hpp"
#include "mapprep/core/events.hpp"
#include "mapprep/core/types.hpp"
#include "mapprep/core/utils.hpp"
#include "mapprep/georeference/control_points.hpp"
#include "mapprep/georeference/georeferencer.hpp"
#include "mapprep/session/dispatcher.hpp"
#include "mapprep/session/engine.hpp"
#include "mapprep/session/gateway.hpp"
#include "mapprep/session/raster_operations.hpp"
#include "mapprep/session/status_vocabulary.hpp"
#include "mapprep/session/store.hpp"
#include "mapprep/split/splitter.hpp"

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <streambuf>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;
using namespace mapprep;

static void print_json(const json& j) {
    std::cout << j.dump(2) << std::endl;
}

static int print_error(const std::string& message) {
    print_json({{"ok", false}, {"error", message}});
    return 1;
}

static std::string read_stdin() {
    std::ostringstream ss;
    ss << std::cin.rdbuf();
    return ss.str();
}

// Inline JSON, or @file to read it from a file.
static json parse_json_arg(const std::string& value) {
    std::string text = value;
    if (!value.empty() && value[0] == '@') {
        text = core::read_text(value.substr(1));
    }
    try {
        return json::parse(text);
    } catch (const json::exception& e) {
        throw ValidationError(std::string("invalid JSON argument: ") + e.what());
    }
}

static json session_summary(const session::Session& s) {
    json j = session::session_to_json(s);
    j.erase("data");
    return j;
}

// ============================================================================
// Application wiring
// ============================================================================
class TeeBuf : public std::streambuf {
public:
    TeeBuf(std::streambuf* a, std::streambuf* b) : a_(a), b_(b) {}

protected:
    int overflow(int c) override {
        if (c == EOF) return EOF;
        const int ra = a_ ? a_->sputc(static_cast<char>(c)) : c;
        const int rb = b_ ? b_->sputc(static_cast<char>(c)) : c;
        return (ra == EOF || rb == EOF) ? EOF : c;
    }

    int sync() override {
        int ra = a_ ? a_->pubsync() : 0;
        int rb = b_ ? b_->pubsync() : 0;
        return (ra == 0 && rb == 0) ? 0 : -1;
    }

private:
    std::streambuf* a_;
    std::streambuf* b_;
};

struct App {
    config::Config cfg;
    fs::path base_dir;
    std::ofstream events_file;
    std::unique_ptr<TeeBuf> tee;
    std::unique_ptr<std::ostream> events_out;
    std::unique_ptr<core::EventLog> log;
    core::EventBus bus;
    session::StatusVocabulary vocabulary;
    std::unique_ptr<session::LocalResourceGateway> gateway;
    std::unique_ptr<session::SessionStore> store;
    std::unique_ptr<session::RasterOperations> operations;
    std::unique_ptr<session::SessionEngine> engine;

    explicit App(const std::string& config_arg) {
        fs::path config_path = config_arg.empty() ? fs::path("mapprep.yaml") : fs::path(config_arg);
        if (fs::exists(config_path)) {
            cfg = config::Config::load(config_path);
            base_dir = fs::absolute(config_path).parent_path();
        } else if (!config_arg.empty()) {
            throw ConfigError("Config file not found: " + config_arg);
        } else {
            base_dir = fs::current_path();
        }
        cfg.validate();

        // Events go to stdout and, when configured, are mirrored to a file.
        std::ostream* out = &std::cout;
        if (!cfg.logging.events_file.empty()) {
            fs::path p = cfg.resolve(base_dir, cfg.logging.events_file);
            if (p.has_parent_path()) fs::create_directories(p.parent_path());
            events_file.open(p, std::ios::app);
            if (!events_file) {
                throw IOError("cannot open events file " + p.string());
            }
            tee = std::make_unique<TeeBuf>(std::cout.rdbuf(), events_file.rdbuf());
            events_out = std::make_unique<std::ostream>(tee.get());
            out = events_out.get();
        }
        log = std::make_unique<core::EventLog>(out);

        gateway = std::make_unique<session::LocalResourceGateway>(
            cfg.resolve(base_dir, cfg.paths.data_dir));
        store = std::make_unique<session::SessionStore>(
            cfg.resolve(base_dir, cfg.paths.session_store));
        operations = std::make_unique<session::RasterOperations>(cfg, base_dir, *gateway, vocabulary);

        session::EngineOptions options;
        options.lock_ttl = std::chrono::seconds(cfg.session.lock_ttl_seconds);
        options.target_epsg = cfg.georeference.target_epsg;
        options.default_transformation =
            parse_transform_kind(cfg.georeference.default_transformation).value_or(TransformKind::POLY1);
        engine = std::make_unique<session::SessionEngine>(*store, *gateway, *operations, vocabulary,
                                                          *log, bus, options);
    }
};

static std::optional<SessionKind> parse_type_arg(const std::string& value) {
    if (value.empty() || value == "all") return std::nullopt;
    auto kind = parse_session_kind(value);
    if (!kind) {
        throw ValidationError("invalid type '" + value + "', expected preparation|georeference|trim|all");
    }
    return kind;
}

static TransformKind parse_transformation_arg(const std::string& value, TransformKind fallback) {
    if (value.empty()) return fallback;
    auto kind = parse_transform_kind(value);
    if (!kind) {
        throw ValidationError("invalid transformation '" + value + "', expected poly|poly1|poly2|poly3|tps");
    }
    return *kind;
}

// ============================================================================
// get-schema
// ============================================================================
int cmd_get_schema() {
    std::cout << config::get_schema_json() << std::endl;
    return 0;
}

// ============================================================================
// validate-config --path <path> | --yaml <yaml> | --stdin
// ============================================================================
int cmd_validate_config(const std::string& path, const std::string& yaml_arg, bool use_stdin,
                        bool strict_exit) {
    json result;
    result["valid"] = false;
    result["errors"] = json::array();
    if (!path.empty()) result["path"] = path;

    try {
        std::string yaml_text;
        if (!path.empty()) {
            yaml_text = core::read_text(path);
        } else if (use_stdin) {
            yaml_text = read_stdin();
        } else {
            yaml_text = yaml_arg;
        }
        config::Config cfg = config::Config::from_yaml(YAML::Load(yaml_text));
        cfg.validate();
        result["valid"] = true;
    } catch (const std::exception& e) {
        result["errors"].push_back(e.what());
    }

    print_json(result);
    if (strict_exit) {
        return result["valid"].get<bool>() ? 0 : 1;
    }
    return 0;
}

// ============================================================================
// import <raster> [--title T] [--status S]
// ============================================================================
int cmd_import(App& app, const std::string& raster, const std::string& title,
               const std::string& status) {
    std::string ref = app.gateway->import_document(
        raster, title.empty() ? fs::path(raster).stem().string() : title,
        status.empty() ? app.vocabulary.tags(SessionKind::PREPARATION).before : status);
    print_json({{"ok", true}, {"ref", ref}});
    return 0;
}

int cmd_subjects(App& app) {
    json items = json::array();
    for (const auto& s : app.gateway->subjects()) {
        items.push_back({
            {"ref", s.ref},
            {"kind", s.kind},
            {"title", s.title},
            {"status", s.status},
            {"parent", s.parent},
            {"raster", s.raster.string()}
        });
    }
    print_json({{"ok", true}, {"subjects", items}});
    return 0;
}

// ============================================================================
// divisions <image> --cutlines JSON
// ============================================================================
int cmd_divisions(const std::string& image, const std::string& cutlines_arg) {
    std::vector<Cutline> cutlines;
    if (!cutlines_arg.empty()) {
        cutlines = split::rings_from_json(parse_json_arg(cutlines_arg));
    }
    split::Splitter splitter;
    auto divisions = splitter.preview(image, cutlines);
    ImageBounds bounds = split::Splitter::read_bounds(image);

    print_json({
        {"ok", true},
        {"width", bounds.width},
        {"height", bounds.height},
        {"divisions", split::rings_to_json(divisions)}
    });
    return 0;
}

// ============================================================================
// georeference --source S (--points-file P | --gcps JSON) [--transformation T] [--vrt]
// ============================================================================
int cmd_georeference(App& app, const std::string& source, const std::string& points_file,
                     const std::string& gcps_arg, const std::string& transformation, bool vrt) {
    TransformKind fallback = parse_transform_kind(app.cfg.georeference.default_transformation)
                                 .value_or(TransformKind::POLY1);
    TransformKind kind = parse_transformation_arg(transformation, fallback);

    georeference::ControlPointGroup group;
    if (!points_file.empty()) {
        group = georeference::ControlPointGroup::from_points_file(points_file, kind);
    } else if (!gcps_arg.empty()) {
        group = georeference::ControlPointGroup::from_geojson(
            parse_json_arg(gcps_arg), fs::path(source).stem().string(),
            app.cfg.georeference.target_epsg, kind);
    } else {
        throw ValidationError("georeference requires --points-file or --gcps");
    }

    georeference::Georeferencer georeferencer(app.operations->georeference_options());
    georeferencer.load_control_points(group);
    fs::path out = georeferencer.georeference(
        source, vrt ? OutputFormat::PREVIEW : OutputFormat::FINAL, app.cfg.georeference.overviews);

    const auto& points = georeferencer.control_points();
    print_json({
        {"ok", true},
        {"output", out.string()},
        {"transformation", transform_kind_to_string(georeferencer.resolved_transformation())},
        {"points", points.size()},
        {"rms_error", georeferencer.transform().rms_error(points)},
        {"residuals", georeferencer.transform().residuals(points)}
    });
    return 0;
}

// ============================================================================
// Session commands
// ============================================================================
int cmd_create(App& app, const std::string& type, const std::string& docid,
               const std::string& user) {
    auto kind = parse_type_arg(type);
    if (!kind) throw ValidationError("create requires --type preparation|georeference|trim");
    auto s = app.engine->create_session(*kind, docid, user);
    print_json({{"ok", true}, {"session", session::session_to_json(s)}});
    return 0;
}

int cmd_run(App& app, const std::string& pk, bool queued) {
    session::Session s;
    if (queued) {
        session::WorkerPool pool(app.cfg.runtime.workers,
                                 [&](const std::string& id) { app.engine->run(id); },
                                 [](const std::string& id, const std::string& error) {
                                     std::cerr << "Error: session " << id << ": " << error << std::endl;
                                 });
        app.engine->submit(pk, pool);
        pool.wait_idle();
        pool.shutdown();
        s = app.store->get(pk);
    } else {
        s = app.engine->run(pk);
    }
    print_json({{"ok", s.status == SessionStatus::SUCCESS}, {"session", session_summary(s)}});
    return s.status == SessionStatus::SUCCESS ? 0 : 2;
}

int cmd_list(App& app, const std::string& docid, const std::string& type) {
    auto kind = parse_type_arg(type);
    json items = json::array();
    for (const auto& s : app.engine->list(docid, kind)) {
        items.push_back(session_summary(s));
    }
    print_json({{"ok", true}, {"sessions", items}});
    return 0;
}

int cmd_delete_expired(App& app) {
    auto removed = app.engine->delete_expired_sessions();
    print_json({{"ok", true}, {"removed", removed}});
    return 0;
}

// ============================================================================
// Main
// ============================================================================
void print_usage() {
    std::cout << "Usage: mapprep_cli <command> [options] [--config mapprep.yaml]\n"
              << "\nCommands:\n"
              << "  get-schema                      Print JSON schema for config\n"
              << "  validate-config (--path P | --yaml Y | --stdin) [--strict-exit-codes]\n"
              << "  import <raster> [--title T]     Register a scanned document\n"
              << "  subjects                        List registered documents and layers\n"
              << "  divisions <image> [--cutlines JSON|@file]  Preview divisions\n"
              << "  georeference --source S (--points-file P | --gcps JSON|@file)\n"
              << "               [--transformation poly|poly1|poly2|poly3|tps] [--vrt]\n"
              << "  create --type T --docid REF --user U\n"
              << "  set-cutlines --pk ID --user U --cutlines JSON|@file\n"
              << "  no-split --pk ID --user U\n"
              << "  set-gcps --pk ID --user U --gcps JSON|@file [--transformation T]\n"
              << "  set-mask --pk ID --user U --wkt WKT\n"
              << "  run --pk ID [--queue]           Run a session\n"
              << "  undo --pk ID [--keep]           Undo a finished session\n"
              << "  redo --pk ID                    Re-run a session\n"
              << "  delete --pk ID                  Delete a session\n"
              << "  list [--docid REF] [--type preparation|georeference|trim|all]\n"
              << "  delete-expired                  Remove sessions with expired leases\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    std::string command = argv[1];

    auto get_arg = [&](const char* name, const char* short_name = nullptr) -> std::string {
        for (int i = 2; i < argc - 1; ++i) {
            if (std::strcmp(argv[i], name) == 0 || (short_name && std::strcmp(argv[i], short_name) == 0)) {
                return argv[i + 1];
            }
        }
        return "";
    };

    auto has_flag = [&](const char* name) -> bool {
        for (int i = 2; i < argc; ++i) {
            if (std::strcmp(argv[i], name) == 0) return true;
        }
        return false;
    };

    auto get_positional = [&](int pos) -> std::string {
        int count = 0;
        for (int i = 2; i < argc; ++i) {
            if (argv[i][0] != '-') {
                if (count == pos) return argv[i];
                ++count;
            } else if (i + 1 < argc && argv[i + 1][0] != '-') {
                ++i; // Skip argument value
            }
        }
        return "";
    };

    auto require_arg = [&](const char* name) -> std::string {
        std::string value = get_arg(name);
        if (value.empty()) {
            throw ValidationError(command + " requires " + name);
        }
        return value;
    };

    if (command == "get-schema") {
        return cmd_get_schema();
    }

    if (command == "validate-config") {
        std::string path = get_arg("--path");
        std::string yaml = get_arg("--yaml");
        bool use_stdin = has_flag("--stdin");
        if (path.empty() && yaml.empty() && !use_stdin) {
            std::cerr << "validate-config requires --path, --yaml, or --stdin\n";
            return 1;
        }
        return cmd_validate_config(path, yaml, use_stdin, has_flag("--strict-exit-codes"));
    }

    try {
        if (command == "divisions") {
            std::string image = get_positional(0);
            if (image.empty()) {
                std::cerr << "divisions requires an image argument\n";
                return 1;
            }
            return cmd_divisions(image, get_arg("--cutlines"));
        }

        App app(get_arg("--config", "-c"));

        if (command == "import") {
            std::string raster = get_positional(0);
            if (raster.empty()) {
                std::cerr << "import requires a raster argument\n";
                return 1;
            }
            return cmd_import(app, raster, get_arg("--title"), get_arg("--status"));
        }
        if (command == "subjects") {
            return cmd_subjects(app);
        }
        if (command == "georeference") {
            return cmd_georeference(app, require_arg("--source"), get_arg("--points-file"),
                                    get_arg("--gcps"), get_arg("--transformation"), has_flag("--vrt"));
        }
        if (command == "create") {
            return cmd_create(app, require_arg("--type"), require_arg("--docid"), require_arg("--user"));
        }
        if (command == "set-cutlines") {
            auto cutlines = split::rings_from_json(parse_json_arg(require_arg("--cutlines")));
            auto s = app.engine->update_cutlines(require_arg("--pk"), require_arg("--user"), cutlines);
            print_json({{"ok", true}, {"session", session::session_to_json(s)}});
            return 0;
        }
        if (command == "no-split") {
            auto s = app.engine->mark_no_split(require_arg("--pk"), require_arg("--user"));
            print_json({{"ok", true}, {"session", session::session_to_json(s)}});
            return 0;
        }
        if (command == "set-gcps") {
            std::optional<TransformKind> kind;
            std::string t = get_arg("--transformation");
            if (!t.empty()) kind = parse_transformation_arg(t, TransformKind::POLY1);
            auto s = app.engine->update_control_points(require_arg("--pk"), require_arg("--user"),
                                                       parse_json_arg(require_arg("--gcps")), kind);
            print_json({{"ok", true}, {"session", session::session_to_json(s)}});
            return 0;
        }
        if (command == "set-mask") {
            auto s = app.engine->update_mask(require_arg("--pk"), require_arg("--user"),
                                             require_arg("--wkt"));
            print_json({{"ok", true}, {"session", session::session_to_json(s)}});
            return 0;
        }
        if (command == "run") {
            return cmd_run(app, require_arg("--pk"), has_flag("--queue"));
        }
        if (command == "undo") {
            auto s = app.engine->undo(require_arg("--pk"), has_flag("--keep"));
            print_json({{"ok", true}, {"session", session_summary(s)}, {"kept", has_flag("--keep")}});
            return 0;
        }
        if (command == "redo") {
            auto s = app.engine->redo(require_arg("--pk"));
            print_json({{"ok", s.status == SessionStatus::SUCCESS}, {"session", session_summary(s)}});
            return s.status == SessionStatus::SUCCESS ? 0 : 2;
        }
        if (command == "delete") {
            std::string pk = require_arg("--pk");
            app.engine->delete_session(pk);
            print_json({{"ok", true}, {"deleted", pk}});
            return 0;
        }
        if (command == "list") {
            return cmd_list(app, get_arg("--docid"), get_arg("--type"));
        }
        if (command == "delete-expired") {
            return cmd_delete_expired(app);
        }
    } catch (const std::exception& e) {
        return print_error(e.what());
    }

    std::cerr << "Unknown command: " << command << std::endl;
    print_usage();
    return 1;
}
