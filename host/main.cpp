#include "flbplug/config.h"
#include "flbplug/config_map.h"
#include "flbplug/input_host.h"
#include "flbplug/log.h"
#include "flbplug/plugin_loader.h"
#include "flbplug/record_codec.h"

#include <json-c/json.h>

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

using namespace flbplug;

static void print_error_json(const std::string& msg, int exit_code) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "ok", json_object_new_boolean(0));
    json_object_object_add(o, "error",
        json_object_new_string_len(msg.c_str(), static_cast<int>(msg.size())));
    std::cout << json_object_to_json_string_ext(o, JSON_C_TO_STRING_PLAIN) << "\n";
    json_object_put(o);
    std::exit(exit_code);
}

static const char* config_type_name(int t) {
    switch (t) {
        case FLBPLUG_CONFIG_MAP_INT:  return "int";
        case FLBPLUG_CONFIG_MAP_BOOL: return "bool";
        default:                      return "string";
    }
}

static const flbplug_input_plugin* load(PluginManager& pm, const std::string& arg) {
    std::string err;
    const flbplug_input_plugin* p = nullptr;
    // A bare name goes through the naming convention; anything else is a path.
    if (arg.find('/') == std::string::npos && !PluginManager::name_from_path(arg)) {
        p = pm.load_by_name(arg, plugin_dir_from_env(), &err);
    } else {
        p = pm.load_plugin(arg, &err);
    }
    if (!p) print_error_json(err, 3);
    return p;
}

static int cmd_describe(const flbplug_input_plugin* p) {
    json_object* root = json_object_new_object();
    json_object_object_add(root, "ok", json_object_new_boolean(1));
    json_object_object_add(root, "name", json_object_new_string(p->name));
    json_object_object_add(root, "description",
        json_object_new_string(p->description ? p->description : ""));
    json_object_object_add(root, "event_type",
        json_object_new_string(p->event_type == FLBPLUG_EVENT_METRICS ? "metrics" : "logs"));

    json_object* arr = json_object_new_array();
    for (const flbplug_config_map* e = p->config_map; e && e->name; e++) {
        json_object* o = json_object_new_object();
        json_object_object_add(o, "key", json_object_new_string(e->name));
        json_object_object_add(o, "type", json_object_new_string(config_type_name(e->type)));
        json_object_object_add(o, "default", e->def_value ? json_object_new_string(e->def_value) : nullptr);
        json_object_object_add(o, "description", json_object_new_string(e->desc ? e->desc : ""));
        json_object_array_add(arr, o);
    }
    json_object_object_add(root, "config_map", arr);

    std::cout << json_object_to_json_string_ext(root, JSON_C_TO_STRING_PLAIN) << "\n";
    json_object_put(root);
    return 0;
}

static int cmd_run(const flbplug_input_plugin* p, int argc, char** argv, JsonlLogger& logger) {
    std::vector<std::pair<std::string, std::string>> props;
    int cycles = 1;
    bool wait = true;

    for (int i = 3; i < argc; i++) {
        const std::string a = argv[i];
        if (a == "-p" && i + 1 < argc) {
            const std::string kv = argv[++i];
            auto eq = kv.find('=');
            if (eq == std::string::npos || eq == 0) {
                print_error_json("property must be key=value: " + kv, 2);
            }
            props.emplace_back(kv.substr(0, eq), kv.substr(eq + 1));
        } else if (a == "--cycles" && i + 1 < argc) {
            long n = 0;
            std::string err;
            if (!parse_int_property("--cycles", argv[++i], 1, 1000000, &n, &err)) {
                print_error_json(err, 2);
            }
            cycles = static_cast<int>(n);
        } else if (a == "--no-wait") {
            wait = false;
        } else {
            print_error_json("unknown argument: " + a, 2);
        }
    }

    InputHost host(p, &logger);
    for (const auto& kv : props) {
        std::string err;
        if (!host.set_property(kv.first, kv.second, &err)) print_error_json(err, 2);
    }

    host.set_ingest_sink([&logger, &host](const char*, size_t, const void* buf, size_t size) {
        Record rec;
        std::string err;
        if (!decode_record(buf, size, &rec, &err)) {
            logger.event(LogLevel::ERROR, host.name(), "ingest", "rejected buffer: " + err);
            return -1;
        }
        std::cout << record_to_json(rec) << std::endl;
        return 0;
    });

    if (host.initialize() != 0) print_error_json("init failed for input " + host.name(), 4);

    int ret = host.run(cycles, wait);
    int exit_ret = host.shutdown();
    if (ret != 0) print_error_json("collect failed with status " + std::to_string(ret), 5);
    return exit_ret == 0 ? 0 : 5;
}

int main(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage:\n"
                     "  flbplug_host --describe <plugin>\n"
                     "  flbplug_host --run <plugin> [-p key=value]... [--cycles N] [--no-wait]\n"
                     "<plugin> is a path to flb-in_<name>.so, or <name> looked up in $FLBPLUG_PLUGIN_DIR\n";
        return 2;
    }

    const std::string mode = argv[1];
    if (mode != "--describe" && mode != "--run") {
        std::cerr << "unknown mode: " << mode << "\n";
        return 2;
    }

    JsonlLogger logger(detect_log_level(), log_path_from_env());
    PluginManager pm;
    const flbplug_input_plugin* p = load(pm, argv[2]);

    if (mode == "--describe") return cmd_describe(p);
    return cmd_run(p, argc, argv, logger);
}
