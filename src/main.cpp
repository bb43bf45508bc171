#include "config/config_loader.hpp"
#include "core/crypto.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "host/host_context.hpp"
#include "manifest/manifest.hpp"
#include "manifest/plugin_state.hpp"
#include "plugin/package_archive.hpp"
#include "registry/registry_types.hpp"

#include <nlohmann/json.hpp>

#include <csignal>
#include <cstdlib>
#include <format>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace pluginhost;
using json = nlohmann::json;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitUsage = 2;

constexpr const char* kUsage =
    "usage: plugin_host [--config FILE] <command> [args]\n"
    "\n"
    "commands:\n"
    "  list                                   installed plugins\n"
    "  state <id>                             persisted state of a plugin\n"
    "  install <id> [version]                 install from the registry\n"
    "  uninstall <id>                         remove a plugin\n"
    "  enable <id>                            initialize and enable\n"
    "  disable <id>                           clean up and disable\n"
    "  update <id> [version]                  reinstall at another version\n"
    "  search [query] [--type T] [--category C] [--limit N]\n"
    "  exec <id> <method> [json-args]         call a method of an enabled plugin\n"
    "  config-get <id>                        effective configuration\n"
    "  config-set <id> <json-object>          merge configuration overrides\n"
    "  pack <dir> <out-file>                  build a package from a directory\n";

struct UsageError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

int print_ok(const json& data) {
    std::cout << json{{"success", true}, {"data", data}}.dump(2) << std::endl;
    return kExitOk;
}

int print_error(ErrorKind kind, const std::string& message) {
    std::cout << json{
        {"success", false},
        {"error", {{"kind", error_kind_to_string(kind)}, {"message", message}}},
    }.dump(2) << std::endl;
    return kExitError;
}

template<typename T, typename ToJson>
int print_result(const Result<T>& result, ToJson&& to_data) {
    if (result.is_error()) return print_error(result.error_kind(), result.error_message());
    return print_ok(to_data(result.value()));
}

json parse_json_arg(const std::string& text, const char* what) {
    try {
        return json::parse(text);
    } catch (const json::parse_error& e) {
        throw UsageError(std::format("{} is not valid JSON: {}", what, e.what()));
    }
}

const std::string& require_arg(const std::vector<std::string>& args, size_t index, const char* name) {
    if (index >= args.size()) throw UsageError(std::format("missing argument <{}>", name));
    return args[index];
}

std::optional<std::string> optional_arg(const std::vector<std::string>& args, size_t index) {
    if (index >= args.size()) return std::nullopt;
    return args[index];
}

int cmd_pack(const std::vector<std::string>& args) {
    const auto& dir = require_arg(args, 1, "dir");
    const auto& out_file = require_arg(args, 2, "out-file");

    auto packed = PackageArchive::pack(dir);
    if (packed.is_error()) return print_error(packed.error_kind(), packed.error_message());

    std::ofstream out(out_file, std::ios::binary | std::ios::trunc);
    out.write(packed.value().data(), static_cast<std::streamsize>(packed.value().size()));
    out.close();
    if (!out) {
        return print_error(ErrorKind::IO_ERROR, std::format("cannot write '{}'", out_file));
    }

    return print_ok({
        {"file", out_file},
        {"bytes", packed.value().size()},
        {"sha256", crypto::sha256_hex(packed.value())},
    });
}

int cmd_search(HostContext& ctx, const std::vector<std::string>& args) {
    std::string query;
    SearchOptions options;

    for (size_t i = 1; i < args.size(); ++i) {
        const auto& arg = args[i];
        if (arg == "--type") {
            options.type = require_arg(args, ++i, "type");
        } else if (arg == "--category") {
            options.category = require_arg(args, ++i, "category");
        } else if (arg == "--limit") {
            const auto limit = utils::try_parse_int<size_t>(require_arg(args, ++i, "limit"));
            if (!limit) throw UsageError("--limit expects a non-negative integer");
            options.limit = *limit;
        } else if (query.empty() && !arg.starts_with("--")) {
            query = arg;
        } else {
            throw UsageError(std::format("unexpected argument '{}'", arg));
        }
    }

    return print_result(ctx.manager().search_registry(query, options),
        [](const std::vector<PluginSummary>& found) {
            json out = json::array();
            for (const auto& summary : found) out.push_back(summary_to_json(summary));
            return out;
        });
}

int run_command(HostContext& ctx, const std::vector<std::string>& args) {
    const std::string& command = args.front();
    auto& manager = ctx.manager();
    const auto state_json = [](const PluginState& state) { return state_to_json(state); };

    if (command == "search") return cmd_search(ctx, args);

    // Everything below operates on installed plugins
    const auto loaded = manager.load_installed();
    if (loaded.is_error()) return print_error(loaded.error_kind(), loaded.error_message());

    if (command == "list") {
        json out = json::array();
        for (const auto& manifest : manager.list_installed()) {
            json item = to_json(manifest);
            if (auto state = manager.get_state(manifest.id); state.is_ok()) {
                item["state"] = state_to_json(state.value());
            }
            out.push_back(std::move(item));
        }
        return print_ok(out);
    }
    if (command == "state") {
        return print_result(manager.get_state(require_arg(args, 1, "id")), state_json);
    }
    if (command == "install") {
        return print_result(manager.install(require_arg(args, 1, "id"), optional_arg(args, 2)), state_json);
    }
    if (command == "update") {
        return print_result(manager.update(require_arg(args, 1, "id"), optional_arg(args, 2)), state_json);
    }
    if (command == "uninstall") {
        return print_result(manager.uninstall(require_arg(args, 1, "id")),
            [](const std::monostate&) { return json(nullptr); });
    }
    if (command == "enable") {
        return print_result(manager.enable(require_arg(args, 1, "id")), state_json);
    }
    if (command == "disable") {
        return print_result(manager.disable(require_arg(args, 1, "id")),
            [](const std::monostate&) { return json(nullptr); });
    }
    if (command == "exec") {
        const auto& id = require_arg(args, 1, "id");
        const auto& method = require_arg(args, 2, "method");
        const json call_args = args.size() > 3 ? parse_json_arg(args[3], "json-args") : json::object();
        return print_result(manager.execute(id, method, call_args), [](const json& r) { return r; });
    }
    if (command == "config-get") {
        return print_result(manager.get_plugin_config(require_arg(args, 1, "id")),
            [](const json& r) { return r; });
    }
    if (command == "config-set") {
        const auto& id = require_arg(args, 1, "id");
        const json patch = parse_json_arg(require_arg(args, 2, "json-object"), "config patch");
        return print_result(manager.set_plugin_config(id, patch), [](const json& r) { return r; });
    }

    throw UsageError(std::format("unknown command '{}'", command));
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    // A worker dying mid-write must not take the host down
    std::signal(SIGPIPE, SIG_IGN);

    std::string config_file = "config/plugin_host.toml";
    std::vector<std::string> args;

    try {
        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];
            if (arg == "--config") {
                if (i + 1 >= argc) throw UsageError("--config expects a file");
                config_file = argv[++i];
            } else if (arg == "-h" || arg == "--help") {
                std::cout << kUsage;
                return kExitOk;
            } else {
                args.push_back(arg);
            }
        }
        if (args.empty()) throw UsageError("missing command");

        if (args.front() == "pack") return cmd_pack(args);

        const auto config_result = ConfigLoader::load_from_file(config_file);
        if (!config_result.success) {
            utils::log::error(std::format("Config error: {}", config_result.error_message));
            return print_error(ErrorKind::VALIDATION, config_result.error_message);
        }
        const auto& cfg = config_result.config;

        utils::log::set_level(utils::log::parse_level(cfg.logging.level));
        // Inherited by worker processes
        ::setenv("PLUGINHOST_LOG_LEVEL", cfg.logging.level.c_str(), 1);

        HostContext ctx(cfg);
        const int rc = run_command(ctx, args);
        ctx.manager().shutdown();
        return rc;

    } catch (const UsageError& e) {
        std::cerr << "plugin_host: " << e.what() << "\n\n" << kUsage;
        return kExitUsage;
    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return print_error(ErrorKind::INTERNAL_ERROR, e.what());
    }
}
