#include "worker/plugin_worker.hpp"
#include "core/utils.hpp"

#include <csignal>
#include <cstdlib>
#include <format>
#include <string>

using namespace pluginhost;

// plugin_host_worker --fd <n> --plugin <id> [--threads <n>]
// Spawned by the host's ProcessWorker; never run by hand.

int main(int argc, char* argv[]) {
    int fd = -1;
    std::string plugin_id;
    size_t threads = 4;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (i + 1 >= argc) {
            utils::log::error(std::format("plugin_host_worker: missing value for {}", arg));
            return 2;
        }
        const std::string value = argv[++i];
        if (arg == "--fd") {
            fd = utils::try_parse_int<int>(value).value_or(-1);
        } else if (arg == "--plugin") {
            plugin_id = value;
        } else if (arg == "--threads") {
            threads = utils::try_parse_int<size_t>(value).value_or(threads);
        } else {
            utils::log::error(std::format("plugin_host_worker: unknown option {}", arg));
            return 2;
        }
    }

    if (fd < 0 || plugin_id.empty()) {
        utils::log::error("usage: plugin_host_worker --fd <n> --plugin <id> [--threads <n>]");
        return 2;
    }

    if (const char* level = std::getenv("PLUGINHOST_LOG_LEVEL")) {
        utils::log::set_level(utils::log::parse_level(level));
    }
    std::signal(SIGPIPE, SIG_IGN);

    PluginWorker worker(fd, plugin_id, threads);
    const int rc = worker.run();
    utils::log::debug(std::format("[worker:{}] exiting with {}", plugin_id, rc));
    return rc;
}
