#include "plugin/plugin_store.hpp"
#include "core/utils.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <format>
#include <fstream>

namespace pluginhost {

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

constexpr const char* kStagingDir = ".staging";

} // anonymous namespace

PluginStore::PluginStore(fs::path root)
    : root_(std::move(root)) {}

fs::path PluginStore::plugin_dir(const std::string& id) const {
    return root_ / id;
}

bool PluginStore::exists(const std::string& id) const {
    std::error_code ec;
    return fs::is_regular_file(plugin_dir(id) / kManifestFileName, ec);
}

std::vector<std::string> PluginStore::list_plugin_ids() const {
    std::vector<std::string> ids;
    std::error_code ec;
    if (!fs::is_directory(root_, ec)) return ids;

    for (const auto& entry : fs::directory_iterator(root_, ec)) {
        const std::string name = entry.path().filename().string();
        if (name.empty() || name.front() == '.') continue;
        if (!entry.is_directory(ec)) continue;
        if (!is_valid_plugin_id(name)) {
            utils::log::warn(std::format("Ignoring directory '{}' in plugins root: not a plugin id", name));
            continue;
        }
        if (exists(name)) ids.push_back(name);
    }
    if (ec) {
        utils::log::warn(std::format("Cannot list plugins root {}: {}", root_.string(), ec.message()));
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

Result<fs::path> PluginStore::create_staging(const std::string& id) const {
    const fs::path dir = root_ / kStagingDir / std::format("{}-{}", id, utils::random_token());
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return Result<fs::path>::error(ErrorKind::IO_ERROR,
            std::format("cannot create staging directory '{}': {}", dir.string(), ec.message()));
    }
    return Result<fs::path>::ok(dir);
}

Status PluginStore::promote(const fs::path& staging, const std::string& id) const {
    const fs::path target = plugin_dir(id);
    std::error_code ec;
    if (fs::exists(target, ec)) {
        return Status::error(ErrorKind::VALIDATION,
            std::format("plugin directory '{}' already exists", target.string()));
    }
    fs::rename(staging, target, ec);
    if (ec) {
        return Status::error(ErrorKind::IO_ERROR,
            std::format("cannot move '{}' to '{}': {}", staging.string(), target.string(), ec.message()));
    }
    return ok_status();
}

Status PluginStore::remove_plugin_dir(const std::string& id) const {
    std::error_code ec;
    fs::remove_all(plugin_dir(id), ec);
    if (ec) {
        return Status::error(ErrorKind::IO_ERROR,
            std::format("cannot remove '{}': {}", plugin_dir(id).string(), ec.message()));
    }
    return ok_status();
}

void PluginStore::discard(const fs::path& dir) const {
    std::error_code ec;
    fs::remove_all(dir, ec);
    if (ec) {
        utils::log::warn(std::format("Cannot clean up '{}': {}", dir.string(), ec.message()));
    }
}

Result<PluginManifest> PluginStore::load_manifest(const std::string& id,
                                                  const std::string& host_version) const {
    return load_manifest_file(plugin_dir(id).string(), host_version);
}

Result<std::optional<PluginState>> PluginStore::load_state(const std::string& id) const {
    using R = Result<std::optional<PluginState>>;

    const fs::path path = plugin_dir(id) / kStateFileName;
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return R::ok(std::nullopt);
    }

    std::ifstream in(path);
    if (!in) {
        return R::error(ErrorKind::IO_ERROR, std::format("cannot open {}", path.string()));
    }
    const json raw = json::parse(in, nullptr, /*allow_exceptions=*/false);
    if (raw.is_discarded()) {
        return R::error(ErrorKind::VALIDATION, std::format("{} is not valid JSON", path.string()));
    }

    auto state = validate_state(raw, id);
    if (state.is_error()) return R::error(state.error_kind(), state.error_message());
    return R::ok(std::move(state.value()));
}

Status PluginStore::save_state(const PluginState& state) const {
    const fs::path dir = plugin_dir(state.id);
    const fs::path path = dir / kStateFileName;
    const fs::path tmp = dir / std::format(".{}.{}.tmp", kStateFileName, utils::random_token(4));

    {
        std::ofstream out(tmp, std::ios::trunc);
        out << state_to_json(state).dump(2) << '\n';
        out.close();
        if (!out) {
            std::error_code ec;
            fs::remove(tmp, ec);
            return Status::error(ErrorKind::IO_ERROR, std::format("cannot write {}", tmp.string()));
        }
    }

    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return Status::error(ErrorKind::IO_ERROR,
            std::format("cannot replace {}: {}", path.string(), ec.message()));
    }
    return ok_status();
}

Status PluginStore::delete_state(const std::string& id) const {
    std::error_code ec;
    fs::remove(plugin_dir(id) / kStateFileName, ec);
    if (ec) {
        return Status::error(ErrorKind::IO_ERROR,
            std::format("cannot delete state of '{}': {}", id, ec.message()));
    }
    return ok_status();
}

} // namespace pluginhost
