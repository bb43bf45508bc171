#pragma once

#include "core/error.hpp"
#include "manifest/manifest.hpp"
#include "manifest/plugin_state.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace pluginhost {

/**
 * @brief On-disk layout of installed plugins
 *
 *   <root>/<id>/manifest.json    extracted package (manifest + code)
 *   <root>/<id>/state.json       serialized PluginState
 *   <root>/.staging/<id>-<rnd>/  install in progress
 *
 * State writes go through a temp file + rename so a crash never leaves a
 * half-written state.json.
 */
class PluginStore {
public:
    explicit PluginStore(std::filesystem::path root);

    [[nodiscard]] const std::filesystem::path& root() const { return root_; }
    [[nodiscard]] std::filesystem::path plugin_dir(const std::string& id) const;
    [[nodiscard]] bool exists(const std::string& id) const;

    /// Installed plugin ids (directories holding a manifest), sorted
    [[nodiscard]] std::vector<std::string> list_plugin_ids() const;

    /// Fresh empty directory under .staging/
    [[nodiscard]] Result<std::filesystem::path> create_staging(const std::string& id) const;

    /// Rename a staging directory to <root>/<id>; fails if the target exists
    [[nodiscard]] Status promote(const std::filesystem::path& staging, const std::string& id) const;

    /// Recursively remove <root>/<id>; absent is not an error
    [[nodiscard]] Status remove_plugin_dir(const std::string& id) const;

    /// Best-effort recursive removal (cleanup paths)
    void discard(const std::filesystem::path& dir) const;

    [[nodiscard]] Result<PluginManifest> load_manifest(const std::string& id,
                                                       const std::string& host_version) const;

    /// nullopt when state.json is absent ("never configured")
    [[nodiscard]] Result<std::optional<PluginState>> load_state(const std::string& id) const;

    [[nodiscard]] Status save_state(const PluginState& state) const;
    [[nodiscard]] Status delete_state(const std::string& id) const;

private:
    std::filesystem::path root_;
};

} // namespace pluginhost
