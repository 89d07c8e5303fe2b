#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "config/project_config.hpp"

namespace xcore {
namespace config {

/**
 * Owns the current ProjectConfig snapshot.
 *
 * Readers take a shared_ptr with snapshot() and decide against it; a load
 * builds a complete new ProjectConfig and publishes it with one atomic store,
 * so readers never lock and never observe a half-applied datafile. A failed
 * load keeps the previous snapshot.
 */
class ConfigManager {
public:
    using ChangeCallback = std::function<void(const std::string& old_revision, const std::string& new_revision)>;

    ConfigManager() = default;
    ~ConfigManager() = default;

    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    bool load_from_json(const std::string& datafile);
    bool load_from_file(const std::string& filename);

    // Re-read the file given to the last load_from_file
    bool reload();

    // Publish an already built snapshot
    void publish(std::shared_ptr<const ProjectConfig> config);

    std::shared_ptr<const ProjectConfig> snapshot() const;
    bool has_config() const { return snapshot() != nullptr; }

    void watch_changes(ChangeCallback callback);

private:
    void notify_changes(const std::string& old_revision, const std::string& new_revision);

    std::shared_ptr<const ProjectConfig> current_;

    mutable std::mutex mutex_;
    std::string config_filename_;
    std::vector<ChangeCallback> change_callbacks_;
};

} // namespace config
} // namespace xcore
