#include "config/config_manager.hpp"
#include "common/error_handling.hpp"
#include "common/logger.hpp"

#include <atomic>
#include <fstream>
#include <sstream>

namespace xcore {
namespace config {

bool ConfigManager::load_from_json(const std::string& datafile) {
    std::shared_ptr<const ProjectConfig> config;
    try {
        config = ProjectConfig::from_string(datafile);
    } catch (const common::XcoreException& e) {
        LOG_ERROR("Failed to load datafile: {}", e.what());
        common::ErrorHandler::handle_error(e);
        return false;
    }

    publish(std::move(config));
    return true;
}

bool ConfigManager::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        LOG_ERROR("Failed to open datafile: {}", filename);
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        config_filename_ = filename;
    }

    return load_from_json(buffer.str());
}

bool ConfigManager::reload() {
    std::string filename;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        filename = config_filename_;
    }

    if (filename.empty()) {
        LOG_WARNING("No datafile loaded from disk; nothing to reload");
        return false;
    }

    return load_from_file(filename);
}

void ConfigManager::publish(std::shared_ptr<const ProjectConfig> config) {
    if (!config) {
        return;
    }

    const std::string new_revision = config->revision();
    auto previous = std::atomic_exchange(&current_, std::move(config));
    const std::string old_revision = previous ? previous->revision() : std::string();

    LOG_INFO("Published datafile revision {} (previous: {})", new_revision,
             old_revision.empty() ? "none" : old_revision);

    notify_changes(old_revision, new_revision);
}

std::shared_ptr<const ProjectConfig> ConfigManager::snapshot() const {
    return std::atomic_load(&current_);
}

void ConfigManager::watch_changes(ChangeCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    change_callbacks_.push_back(std::move(callback));
}

void ConfigManager::notify_changes(const std::string& old_revision, const std::string& new_revision) {
    std::vector<ChangeCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callbacks = change_callbacks_;
    }

    for (const auto& callback : callbacks) {
        try {
            callback(old_revision, new_revision);
        } catch (const std::exception& e) {
            LOG_ERROR("Error in datafile change callback: {}", e.what());
        }
    }
}

} // namespace config
} // namespace xcore
