#include "decision/user_profile_service.hpp"

namespace xcore {
namespace decision {

std::optional<std::string> UserProfile::variation_for(const std::string& experiment_id) const {
    auto it = experiment_bucket_map.find(experiment_id);
    if (it == experiment_bucket_map.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<UserProfile> InMemoryUserProfileService::lookup(const std::string& user_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = profiles_.find(user_id);
    if (it == profiles_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool InMemoryUserProfileService::save(const std::string& user_id, const std::string& experiment_id,
                                      const std::string& variation_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    UserProfile& profile = profiles_[user_id];
    profile.user_id = user_id;
    profile.experiment_bucket_map[experiment_id] = variation_id;
    return true;
}

void InMemoryUserProfileService::remove(const std::string& user_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    profiles_.erase(user_id);
}

} // namespace decision
} // namespace xcore
