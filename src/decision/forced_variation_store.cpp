#include "decision/forced_variation_store.hpp"

namespace xcore {
namespace decision {

bool InMemoryForcedVariationStore::set(const std::string& experiment_key, const std::string& user_id,
                                       const std::string& variation_key) {
    std::lock_guard<std::mutex> lock(mutex_);
    forced_[user_id][experiment_key] = variation_key;
    return true;
}

bool InMemoryForcedVariationStore::clear(const std::string& experiment_key, const std::string& user_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto user = forced_.find(user_id);
    if (user == forced_.end()) {
        return true;
    }

    user->second.erase(experiment_key);
    if (user->second.empty()) {
        forced_.erase(user);
    }
    return true;
}

std::optional<std::string> InMemoryForcedVariationStore::get(const std::string& experiment_key,
                                                             const std::string& user_id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto user = forced_.find(user_id);
    if (user == forced_.end()) {
        return std::nullopt;
    }

    auto it = user->second.find(experiment_key);
    if (it == user->second.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t InMemoryForcedVariationStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);

    size_t count = 0;
    for (const auto& [user_id, experiments] : forced_) {
        count += experiments.size();
    }
    return count;
}

} // namespace decision
} // namespace xcore
