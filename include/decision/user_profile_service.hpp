#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace xcore {
namespace decision {

struct UserProfile {
    std::string user_id;
    // experiment id -> variation id
    std::unordered_map<std::string, std::string> experiment_bucket_map;

    std::optional<std::string> variation_for(const std::string& experiment_id) const;
};

/**
 * Sticky bucketing collaborator.
 *
 * Implementations may throw or return false; DecisionService treats any
 * failure as "no sticky behaviour" for that call.
 */
class UserProfileService {
public:
    virtual ~UserProfileService() = default;

    virtual std::optional<UserProfile> lookup(const std::string& user_id) = 0;
    virtual bool save(const std::string& user_id, const std::string& experiment_id,
                      const std::string& variation_id) = 0;
};

class InMemoryUserProfileService : public UserProfileService {
public:
    std::optional<UserProfile> lookup(const std::string& user_id) override;
    bool save(const std::string& user_id, const std::string& experiment_id,
              const std::string& variation_id) override;

    void remove(const std::string& user_id);

private:
    std::mutex mutex_;
    std::unordered_map<std::string, UserProfile> profiles_;
};

} // namespace decision
} // namespace xcore
