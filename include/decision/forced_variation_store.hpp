#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace xcore {
namespace decision {

/**
 * Runtime forced variations, keyed by (experiment key, user id).
 *
 * Owned and mutated by the host; the decision core only reads it. Keys are
 * validated against the configuration by DecisionService::set_forced_variation
 * before they reach the store.
 */
class ForcedVariationStore {
public:
    virtual ~ForcedVariationStore() = default;

    virtual bool set(const std::string& experiment_key, const std::string& user_id,
                     const std::string& variation_key) = 0;
    virtual bool clear(const std::string& experiment_key, const std::string& user_id) = 0;
    virtual std::optional<std::string> get(const std::string& experiment_key, const std::string& user_id) const = 0;
};

class InMemoryForcedVariationStore : public ForcedVariationStore {
public:
    bool set(const std::string& experiment_key, const std::string& user_id,
             const std::string& variation_key) override;
    bool clear(const std::string& experiment_key, const std::string& user_id) override;
    std::optional<std::string> get(const std::string& experiment_key, const std::string& user_id) const override;

    size_t size() const;

private:
    mutable std::mutex mutex_;
    // user id -> experiment key -> variation key
    std::unordered_map<std::string, std::unordered_map<std::string, std::string>> forced_;
};

} // namespace decision
} // namespace xcore
