#pragma once

#include "config/entities.hpp"

namespace xcore {
namespace decision {

enum class DecisionSource {
    EXPERIMENT,
    ROLLOUT
};

const char* decision_source_to_string(DecisionSource source);

/**
 * Outcome of a decision call.
 *
 * experiment is the experiment (source EXPERIMENT) or the rollout rule
 * (source ROLLOUT) that produced variation. Both point into the
 * ProjectConfig snapshot the decision was made against and stay valid for as
 * long as the caller holds that snapshot.
 */
struct Decision {
    const config::Experiment* experiment{nullptr};
    const config::Variation* variation{nullptr};
    DecisionSource source{DecisionSource::EXPERIMENT};

    bool feature_enabled() const { return variation && variation->feature_enabled; }
};

} // namespace decision
} // namespace xcore
