#include <cstdlib>
#include <iostream>
#include <string>

#include "common/logger.hpp"
#include "config/config_manager.hpp"
#include "decision/decision_service.hpp"
#include "decision/feature_evaluator.hpp"
#include "decision/forced_variation_store.hpp"
#include "decision/user_profile_service.hpp"

using namespace xcore;

namespace {

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " <datafile.json> <user-id> [attribute=value ...]\n";
}

// "name=value" with true/false as booleans and numeric text as numbers
bool parse_attribute(const std::string& argument, config::UserAttributes& attributes) {
    auto separator = argument.find('=');
    if (separator == std::string::npos || separator == 0) {
        return false;
    }

    const std::string name = argument.substr(0, separator);
    const std::string value = argument.substr(separator + 1);

    if (value == "true" || value == "false") {
        attributes[name] = config::AttributeValue(value == "true");
        return true;
    }

    char* end = nullptr;
    const double number = std::strtod(value.c_str(), &end);
    if (!value.empty() && end == value.c_str() + value.size()) {
        attributes[name] = config::AttributeValue(number);
    } else {
        attributes[name] = config::AttributeValue(value);
    }
    return true;
}

void demonstrate_experiments(const config::ProjectConfig& config,
                             const decision::DecisionService& service,
                             const std::string& user_id,
                             const config::UserAttributes& attributes) {
    std::cout << "\n=== Experiments (revision " << config.revision() << ") ===\n";

    for (const auto& experiment : config.experiments()) {
        auto decision = service.decide_experiment(config, experiment.key, user_id, attributes);
        std::cout << "  " << experiment.key << ": "
                  << (decision ? decision->variation->key : std::string("<no decision>")) << "\n";
    }
}

void demonstrate_features(const config::ProjectConfig& config,
                          const decision::DecisionService& service,
                          const std::string& user_id,
                          const config::UserAttributes& attributes) {
    std::cout << "\n=== Features ===\n";

    decision::FeatureEvaluator features(service);
    for (const auto& feature : config.feature_flags()) {
        auto decision = service.get_variation_for_feature(config, feature, user_id, attributes);
        std::cout << "  " << feature.key << ": "
                  << (decision && decision->feature_enabled() ? "enabled" : "disabled");
        if (decision) {
            std::cout << " via " << decision::decision_source_to_string(decision->source)
                      << " '" << decision->experiment->key << "'";
        }
        std::cout << "\n";

        for (const auto& variable : feature.variables) {
            if (variable.type != config::VariableType::STRING) {
                continue;
            }
            auto value = features.get_feature_variable_string(config, feature.key, variable.key,
                                                               user_id, attributes);
            std::cout << "    " << variable.key << " = " << value.value_or("<none>") << "\n";
        }
    }

    auto enabled = features.get_enabled_features(config, user_id, attributes);
    std::cout << "  enabled features: " << enabled.size() << "\n";
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 3) {
        print_usage(argv[0]);
        return 1;
    }

    common::Logger::Config log_config;
    log_config.level = common::LogLevel::WARNING;
    common::Logger::initialize("decision_demo", log_config);

    config::UserAttributes attributes;
    for (int i = 3; i < argc; ++i) {
        if (!parse_attribute(argv[i], attributes)) {
            std::cerr << "Ignoring malformed attribute '" << argv[i] << "'\n";
        }
    }

    config::ConfigManager manager;
    if (!manager.load_from_file(argv[1])) {
        std::cerr << "✗ Failed to load datafile " << argv[1] << "\n";
        common::Logger::shutdown();
        return 1;
    }
    std::cout << "✓ Datafile loaded\n";

    decision::InMemoryForcedVariationStore forced_variations;
    decision::InMemoryUserProfileService user_profiles;
    decision::DecisionService service(forced_variations, &user_profiles);

    auto snapshot = manager.snapshot();
    demonstrate_experiments(*snapshot, service, argv[2], attributes);
    demonstrate_features(*snapshot, service, argv[2], attributes);

    common::Logger::shutdown();
    return 0;
}
