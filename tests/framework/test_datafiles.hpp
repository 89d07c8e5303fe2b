#pragma once

#include <string>

namespace xcore {
namespace test_data {

/**
 * Datafile used across the decision tests.
 *
 *   exp1               two variations split at 5000, whitelist for forced_user
 *   exp_capped         one variation on the first 8000 slots
 *   exp_audience       legacy audience "firefox users"
 *   exp_paused         not running
 *   exp_typed          audienceConditions ["and", firefox, adults]
 *   exp_reserved       first half of the space reserved (empty entity id)
 *   group_exp_1/2      random group 19228, split 4000 / 8000
 *   overlapping_exp    overlapping group 19229
 *   feature_experiment feature experiment with typed variable overrides
 *   rollout 1          firefox rule (5000), adults rule, everyone else
 *   rollout 2          firefox rule, adults rule (no everyone-else rule)
 */
inline const std::string& decision_datafile() {
    static const std::string datafile = R"JSON({
  "version": "4",
  "revision": "42",
  "projectId": "111001",
  "accountId": "12001",
  "anonymizeIP": false,
  "attributes": [
    {"id": "111094", "key": "browser_type"},
    {"id": "111095", "key": "age"}
  ],
  "audiences": [
    {
      "id": "11154",
      "name": "Firefox users",
      "conditions": "[\"and\", [\"or\", [\"or\", {\"name\": \"browser_type\", \"type\": \"custom_attribute\", \"value\": \"firefox\"}]]]"
    },
    {
      "id": "3468206642",
      "name": "Adults (legacy placeholder)",
      "conditions": "[\"or\", {\"name\": \"$opt_dummy_attribute\", \"type\": \"custom_attribute\", \"value\": \"impossible_value\"}]"
    }
  ],
  "typedAudiences": [
    {
      "id": "3468206642",
      "name": "Adults",
      "conditions": ["and", ["or", {"name": "age", "type": "custom_attribute", "match": "gt", "value": 18}]]
    }
  ],
  "experiments": [
    {
      "id": "100",
      "key": "exp1",
      "status": "Running",
      "layerId": "10",
      "audienceIds": [],
      "variations": [
        {"id": "1", "key": "A"},
        {"id": "2", "key": "B"}
      ],
      "trafficAllocation": [
        {"entityId": "1", "endOfRange": 5000},
        {"entityId": "2", "endOfRange": 10000}
      ],
      "forcedVariations": {"forced_user": "B", "stale_whitelist_user": "C"}
    },
    {
      "id": "200",
      "key": "exp_capped",
      "status": "Running",
      "layerId": "20",
      "audienceIds": [],
      "variations": [{"id": "3", "key": "only"}],
      "trafficAllocation": [{"entityId": "3", "endOfRange": 8000}],
      "forcedVariations": {}
    },
    {
      "id": "300",
      "key": "exp_audience",
      "status": "Running",
      "layerId": "30",
      "audienceIds": ["11154"],
      "variations": [{"id": "4", "key": "control"}],
      "trafficAllocation": [{"entityId": "4", "endOfRange": 10000}],
      "forcedVariations": {}
    },
    {
      "id": "400",
      "key": "exp_paused",
      "status": "Paused",
      "layerId": "40",
      "audienceIds": [],
      "variations": [{"id": "5", "key": "paused_var"}],
      "trafficAllocation": [{"entityId": "5", "endOfRange": 10000}],
      "forcedVariations": {"forced_user": "paused_var"}
    },
    {
      "id": "500",
      "key": "exp_typed",
      "status": "Running",
      "layerId": "50",
      "audienceIds": ["11154"],
      "audienceConditions": ["and", "11154", "3468206642"],
      "variations": [{"id": "6", "key": "typed_var"}],
      "trafficAllocation": [{"entityId": "6", "endOfRange": 10000}],
      "forcedVariations": {}
    },
    {
      "id": "600",
      "key": "exp_reserved",
      "status": "Running",
      "layerId": "60",
      "audienceIds": [],
      "variations": [{"id": "7", "key": "reserved_var"}],
      "trafficAllocation": [
        {"entityId": "", "endOfRange": 5000},
        {"entityId": "7", "endOfRange": 10000}
      ],
      "forcedVariations": {}
    },
    {
      "id": "900",
      "key": "feature_experiment",
      "status": "Running",
      "layerId": "90",
      "audienceIds": [],
      "variations": [
        {
          "id": "90",
          "key": "control",
          "featureEnabled": false,
          "variables": [{"id": "v1", "value": "control_label"}]
        },
        {
          "id": "91",
          "key": "treatment",
          "featureEnabled": true,
          "variables": [
            {"id": "v1", "value": "treatment_label"},
            {"id": "v2", "value": "42"},
            {"id": "v4", "value": "true"}
          ]
        }
      ],
      "trafficAllocation": [
        {"entityId": "90", "endOfRange": 5000},
        {"entityId": "91", "endOfRange": 10000}
      ],
      "forcedVariations": {}
    },
    {
      "id": "950",
      "key": "firefox_feature_experiment",
      "status": "Running",
      "layerId": "95",
      "audienceIds": ["11154"],
      "variations": [{"id": "95", "key": "firefox_on", "featureEnabled": true}],
      "trafficAllocation": [{"entityId": "95", "endOfRange": 10000}],
      "forcedVariations": {}
    }
  ],
  "groups": [
    {
      "id": "19228",
      "policy": "random",
      "trafficAllocation": [
        {"entityId": "700", "endOfRange": 4000},
        {"entityId": "701", "endOfRange": 8000}
      ],
      "experiments": [
        {
          "id": "700",
          "key": "group_exp_1",
          "status": "Running",
          "layerId": "70",
          "audienceIds": [],
          "variations": [{"id": "70", "key": "g1_var"}],
          "trafficAllocation": [{"entityId": "70", "endOfRange": 10000}],
          "forcedVariations": {}
        },
        {
          "id": "701",
          "key": "group_exp_2",
          "status": "Running",
          "layerId": "71",
          "audienceIds": [],
          "variations": [{"id": "71", "key": "g2_var"}],
          "trafficAllocation": [{"entityId": "71", "endOfRange": 10000}],
          "forcedVariations": {}
        }
      ]
    },
    {
      "id": "19229",
      "policy": "overlapping",
      "trafficAllocation": [],
      "experiments": [
        {
          "id": "800",
          "key": "overlapping_exp",
          "status": "Running",
          "layerId": "80",
          "audienceIds": [],
          "variations": [{"id": "80", "key": "overlap_var"}],
          "trafficAllocation": [{"entityId": "80", "endOfRange": 10000}],
          "forcedVariations": {}
        }
      ]
    }
  ],
  "featureFlags": [
    {
      "id": "f1",
      "key": "test_feature_in_experiment",
      "rolloutId": "",
      "experimentIds": ["900"],
      "variables": [
        {"id": "v1", "key": "label", "type": "string", "defaultValue": "default"},
        {"id": "v2", "key": "count", "type": "integer", "defaultValue": "10"},
        {"id": "v3", "key": "ratio", "type": "double", "defaultValue": "1.5"},
        {"id": "v4", "key": "on", "type": "boolean", "defaultValue": "false"},
        {"id": "v6", "key": "broken_count", "type": "integer", "defaultValue": "12abc"}
      ]
    },
    {
      "id": "f2",
      "key": "test_feature_in_rollout",
      "rolloutId": "r1",
      "experimentIds": [],
      "variables": [
        {"id": "v5", "key": "message", "type": "string", "defaultValue": "hello"}
      ]
    },
    {
      "id": "f3",
      "key": "test_feature_in_experiment_and_rollout",
      "rolloutId": "r1",
      "experimentIds": ["950"],
      "variables": []
    },
    {
      "id": "f4",
      "key": "test_feature_multi_experiment",
      "rolloutId": "",
      "experimentIds": ["950", "900"],
      "variables": []
    },
    {
      "id": "f5",
      "key": "test_feature_strict_rollout",
      "rolloutId": "r2",
      "experimentIds": [],
      "variables": []
    },
    {
      "id": "f6",
      "key": "empty_feature",
      "rolloutId": "",
      "experimentIds": [],
      "variables": []
    }
  ],
  "rollouts": [
    {
      "id": "r1",
      "experiments": [
        {
          "id": "1001",
          "key": "1001",
          "status": "Running",
          "layerId": "r1",
          "audienceIds": ["11154"],
          "variations": [
            {
              "id": "1101",
              "key": "rule1_on",
              "featureEnabled": true,
              "variables": [{"id": "v5", "value": "firefox hello"}]
            }
          ],
          "trafficAllocation": [{"entityId": "1101", "endOfRange": 5000}],
          "forcedVariations": {}
        },
        {
          "id": "1002",
          "key": "1002",
          "status": "Running",
          "layerId": "r1",
          "audienceIds": ["3468206642"],
          "variations": [{"id": "1102", "key": "rule2_on", "featureEnabled": true}],
          "trafficAllocation": [{"entityId": "1102", "endOfRange": 10000}],
          "forcedVariations": {}
        },
        {
          "id": "1003",
          "key": "1003",
          "status": "Running",
          "layerId": "r1",
          "audienceIds": [],
          "variations": [{"id": "1103", "key": "everyone_on", "featureEnabled": true}],
          "trafficAllocation": [{"entityId": "1103", "endOfRange": 10000}],
          "forcedVariations": {}
        }
      ]
    },
    {
      "id": "r2",
      "experiments": [
        {
          "id": "2001",
          "key": "2001",
          "status": "Running",
          "layerId": "r2",
          "audienceIds": ["11154"],
          "variations": [{"id": "2101", "key": "strict_rule1_on", "featureEnabled": true}],
          "trafficAllocation": [{"entityId": "2101", "endOfRange": 10000}],
          "forcedVariations": {}
        },
        {
          "id": "2002",
          "key": "2002",
          "status": "Running",
          "layerId": "r2",
          "audienceIds": ["3468206642"],
          "variations": [{"id": "2102", "key": "strict_rule2_on", "featureEnabled": true}],
          "trafficAllocation": [{"entityId": "2102", "endOfRange": 10000}],
          "forcedVariations": {}
        }
      ]
    }
  ],
  "events": [
    {"id": "e1", "key": "purchase", "experimentIds": ["100", "300"]}
  ]
})JSON";
    return datafile;
}

// Same project at a later revision: exp1 keeps both variations but
// hands the whole bucket space to "B".
inline const std::string& reallocated_datafile() {
    static const std::string datafile = R"JSON({
  "version": "4",
  "revision": "43",
  "projectId": "111001",
  "accountId": "12001",
  "attributes": [],
  "audiences": [],
  "experiments": [
    {
      "id": "100",
      "key": "exp1",
      "status": "Running",
      "layerId": "10",
      "audienceIds": [],
      "variations": [
        {"id": "1", "key": "A"},
        {"id": "2", "key": "B"}
      ],
      "trafficAllocation": [
        {"entityId": "2", "endOfRange": 10000}
      ],
      "forcedVariations": {}
    }
  ],
  "groups": [],
  "featureFlags": [],
  "rollouts": [],
  "events": []
})JSON";
    return datafile;
}

/**
 * Variation ids that repeat across experiments and rollout rules.
 *
 *   exp_a        variation "1" (on) overriding label with "override"
 *   exp_b        variation "1" (other) without overrides
 *   rollout r1   rule shared_rule, variation "1" (rule_on) overriding v2
 *   rollout r2   rule keyed "exp_a" like the experiment, variation "1" (shadowed)
 *
 * Every allocation covers the whole bucket space.
 */
inline const std::string& shared_variation_ids_datafile() {
    static const std::string datafile = R"JSON({
  "version": "4",
  "revision": "7",
  "projectId": "111001",
  "accountId": "12001",
  "attributes": [],
  "audiences": [],
  "experiments": [
    {
      "id": "100",
      "key": "exp_a",
      "status": "Running",
      "layerId": "10",
      "audienceIds": [],
      "variations": [
        {"id": "1", "key": "on", "featureEnabled": true, "variables": [{"id": "v1", "value": "override"}]}
      ],
      "trafficAllocation": [{"entityId": "1", "endOfRange": 10000}],
      "forcedVariations": {}
    },
    {
      "id": "200",
      "key": "exp_b",
      "status": "Running",
      "layerId": "20",
      "audienceIds": [],
      "variations": [
        {"id": "1", "key": "other", "featureEnabled": false}
      ],
      "trafficAllocation": [{"entityId": "1", "endOfRange": 10000}],
      "forcedVariations": {}
    }
  ],
  "groups": [],
  "featureFlags": [
    {
      "id": "f1",
      "key": "shared_feature",
      "rolloutId": "",
      "experimentIds": ["100"],
      "variables": [
        {"id": "v1", "key": "label", "type": "string", "defaultValue": "default"}
      ]
    },
    {
      "id": "f2",
      "key": "shared_rollout_feature",
      "rolloutId": "r1",
      "experimentIds": [],
      "variables": [
        {"id": "v2", "key": "label", "type": "string", "defaultValue": "default"}
      ]
    }
  ],
  "rollouts": [
    {
      "id": "r1",
      "experiments": [
        {
          "id": "300",
          "key": "shared_rule",
          "status": "Running",
          "layerId": "r1",
          "audienceIds": [],
          "variations": [
            {"id": "1", "key": "rule_on", "featureEnabled": true, "variables": [{"id": "v2", "value": "rule_value"}]}
          ],
          "trafficAllocation": [{"entityId": "1", "endOfRange": 10000}],
          "forcedVariations": {}
        }
      ]
    },
    {
      "id": "r2",
      "experiments": [
        {
          "id": "400",
          "key": "exp_a",
          "status": "Running",
          "layerId": "r2",
          "audienceIds": [],
          "variations": [{"id": "1", "key": "shadowed", "featureEnabled": false}],
          "trafficAllocation": [{"entityId": "1", "endOfRange": 10000}],
          "forcedVariations": {}
        }
      ]
    }
  ],
  "events": []
})JSON";
    return datafile;
}

} // namespace test_data
} // namespace xcore
