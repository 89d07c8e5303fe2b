#include "config/condition_parser.hpp"
#include "common/error_handling.hpp"

namespace xcore {
namespace config {

using nlohmann::json;

ConditionNode ConditionParser::parse_audience_conditions(const json& conditions) {
    if (conditions.is_string()) {
        json parsed;
        try {
            parsed = json::parse(conditions.get<std::string>());
        } catch (const json::parse_error& e) {
            throw common::ConfigException(std::string("unparsable audience conditions: ") + e.what());
        }
        return parse_node(parsed, LeafMode::ATTRIBUTE_CONDITION);
    }
    return parse_node(conditions, LeafMode::ATTRIBUTE_CONDITION);
}

ConditionNode ConditionParser::parse_audience_reference_tree(const json& conditions) {
    return parse_node(conditions, LeafMode::AUDIENCE_ID);
}

ConditionNode ConditionParser::from_audience_ids(const std::vector<std::string>& audience_ids) {
    std::vector<ConditionNode> children;
    children.reserve(audience_ids.size());
    for (const auto& id : audience_ids) {
        children.push_back(ConditionNode::make_audience_ref(id));
    }
    return ConditionNode::make_or(std::move(children));
}

ConditionNode ConditionParser::parse_node(const json& node, LeafMode mode) {
    if (node.is_array()) {
        return parse_list(node, mode);
    }

    if (mode == LeafMode::ATTRIBUTE_CONDITION && node.is_object()) {
        return ConditionNode::make_leaf(parse_leaf(node));
    }

    if (mode == LeafMode::AUDIENCE_ID && node.is_string()) {
        return ConditionNode::make_audience_ref(node.get<std::string>());
    }

    throw common::ConfigException("unexpected condition element: " + node.dump());
}

ConditionNode ConditionParser::parse_list(const json& list, LeafMode mode) {
    std::size_t first_operand = 0;
    ConditionNode::Kind kind = ConditionNode::Kind::OR;

    if (!list.empty() && list[0].is_string()) {
        const std::string op = list[0].get<std::string>();
        if (op == "and") {
            kind = ConditionNode::Kind::AND;
            first_operand = 1;
        } else if (op == "or") {
            first_operand = 1;
        } else if (op == "not") {
            kind = ConditionNode::Kind::NOT;
            first_operand = 1;
        }
    }

    std::vector<ConditionNode> children;
    for (std::size_t i = first_operand; i < list.size(); ++i) {
        children.push_back(parse_node(list[i], mode));
    }

    ConditionNode node;
    node.kind = kind;
    node.children = std::move(children);
    return node;
}

ConditionLeaf ConditionParser::parse_leaf(const json& leaf) {
    ConditionLeaf result;

    auto name = leaf.find("name");
    if (name == leaf.end() || !name->is_string()) {
        throw common::ConfigException("condition without attribute name: " + leaf.dump());
    }
    result.name = name->get<std::string>();

    auto type = leaf.find("type");
    if (type != leaf.end() && type->is_string()) {
        result.type = type->get<std::string>();
    }

    auto match = leaf.find("match");
    if (match != leaf.end() && match->is_string()) {
        result.raw_match = match->get<std::string>();
    }
    result.match = match_type_from_string(result.raw_match);

    auto value = leaf.find("value");
    if (value != leaf.end()) {
        result.value = parse_value(*value);
    }

    return result;
}

AttributeValue ConditionParser::parse_value(const json& value) {
    if (value.is_string()) {
        return AttributeValue(value.get<std::string>());
    }
    if (value.is_boolean()) {
        return AttributeValue(value.get<bool>());
    }
    if (value.is_number()) {
        return AttributeValue(value.get<double>());
    }
    // null or structured values cannot be compared against
    return AttributeValue();
}

} // namespace config
} // namespace xcore
