/*
 * query.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-15

Description: Searching ARXML trees by tag, path or attribute value

**************************************************/

#include "query.hpp"

#include "path_expression.hpp"

#include <string>
#include <unordered_set>

#include <spdlog/spdlog.h>

namespace arxml::document {

namespace {
using ContextSet = std::unordered_set<const tinyxml2::XMLNode*>;

auto hasAncestorIn(const Node& node, const ContextSet& context) -> bool {
    for (const tinyxml2::XMLNode* ancestor = node.Parent(); ancestor != nullptr;
         ancestor = ancestor->Parent()) {
        if (context.contains(ancestor)) {
            return true;
        }
    }
    return false;
}
}  // namespace

auto TreeQueryEngine::findByTag(Document& document, std::string_view tag)
    -> NodeList {
    NodeList matches;
    document.forEachNode([&](Node& node) {
        if (tag == node.Name()) {
            matches.push_back(&node);
        }
    });
    spdlog::debug("findByTag('{}') matched {} elements", tag, matches.size());
    return matches;
}

auto TreeQueryEngine::findByPath(Document& document,
                                 std::string_view expression) -> NodeList {
    const auto path = PathExpression::parse(expression);

    if (path.steps().empty()) {
        return {document.root()};
    }

    ContextSet context;
    if (path.origin() == PathExpression::Origin::Document) {
        context.insert(&document.xml());
    } else {
        context.insert(document.root());
    }

    // Each step is resolved with one pre-order pass, which keeps results in
    // document order and free of duplicates.
    NodeList selected;
    for (const auto& step : path.steps()) {
        selected.clear();
        document.forEachNode([&](Node& node) {
            if (!step.matches(node.Name())) {
                return;
            }
            const bool inScope =
                step.axis == PathStep::Axis::Child
                    ? context.contains(node.Parent())
                    : hasAncestorIn(node, context);
            if (inScope) {
                selected.push_back(&node);
            }
        });
        if (selected.empty()) {
            break;
        }
        context.clear();
        context.insert(selected.begin(), selected.end());
    }

    spdlog::debug("findByPath('{}') matched {} elements", expression,
                  selected.size());
    return selected;
}

auto TreeQueryEngine::findByAttribute(Document& document,
                                      std::string_view name,
                                      std::string_view value) -> NodeList {
    const std::string attributeName(name);
    NodeList matches;
    document.forEachNode([&](Node& node) {
        const char* current = node.Attribute(attributeName.c_str());
        if (current != nullptr && value == current) {
            matches.push_back(&node);
        }
    });
    spdlog::debug("findByAttribute('{}', '{}') matched {} elements", name,
                  value, matches.size());
    return matches;
}

}  // namespace arxml::document
