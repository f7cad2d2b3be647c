/*
 * editor.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-15

Description: Single-node attribute mutation

**************************************************/

#include "editor.hpp"

#include <string>

#include <spdlog/spdlog.h>

namespace arxml::document {

void ElementAttributeEditor::add(Node& node, std::string_view name,
                                 std::string_view value) {
    // tinyxml2 keeps the position of an existing attribute on overwrite.
    node.SetAttribute(std::string(name).c_str(), std::string(value).c_str());
    spdlog::trace("Set {}='{}' on <{}>", name, value, node.Name());
}

auto ElementAttributeEditor::edit(Node& node, std::string_view name,
                                  std::string_view value) -> bool {
    const std::string attributeName(name);
    if (node.FindAttribute(attributeName.c_str()) == nullptr) {
        return false;
    }
    node.SetAttribute(attributeName.c_str(), std::string(value).c_str());
    spdlog::trace("Edited {}='{}' on <{}>", name, value, node.Name());
    return true;
}

auto ElementAttributeEditor::remove(Node& node, std::string_view name) -> bool {
    const std::string attributeName(name);
    if (node.FindAttribute(attributeName.c_str()) == nullptr) {
        return false;
    }
    node.DeleteAttribute(attributeName.c_str());
    spdlog::trace("Removed {} from <{}>", name, node.Name());
    return true;
}

}  // namespace arxml::document
