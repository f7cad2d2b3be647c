/*
 * editor.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-15

Description: Single-node attribute mutation

**************************************************/

#ifndef ARXML_DOCUMENT_EDITOR_HPP
#define ARXML_DOCUMENT_EDITOR_HPP

#include <string_view>

#include "document.hpp"

namespace arxml::document {

/**
 * @brief Interface for adding, editing and removing one attribute on one
 * node.
 *
 * A missing attribute is a normal outcome reported through the return value,
 * never an error.
 */
class AttributeEditor {
public:
    virtual ~AttributeEditor() = default;

    /**
     * @brief Sets @p name to @p value, overwriting any existing value.
     */
    virtual void add(Node& node, std::string_view name,
                     std::string_view value) = 0;

    /**
     * @brief Overwrites @p name if present.
     * @return true if the attribute existed and was changed, false otherwise
     * (the node is left untouched).
     */
    virtual auto edit(Node& node, std::string_view name,
                      std::string_view value) -> bool = 0;

    /**
     * @brief Removes @p name if present.
     * @return true if the attribute existed and was removed.
     */
    virtual auto remove(Node& node, std::string_view name) -> bool = 0;
};

/**
 * @brief AttributeEditor operating on tinyxml2 elements in place.
 */
class ElementAttributeEditor : public AttributeEditor {
public:
    void add(Node& node, std::string_view name,
             std::string_view value) override;
    auto edit(Node& node, std::string_view name, std::string_view value)
        -> bool override;
    auto remove(Node& node, std::string_view name) -> bool override;
};

}  // namespace arxml::document

#endif  // ARXML_DOCUMENT_EDITOR_HPP
