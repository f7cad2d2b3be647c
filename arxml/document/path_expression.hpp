/*
 * path_expression.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-15

Description: Parser for the restricted element path syntax

**************************************************/

#ifndef ARXML_DOCUMENT_PATH_EXPRESSION_HPP
#define ARXML_DOCUMENT_PATH_EXPRESSION_HPP

#include <string>
#include <string_view>
#include <vector>

namespace arxml::document {

/**
 * @brief A single location step: an axis and a name test.
 */
struct PathStep {
    enum class Axis {
        Child,      ///< `/name`
        Descendant  ///< `//name`
    };

    Axis axis = Axis::Child;
    std::string name;  ///< Exact tag, or "*" for any element

    [[nodiscard]] auto isWildcard() const -> bool { return name == "*"; }
    [[nodiscard]] auto matches(std::string_view tag) const -> bool {
        return isWildcard() || name == tag;
    }
};

/**
 * @brief A parsed path expression.
 *
 * Supported forms:
 * - `A/B`, `./A/B`   child steps starting at the root element
 * - `.//A`, `A//B`   descendant steps
 * - `/ROOT/A`        absolute path, first step names the root element
 * - `//A`            any element in the document, root included
 * - `*`              wildcard name test in any step
 * - `.`              the root element itself
 *
 * Anything else (predicates, attributes, parent steps, functions, `{uri}`
 * names) is rejected with InvalidQueryError.
 */
class PathExpression {
public:
    /**
     * @brief Where evaluation starts.
     */
    enum class Origin {
        Root,     ///< The root element is the context node
        Document  ///< The document node, parent of the root element
    };

    /**
     * @brief Parses @p expression.
     * @throws InvalidQueryError if the expression is outside the subset.
     */
    static auto parse(std::string_view expression) -> PathExpression;

    [[nodiscard]] auto origin() const -> Origin { return origin_; }
    [[nodiscard]] auto steps() const -> const std::vector<PathStep>& {
        return steps_;
    }
    [[nodiscard]] auto text() const -> const std::string& { return text_; }

private:
    Origin origin_ = Origin::Root;
    std::vector<PathStep> steps_;
    std::string text_;
};

}  // namespace arxml::document

#endif  // ARXML_DOCUMENT_PATH_EXPRESSION_HPP
