/*
 * query.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-15

Description: Searching ARXML trees by tag, path or attribute value

**************************************************/

#ifndef ARXML_DOCUMENT_QUERY_HPP
#define ARXML_DOCUMENT_QUERY_HPP

#include <string_view>

#include "document.hpp"

namespace arxml::document {

/**
 * @brief Interface for locating nodes in a document.
 *
 * Every finder returns matches in document (depth-first, pre-order) order.
 */
class QueryEngine {
public:
    virtual ~QueryEngine() = default;

    /**
     * @brief Finds every element, root included, whose tag equals @p tag.
     * @param tag Tag as stored in the document, namespace prefix included.
     */
    virtual auto findByTag(Document& document, std::string_view tag)
        -> NodeList = 0;

    /**
     * @brief Evaluates a restricted path expression.
     * @throws InvalidQueryError if the expression is outside the subset.
     */
    virtual auto findByPath(Document& document, std::string_view expression)
        -> NodeList = 0;

    /**
     * @brief Finds elements whose attribute @p name equals @p value exactly.
     */
    virtual auto findByAttribute(Document& document, std::string_view name,
                                 std::string_view value) -> NodeList = 0;
};

/**
 * @brief QueryEngine that walks the tinyxml2 tree directly.
 */
class TreeQueryEngine : public QueryEngine {
public:
    auto findByTag(Document& document, std::string_view tag)
        -> NodeList override;
    auto findByPath(Document& document, std::string_view expression)
        -> NodeList override;
    auto findByAttribute(Document& document, std::string_view name,
                         std::string_view value) -> NodeList override;
};

}  // namespace arxml::document

#endif  // ARXML_DOCUMENT_QUERY_HPP
