/*
 * factory.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-16

Description: Construction of DocumentContext instances

**************************************************/

#ifndef ARXML_DOCUMENT_FACTORY_HPP
#define ARXML_DOCUMENT_FACTORY_HPP

#include <memory>

#include "context.hpp"

namespace arxml::document {

/**
 * @brief Builds DocumentContext instances from standard or caller-supplied
 * capabilities.
 */
class ContextFactory {
public:
    /**
     * @brief A context using FileDocumentStore, TreeQueryEngine and
     * ElementAttributeEditor.
     */
    static auto createDefault(const StoreOptions& options = {})
        -> DocumentContext;

    /**
     * @brief A context using the given capabilities; any null argument is
     * replaced by the standard implementation.
     */
    static auto createCustom(std::unique_ptr<DocumentStore> store = nullptr,
                             std::unique_ptr<QueryEngine> query = nullptr,
                             std::unique_ptr<AttributeEditor> editor = nullptr)
        -> DocumentContext;
};

}  // namespace arxml::document

#endif  // ARXML_DOCUMENT_FACTORY_HPP
