/*
 * factory.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-16

Description: Construction of DocumentContext instances

**************************************************/

#include "factory.hpp"

#include <spdlog/spdlog.h>

namespace arxml::document {

auto ContextFactory::createDefault(const StoreOptions& options)
    -> DocumentContext {
    return DocumentContext(std::make_unique<FileDocumentStore>(options),
                           std::make_unique<TreeQueryEngine>(),
                           std::make_unique<ElementAttributeEditor>());
}

auto ContextFactory::createCustom(std::unique_ptr<DocumentStore> store,
                                  std::unique_ptr<QueryEngine> query,
                                  std::unique_ptr<AttributeEditor> editor)
    -> DocumentContext {
    spdlog::debug("Creating custom context (store: {}, query: {}, editor: {})",
                  store ? "custom" : "default", query ? "custom" : "default",
                  editor ? "custom" : "default");
    if (!store) {
        store = std::make_unique<FileDocumentStore>();
    }
    if (!query) {
        query = std::make_unique<TreeQueryEngine>();
    }
    if (!editor) {
        editor = std::make_unique<ElementAttributeEditor>();
    }
    return DocumentContext(std::move(store), std::move(query),
                           std::move(editor));
}

}  // namespace arxml::document
