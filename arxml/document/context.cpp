/*
 * context.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-16

Description: Load/query/mutate/save orchestration for one ARXML document

**************************************************/

#include "context.hpp"

#include "errors.hpp"

#include <set>

#include <spdlog/spdlog.h>

namespace arxml::document {

DocumentContext::DocumentContext(std::unique_ptr<DocumentStore> store,
                                 std::unique_ptr<QueryEngine> query,
                                 std::unique_ptr<AttributeEditor> editor)
    : store_(std::move(store)),
      query_(std::move(query)),
      editor_(std::move(editor)) {
    if (!store_ || !query_ || !editor_) {
        THROW_EXCEPTION(
            "DocumentContext requires a store, a query engine and an editor");
    }
}

DocumentContext::~DocumentContext() = default;
DocumentContext::DocumentContext(DocumentContext&&) noexcept = default;
auto DocumentContext::operator=(DocumentContext&&) noexcept
    -> DocumentContext& = default;

void DocumentContext::load(std::string_view path) {
    requireCapabilities("load");
    auto document = store_->read(path);
    if (!document) {
        THROW_MALFORMED_DOCUMENT("Store returned no document for {}", path);
    }
    document_ = std::move(document);
    outputPath_ = std::string(path);
    notify(ContextEventType::Loaded, "load", document_->elementCount());
}

void DocumentContext::adopt(std::unique_ptr<Document> document) {
    if (!document) {
        THROW_EXCEPTION("Cannot adopt a null document");
    }
    document_ = std::move(document);
    outputPath_ = document_->path();
    spdlog::debug("Adopted document with {} elements",
                  document_->elementCount());
    notify(ContextEventType::Loaded, "adopt", document_->elementCount());
}

void DocumentContext::save(std::string_view outputPath) {
    auto& document = requireDocument("save");

    std::string target =
        outputPath.empty() ? outputPath_ : std::string(outputPath);
    if (target.empty()) {
        spdlog::error("Cannot save ARXML document: no output path specified");
        THROW_NO_OUTPUT_PATH("No output path specified");
    }

    store_->write(document, target);
    document.setPath(target);
    outputPath_ = std::move(target);
    notify(ContextEventType::Saved, "save", document.elementCount());
}

auto DocumentContext::state() const -> ContextState {
    return document_ ? ContextState::Loaded : ContextState::Empty;
}

auto DocumentContext::isLoaded() const -> bool {
    return state() == ContextState::Loaded;
}

auto DocumentContext::document() -> Document& {
    return requireDocument("access document");
}

auto DocumentContext::outputPath() const -> const std::string& {
    return outputPath_;
}

auto DocumentContext::findByTag(std::string_view tag) -> NodeList {
    return query_->findByTag(requireDocument("findByTag"), tag);
}

auto DocumentContext::findByPath(std::string_view expression) -> NodeList {
    return query_->findByPath(requireDocument("findByPath"), expression);
}

auto DocumentContext::findByAttribute(std::string_view name,
                                      std::string_view value) -> NodeList {
    return query_->findByAttribute(requireDocument("findByAttribute"), name,
                                   value);
}

template <typename Apply>
auto DocumentContext::runBatch(std::string_view operation,
                               const NodeList& nodes, Apply&& apply)
    -> std::size_t {
    requireDocument(operation);

    std::size_t affected = 0;
    for (Node* node : nodes) {
        if (apply(*node)) {
            ++affected;
        }
    }

    spdlog::debug("{} affected {} of {} nodes", operation, affected,
                  nodes.size());
    notify(ContextEventType::Mutated, operation, affected);
    return affected;
}

auto DocumentContext::addToNodes(const NodeList& nodes, std::string_view name,
                                 std::string_view value) -> std::size_t {
    return runBatch("addToNodes", nodes, [&](Node& node) {
        editor_->add(node, name, value);
        return true;
    });
}

auto DocumentContext::editInNodes(const NodeList& nodes, std::string_view name,
                                  std::string_view value) -> std::size_t {
    return runBatch("editInNodes", nodes, [&](Node& node) {
        return editor_->edit(node, name, value);
    });
}

auto DocumentContext::deleteFromNodes(const NodeList& nodes,
                                      std::string_view name) -> std::size_t {
    return runBatch("deleteFromNodes", nodes,
                    [&](Node& node) { return editor_->remove(node, name); });
}

auto DocumentContext::addByTag(std::string_view tag, std::string_view name,
                               std::string_view value) -> std::size_t {
    const auto nodes = findByTag(tag);
    return runBatch("addByTag", nodes, [&](Node& node) {
        editor_->add(node, name, value);
        return true;
    });
}

auto DocumentContext::editByTag(std::string_view tag, std::string_view name,
                                std::string_view value) -> std::size_t {
    const auto nodes = findByTag(tag);
    return runBatch("editByTag", nodes, [&](Node& node) {
        return editor_->edit(node, name, value);
    });
}

auto DocumentContext::deleteByTag(std::string_view tag, std::string_view name)
    -> std::size_t {
    const auto nodes = findByTag(tag);
    return runBatch("deleteByTag", nodes,
                    [&](Node& node) { return editor_->remove(node, name); });
}

auto DocumentContext::elementInfo(const Node& node) const -> ElementInfo {
    ElementInfo info;
    info.tag = node.Name();
    for (const tinyxml2::XMLAttribute* attribute = node.FirstAttribute();
         attribute != nullptr; attribute = attribute->Next()) {
        info.attributes.emplace_back(attribute->Name(), attribute->Value());
    }
    auto text = nodeText(node);
    if (!text.empty()) {
        info.text = std::move(text);
    }
    for (const Node* child = node.FirstChildElement(); child != nullptr;
         child = child->NextSiblingElement()) {
        ++info.childCount;
    }
    return info;
}

auto DocumentContext::listAllTags() -> std::vector<std::string> {
    auto& document = requireDocument("listAllTags");
    std::set<std::string> tags;
    document.forEachNode([&](Node& node) { tags.emplace(node.Name()); });
    return std::vector<std::string>(tags.begin(), tags.end());
}

void DocumentContext::setEventCallback(EventCallback callback) {
    callback_ = std::move(callback);
}

void DocumentContext::requireCapabilities(std::string_view operation) const {
    if (!store_ || !query_ || !editor_) {
        spdlog::error("Cannot {}: context has been moved from", operation);
        THROW_EXCEPTION("DocumentContext has been moved from: cannot {}",
                        operation);
    }
}

auto DocumentContext::requireDocument(std::string_view operation)
    -> Document& {
    requireCapabilities(operation);
    if (!document_) {
        spdlog::error("Cannot {}: no ARXML file loaded", operation);
        THROW_NO_DOCUMENT_LOADED("No ARXML file loaded: cannot {}", operation);
    }
    return *document_;
}

void DocumentContext::notify(ContextEventType type, std::string_view operation,
                             std::size_t affected) const {
    if (!callback_) {
        return;
    }
    callback_(ContextEvent{type, std::string(operation),
                           document_ ? document_->path() : std::string{},
                           affected});
}

}  // namespace arxml::document
