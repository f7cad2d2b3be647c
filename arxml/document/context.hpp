/*
 * context.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-16

Description: Load/query/mutate/save orchestration for one ARXML document

**************************************************/

#ifndef ARXML_DOCUMENT_CONTEXT_HPP
#define ARXML_DOCUMENT_CONTEXT_HPP

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "document.hpp"
#include "editor.hpp"
#include "query.hpp"
#include "store.hpp"

namespace arxml::document {

/**
 * @brief Lifecycle states of a DocumentContext.
 */
enum class ContextState {
    Empty,  ///< No document held
    Loaded  ///< A document is held; finds, mutations and saves are allowed
};

/**
 * @brief Kinds of events reported through the context's event callback.
 */
enum class ContextEventType { Loaded, Saved, Mutated };

/**
 * @brief Structured notification emitted after a successful operation.
 */
struct ContextEvent {
    ContextEventType type;
    std::string operation;  ///< Name of the public operation, e.g. "editByTag"
    std::string path;       ///< Document path at the time of the event
    std::size_t affected = 0;  ///< Elements loaded, or nodes mutated
};

using EventCallback = std::function<void(const ContextEvent&)>;

/**
 * @brief Summary of a single element.
 */
struct ElementInfo {
    std::string tag;
    std::vector<std::pair<std::string, std::string>>
        attributes;                   ///< In document order
    std::optional<std::string> text;  ///< Trimmed, nullopt when empty
    std::size_t childCount = 0;       ///< Number of child elements
};

/**
 * @brief Holds at most one loaded document and runs finds and attribute
 * batches against it.
 *
 * The context starts Empty. load() or adopt() moves it to Loaded; it stays
 * Loaded through mutations and saves. Node handles returned by the finders
 * are invalidated by the next load() or adopt().
 *
 * Not thread-safe: callers serialize access to one context.
 *
 * Example usage:
 * @code
 * auto context = ContextFactory::createDefault();
 * context.load("ecu_config.arxml");
 * context.addByTag("ECUC-MODULE-CONFIGURATION-VALUES", "version", "1.0");
 * context.save("output/ecu_config.arxml");
 * @endcode
 */
class DocumentContext {
public:
    DocumentContext(std::unique_ptr<DocumentStore> store,
                    std::unique_ptr<QueryEngine> query,
                    std::unique_ptr<AttributeEditor> editor);
    ~DocumentContext();

    DocumentContext(const DocumentContext&) = delete;
    auto operator=(const DocumentContext&) -> DocumentContext& = delete;
    // A moved-from context may only be destroyed or assigned to; load() and
    // every operation that needs a document throw error::Exception on it.
    DocumentContext(DocumentContext&&) noexcept;
    auto operator=(DocumentContext&&) noexcept -> DocumentContext&;

    /**
     * @brief Loads @p path, replacing any held document.
     *
     * On failure the previously held document, if any, is kept.
     *
     * @throws NotFoundError if the file does not exist.
     * @throws MalformedDocumentError if it cannot be parsed.
     */
    void load(std::string_view path);

    /**
     * @brief Takes ownership of an already built document, replacing any
     * held one. The default output path becomes the document's own path,
     * which may be empty.
     *
     * @throws error::Exception if @p document is null.
     */
    void adopt(std::unique_ptr<Document> document);

    /**
     * @brief Persists the held document.
     *
     * @param outputPath Target file; when empty the path the document was
     * loaded from (or last saved to) is used. A successful save remembers
     * the target as the new default.
     * @throws NoDocumentLoadedError if the context is Empty.
     * @throws NoOutputPathError if no target is known.
     * @throws WriteFailureError if writing fails.
     */
    void save(std::string_view outputPath = {});

    [[nodiscard]] auto state() const -> ContextState;
    [[nodiscard]] auto isLoaded() const -> bool;

    /**
     * @brief The held document.
     * @throws NoDocumentLoadedError if the context is Empty.
     */
    [[nodiscard]] auto document() -> Document&;

    /**
     * @brief Path save() falls back to; empty if none is known.
     */
    [[nodiscard]] auto outputPath() const -> const std::string&;

    auto findByTag(std::string_view tag) -> NodeList;
    auto findByPath(std::string_view expression) -> NodeList;
    auto findByAttribute(std::string_view name, std::string_view value)
        -> NodeList;

    /**
     * @brief Sets @p name on every node.
     * @return The number of nodes, since adding always succeeds.
     */
    auto addToNodes(const NodeList& nodes, std::string_view name,
                    std::string_view value) -> std::size_t;

    /**
     * @brief Edits @p name on every node that already has it.
     * @return The number of nodes that had the attribute.
     */
    auto editInNodes(const NodeList& nodes, std::string_view name,
                     std::string_view value) -> std::size_t;

    /**
     * @brief Removes @p name from every node that has it.
     * @return The number of nodes that had the attribute.
     */
    auto deleteFromNodes(const NodeList& nodes, std::string_view name)
        -> std::size_t;

    auto addByTag(std::string_view tag, std::string_view name,
                  std::string_view value) -> std::size_t;
    auto editByTag(std::string_view tag, std::string_view name,
                   std::string_view value) -> std::size_t;
    auto deleteByTag(std::string_view tag, std::string_view name)
        -> std::size_t;

    [[nodiscard]] auto elementInfo(const Node& node) const -> ElementInfo;

    /**
     * @brief Sorted, de-duplicated tags of every element in the document.
     * @throws NoDocumentLoadedError if the context is Empty.
     */
    auto listAllTags() -> std::vector<std::string>;

    /**
     * @brief Installs a callback notified after each successful load, save
     * and batch mutation. Pass an empty function to remove it.
     */
    void setEventCallback(EventCallback callback);

private:
    void requireCapabilities(std::string_view operation) const;
    auto requireDocument(std::string_view operation) -> Document&;

    template <typename Apply>
    auto runBatch(std::string_view operation, const NodeList& nodes,
                  Apply&& apply) -> std::size_t;

    void notify(ContextEventType type, std::string_view operation,
                std::size_t affected) const;

    std::unique_ptr<DocumentStore> store_;
    std::unique_ptr<QueryEngine> query_;
    std::unique_ptr<AttributeEditor> editor_;
    std::unique_ptr<Document> document_;
    std::string outputPath_;
    EventCallback callback_;
};

}  // namespace arxml::document

#endif  // ARXML_DOCUMENT_CONTEXT_HPP
