/*
 * document.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-14

Description: In-memory ARXML document backed by tinyxml2

**************************************************/

#ifndef ARXML_DOCUMENT_DOCUMENT_HPP
#define ARXML_DOCUMENT_DOCUMENT_HPP

#include <tinyxml2.h>

#include <concepts>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "encoding.hpp"

namespace arxml::document {

/// One element of the tree: tag, ordered attributes, children, text.
using Node = tinyxml2::XMLElement;

/// Non-owning handles into a Document, in document order.
using NodeList = std::vector<Node*>;

template <typename F>
concept NodeVisitor = std::invocable<F, Node&>;

/**
 * @brief A parsed ARXML tree together with the path it was loaded from or
 * last saved to.
 *
 * The tree is owned by the Document; Node pointers handed out by queries stay
 * valid for as long as the Document lives and the node is not removed.
 */
class Document {
public:
    Document();
    ~Document();

    Document(const Document&) = delete;
    auto operator=(const Document&) -> Document& = delete;

    /**
     * @brief Parses UTF-8 XML text into a new Document.
     *
     * @param content Well-formed XML text in UTF-8.
     * @param path Path recorded as the document origin; may be empty.
     * @param sourceEncoding Encoding the content was decoded from.
     * @throws MalformedDocumentError if the content is not well-formed or has
     * no root element.
     */
    static auto parse(std::string_view content, std::string_view path = {},
                      TextEncoding sourceEncoding = TextEncoding::Utf8)
        -> std::unique_ptr<Document>;

    [[nodiscard]] auto root() -> Node*;
    [[nodiscard]] auto root() const -> const Node*;

    [[nodiscard]] auto path() const -> const std::string&;
    void setPath(std::string_view path);

    /**
     * @brief Encoding declared by the source the document was read from.
     */
    [[nodiscard]] auto sourceEncoding() const -> TextEncoding;

    /**
     * @brief Number of elements in the tree, root included.
     */
    [[nodiscard]] auto elementCount() const -> std::size_t;

    /**
     * @brief Calls @p visitor for every element in depth-first pre-order,
     * starting with the root.
     */
    template <NodeVisitor F>
    void forEachNode(F&& visitor) {
        Node* node = root();
        while (node != nullptr) {
            visitor(*node);
            node = nextInPreOrder(node);
        }
    }

    /**
     * @brief Returns the element following @p node in depth-first pre-order,
     * or nullptr at the end of the tree.
     */
    static auto nextInPreOrder(Node* node) -> Node*;

    /**
     * @brief Access to the underlying tinyxml2 document, for serialization.
     */
    [[nodiscard]] auto xml() -> tinyxml2::XMLDocument&;
    [[nodiscard]] auto xml() const -> const tinyxml2::XMLDocument&;

private:
    tinyxml2::XMLDocument doc_;
    std::string path_;
    TextEncoding sourceEncoding_ = TextEncoding::Utf8;
};

/**
 * @brief Trimmed text content of @p node, empty if it has none.
 */
auto nodeText(const Node& node) -> std::string;

}  // namespace arxml::document

#endif  // ARXML_DOCUMENT_DOCUMENT_HPP
