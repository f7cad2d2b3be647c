/*
 * document.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-14

Description: In-memory ARXML document backed by tinyxml2

**************************************************/

#include "document.hpp"

#include "errors.hpp"

#include <spdlog/spdlog.h>

namespace arxml::document {

namespace {
template <typename E>
auto advance(E* node) -> E* {
    if (auto* child = node->FirstChildElement()) {
        return child;
    }
    while (node != nullptr) {
        if (auto* sibling = node->NextSiblingElement()) {
            return sibling;
        }
        auto* parent = node->Parent();
        node = parent != nullptr ? parent->ToElement() : nullptr;
    }
    return nullptr;
}
}  // namespace

Document::Document() = default;
Document::~Document() = default;

auto Document::parse(std::string_view content, std::string_view path,
                     TextEncoding sourceEncoding) -> std::unique_ptr<Document> {
    auto document = std::make_unique<Document>();
    document->path_ = std::string(path);
    document->sourceEncoding_ = sourceEncoding;

    auto result = document->doc_.Parse(content.data(), content.size());
    if (result != tinyxml2::XML_SUCCESS) {
        spdlog::error("Failed to parse XML '{}': {}", path,
                      document->doc_.ErrorStr());
        THROW_MALFORMED_DOCUMENT("Invalid XML in '{}' at line {}: {}", path,
                                 document->doc_.ErrorLineNum(),
                                 document->doc_.ErrorStr());
    }
    if (document->doc_.RootElement() == nullptr) {
        spdlog::error("XML '{}' has no root element", path);
        THROW_MALFORMED_DOCUMENT("Invalid XML in '{}': no root element", path);
    }

    spdlog::debug("Parsed XML '{}' with root <{}>", path,
                  document->doc_.RootElement()->Name());
    return document;
}

auto Document::root() -> Node* { return doc_.RootElement(); }
auto Document::root() const -> const Node* { return doc_.RootElement(); }

auto Document::path() const -> const std::string& { return path_; }
void Document::setPath(std::string_view path) { path_ = std::string(path); }

auto Document::sourceEncoding() const -> TextEncoding {
    return sourceEncoding_;
}

auto Document::elementCount() const -> std::size_t {
    std::size_t count = 0;
    for (const Node* node = root(); node != nullptr; node = advance(node)) {
        ++count;
    }
    return count;
}

auto Document::nextInPreOrder(Node* node) -> Node* {
    return node != nullptr ? advance(node) : nullptr;
}

auto Document::xml() -> tinyxml2::XMLDocument& { return doc_; }
auto Document::xml() const -> const tinyxml2::XMLDocument& { return doc_; }

auto nodeText(const Node& node) -> std::string {
    const char* text = node.GetText();
    if (text == nullptr) {
        return {};
    }
    std::string_view view(text);
    const auto first = view.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = view.find_last_not_of(" \t\r\n");
    return std::string(view.substr(first, last - first + 1));
}

}  // namespace arxml::document
