/*
 * store.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-14

Description: Reading and writing ARXML documents

**************************************************/

#include "store.hpp"

#include "encoding.hpp"
#include "errors.hpp"

#include <cerrno>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace arxml::document {

namespace {
/**
 * XMLPrinter whose output can be narrowed to ISO-8859-1 without changing the
 * tree: markup that cannot hold a character reference must already fit the
 * encoding, and CDATA that does not fit is written as escaped text.
 */
class Latin1Printer : public tinyxml2::XMLPrinter {
public:
    explicit Latin1Printer(bool compact) : XMLPrinter(nullptr, compact) {}

    using XMLPrinter::Visit;

    auto VisitEnter(const tinyxml2::XMLElement& element,
                    const tinyxml2::XMLAttribute* attribute)
        -> bool override {
        requireLatin1("element name", element.Name());
        for (const auto* it = attribute; it != nullptr; it = it->Next()) {
            requireLatin1("attribute name", it->Name());
        }
        return XMLPrinter::VisitEnter(element, attribute);
    }

    auto Visit(const tinyxml2::XMLText& text) -> bool override {
        if (text.CData() && !fitsLatin1(text.Value())) {
            PushText(text.Value(), false);
            return true;
        }
        return XMLPrinter::Visit(text);
    }

    auto Visit(const tinyxml2::XMLComment& comment) -> bool override {
        requireLatin1("comment", comment.Value());
        return XMLPrinter::Visit(comment);
    }

    auto Visit(const tinyxml2::XMLDeclaration& declaration) -> bool override {
        requireLatin1("processing instruction", declaration.Value());
        return XMLPrinter::Visit(declaration);
    }

    auto Visit(const tinyxml2::XMLUnknown& unknown) -> bool override {
        requireLatin1("markup declaration", unknown.Value());
        return XMLPrinter::Visit(unknown);
    }

private:
    static void requireLatin1(std::string_view what, const char* value) {
        if (!fitsLatin1(value)) {
            spdlog::error("Cannot encode {} '{}' as {}", what, value,
                          LATIN1_LABEL);
            THROW_WRITE_FAILURE("Cannot encode {} '{}' as {}", what, value,
                                LATIN1_LABEL);
        }
    }
};

// tinyxml2 parses every <?...?> as a declaration; only <?xml ...?> is one.
auto isXmlDeclaration(const tinyxml2::XMLNode& node) -> bool {
    if (node.ToDeclaration() == nullptr) {
        return false;
    }
    const std::string_view value(node.Value());
    return value == "xml" || value.starts_with("xml ") ||
           value.starts_with("xml\t") || value.starts_with("xml\n") ||
           value.starts_with("xml\r");
}
}  // namespace

FileDocumentStore::FileDocumentStore(const StoreOptions& options)
    : options_(options) {}

auto FileDocumentStore::read(std::string_view path)
    -> std::unique_ptr<Document> {
    spdlog::info("Loading ARXML file: {}", path);

    const fs::path filePath(path);
    std::error_code ec;
    if (path.empty() || !fs::exists(filePath, ec)) {
        spdlog::error("File {} not found", path);
        THROW_NOT_FOUND("File {} not found", path);
    }
    if (!fs::is_regular_file(filePath, ec)) {
        spdlog::error("Path {} is not a regular file", path);
        THROW_NOT_FOUND("Path {} is not a regular file", path);
    }

    std::ifstream file(filePath, std::ios::binary);
    if (!file) {
        const std::error_code cause(errno, std::generic_category());
        spdlog::error("Cannot open file {}: {}", path, cause.message());
        THROW_NOT_FOUND("Cannot open file {}: {}", path, cause.message());
    }
    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());
    if (file.bad()) {
        spdlog::error("Failed to read file {}", path);
        THROW_NOT_FOUND("Failed to read file {}", path);
    }

    stripUtf8Bom(content);
    if (hasWideBom(content)) {
        spdlog::error("File {} uses a wide-character encoding", path);
        THROW_MALFORMED_DOCUMENT(
            "Invalid XML file {}: UTF-16/UTF-32 content is not supported",
            path);
    }

    const auto label = declaredEncoding(content);
    const auto encoding = encodingFromLabel(label);
    if (encoding == TextEncoding::Unsupported) {
        spdlog::error("File {} declares unsupported encoding '{}'", path,
                      label);
        THROW_MALFORMED_DOCUMENT("Invalid XML file {}: unsupported encoding '{}'",
                                 path, label);
    }
    if (encoding == TextEncoding::Latin1) {
        content = latin1ToUtf8(content);
    }

    auto document = Document::parse(content, path, encoding);
    spdlog::info("Successfully loaded ARXML file: {} ({} elements)", path,
                 document->elementCount());
    return document;
}

auto FileDocumentStore::serialize(const Document& document) const
    -> std::string {
    const auto encoding = options_.encoding == OutputEncoding::Latin1
                              ? TextEncoding::Latin1
                              : TextEncoding::Utf8;

    const auto declaration = fmt::format("xml version=\"1.0\" encoding=\"{}\"",
                                         encodingLabel(encoding));
    auto print = [&](tinyxml2::XMLPrinter& printer) {
        printer.PushDeclaration(declaration.c_str());
        // The source declaration is replaced by the one above.
        for (const tinyxml2::XMLNode* node = document.xml().FirstChild();
             node != nullptr; node = node->NextSibling()) {
            if (isXmlDeclaration(*node)) {
                continue;
            }
            node->Accept(&printer);
        }
        return std::string(printer.CStr());
    };

    if (encoding == TextEncoding::Latin1) {
        Latin1Printer printer(options_.compact);
        return utf8ToLatin1(print(printer));
    }
    tinyxml2::XMLPrinter printer(nullptr, options_.compact);
    return print(printer);
}

void FileDocumentStore::write(const Document& document,
                              std::string_view path) {
    spdlog::info("Saving ARXML file: {}", path);

    const fs::path filePath(path);
    if (filePath.empty()) {
        spdlog::error("Cannot save ARXML file: empty path");
        THROW_WRITE_FAILURE("Failed to write file: empty path");
    }

    const auto content = serialize(document);

    if (filePath.has_parent_path()) {
        try {
            fs::create_directories(filePath.parent_path());
        } catch (const fs::filesystem_error& e) {
            spdlog::error("Failed to create directory for {}: {}", path,
                          e.what());
            THROW_NESTED_WRITE_FAILURE("Failed to write file {}: {}", path,
                                       e.what());
        }
    }

    std::ofstream file(filePath, std::ios::binary | std::ios::trunc);
    if (!file) {
        const std::error_code cause(errno, std::generic_category());
        spdlog::error("Cannot open {} for writing: {}", path, cause.message());
        THROW_WRITE_FAILURE("Failed to write file {}: {}", path,
                            cause.message());
    }
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    file.flush();
    if (!file) {
        const std::error_code cause(errno, std::generic_category());
        spdlog::error("Write to {} failed: {}", path, cause.message());
        THROW_WRITE_FAILURE("Failed to write file {}: {}", path,
                            cause.message());
    }

    spdlog::info("Successfully saved ARXML file: {}", path);
}

auto FileDocumentStore::options() const -> const StoreOptions& {
    return options_;
}

}  // namespace arxml::document
