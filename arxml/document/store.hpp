/*
 * store.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-14

Description: Reading and writing ARXML documents

**************************************************/

#ifndef ARXML_DOCUMENT_STORE_HPP
#define ARXML_DOCUMENT_STORE_HPP

#include <memory>
#include <string>
#include <string_view>

#include "document.hpp"

namespace arxml::document {

/**
 * @brief Interface for loading a document tree and persisting it again.
 */
class DocumentStore {
public:
    virtual ~DocumentStore() = default;

    /**
     * @brief Reads the file at @p path into a fully materialized tree.
     * @throws NotFoundError if the path does not exist.
     * @throws MalformedDocumentError if the content is not well-formed.
     */
    virtual auto read(std::string_view path) -> std::unique_ptr<Document> = 0;

    /**
     * @brief Writes @p document to @p path, creating missing parent
     * directories.
     * @throws WriteFailureError on any I/O failure.
     */
    virtual void write(const Document& document, std::string_view path) = 0;
};

/**
 * @brief Encodings the file store can emit.
 */
enum class OutputEncoding {
    Latin1,  ///< ISO-8859-1, the AUTOSAR tooling convention
    Utf8
};

/**
 * @brief Configuration options for FileDocumentStore.
 */
struct StoreOptions {
    OutputEncoding encoding =
        OutputEncoding::Latin1;  ///< Encoding named in the declaration.
    bool compact = false;        ///< Write without line breaks/indentation.
};

/**
 * @brief DocumentStore backed by the local filesystem.
 */
class FileDocumentStore : public DocumentStore {
public:
    FileDocumentStore() = default;
    explicit FileDocumentStore(const StoreOptions& options);

    auto read(std::string_view path) -> std::unique_ptr<Document> override;
    void write(const Document& document, std::string_view path) override;

    /**
     * @brief Renders @p document the way write() stores it, declaration
     * included, without touching the filesystem.
     */
    [[nodiscard]] auto serialize(const Document& document) const
        -> std::string;

    [[nodiscard]] auto options() const -> const StoreOptions&;

private:
    StoreOptions options_;
};

}  // namespace arxml::document

#endif  // ARXML_DOCUMENT_STORE_HPP
