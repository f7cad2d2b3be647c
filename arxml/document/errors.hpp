/*
 * errors.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-14

Description: Error kinds raised by the ARXML document-access layer

**************************************************/

#ifndef ARXML_DOCUMENT_ERRORS_HPP
#define ARXML_DOCUMENT_ERRORS_HPP

#include "arxml/error/exception.hpp"

namespace arxml::document {

/**
 * @brief Common base of every document-access error, so callers can catch
 * the whole family at once.
 */
class DocumentError : public arxml::error::Exception {
public:
    using Exception::Exception;
};

/// The file to load does not exist or cannot be opened.
class NotFoundError : public DocumentError {
public:
    using DocumentError::DocumentError;
};

/// The file content is not well-formed XML in a supported encoding.
class MalformedDocumentError : public DocumentError {
public:
    using DocumentError::DocumentError;
};

/// Persisting the document failed (directory creation, open, write).
class WriteFailureError : public DocumentError {
public:
    using DocumentError::DocumentError;
};

/// The path expression uses syntax outside the supported subset.
class InvalidQueryError : public DocumentError {
public:
    using DocumentError::DocumentError;
};

/// A find, mutate or save was issued before any document was loaded.
class NoDocumentLoadedError : public DocumentError {
public:
    using DocumentError::DocumentError;
};

/// Save was requested but no output path was ever given or remembered.
class NoOutputPathError : public DocumentError {
public:
    using DocumentError::DocumentError;
};

}  // namespace arxml::document

#define THROW_NOT_FOUND(...)                                  \
    throw arxml::document::NotFoundError(                     \
        ARXML_FILE_NAME, ARXML_FILE_LINE, ARXML_FUNC_NAME, __VA_ARGS__)

#define THROW_MALFORMED_DOCUMENT(...)                         \
    throw arxml::document::MalformedDocumentError(            \
        ARXML_FILE_NAME, ARXML_FILE_LINE, ARXML_FUNC_NAME, __VA_ARGS__)

#define THROW_WRITE_FAILURE(...)                              \
    throw arxml::document::WriteFailureError(                 \
        ARXML_FILE_NAME, ARXML_FILE_LINE, ARXML_FUNC_NAME, __VA_ARGS__)

#define THROW_NESTED_WRITE_FAILURE(...)                       \
    std::throw_with_nested(arxml::document::WriteFailureError( \
        ARXML_FILE_NAME, ARXML_FILE_LINE, ARXML_FUNC_NAME, __VA_ARGS__))

#define THROW_INVALID_QUERY(...)                              \
    throw arxml::document::InvalidQueryError(                 \
        ARXML_FILE_NAME, ARXML_FILE_LINE, ARXML_FUNC_NAME, __VA_ARGS__)

#define THROW_NO_DOCUMENT_LOADED(...)                         \
    throw arxml::document::NoDocumentLoadedError(             \
        ARXML_FILE_NAME, ARXML_FILE_LINE, ARXML_FUNC_NAME, __VA_ARGS__)

#define THROW_NO_OUTPUT_PATH(...)                             \
    throw arxml::document::NoOutputPathError(                 \
        ARXML_FILE_NAME, ARXML_FILE_LINE, ARXML_FUNC_NAME, __VA_ARGS__)

#endif  // ARXML_DOCUMENT_ERRORS_HPP
