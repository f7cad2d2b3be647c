/*
 * encoding.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-14

Description: Character encoding helpers for ARXML files

**************************************************/

#ifndef ARXML_DOCUMENT_ENCODING_HPP
#define ARXML_DOCUMENT_ENCODING_HPP

#include <string>
#include <string_view>

namespace arxml::document {

/**
 * @brief Encodings the store knows how to read and write.
 */
enum class TextEncoding {
    Utf8,    ///< UTF-8, also used for US-ASCII and undeclared content
    Latin1,  ///< ISO-8859-1
    Unsupported
};

inline constexpr std::string_view LATIN1_LABEL = "ISO-8859-1";
inline constexpr std::string_view UTF8_LABEL = "UTF-8";

/**
 * @brief Maps an encoding label (case-insensitive, IANA aliases accepted) to
 * a TextEncoding.
 */
auto encodingFromLabel(std::string_view label) -> TextEncoding;

/**
 * @brief Returns the canonical label written into XML declarations.
 */
auto encodingLabel(TextEncoding encoding) -> std::string_view;

/**
 * @brief Extracts the value of the encoding pseudo-attribute from a leading
 * XML declaration.
 *
 * @param content Raw file content, BOM already removed.
 * @return The declared label, or an empty string if there is no declaration
 * or it carries no encoding.
 */
auto declaredEncoding(std::string_view content) -> std::string;

/**
 * @brief Removes a UTF-8 byte order mark, if present.
 * @return true if a BOM was removed.
 */
auto stripUtf8Bom(std::string& content) -> bool;

/**
 * @brief Detects a UTF-16 or UTF-32 byte order mark.
 */
auto hasWideBom(std::string_view content) -> bool;

/**
 * @brief Widens ISO-8859-1 bytes to UTF-8.
 */
auto latin1ToUtf8(std::string_view input) -> std::string;

/**
 * @brief Narrows UTF-8 text to ISO-8859-1.
 *
 * Code points above U+00FF are written as decimal character references so
 * the output stays lossless for any XML consumer. Bytes that do not form a
 * valid UTF-8 sequence are copied through unchanged.
 */
auto utf8ToLatin1(std::string_view input) -> std::string;

/**
 * @brief Checks whether every code point of UTF-8 @p input is at most U+00FF,
 * so that utf8ToLatin1() needs no character references for it.
 */
auto fitsLatin1(std::string_view input) -> bool;

}  // namespace arxml::document

#endif  // ARXML_DOCUMENT_ENCODING_HPP
