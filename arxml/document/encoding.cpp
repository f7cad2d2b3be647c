/*
 * encoding.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-14

Description: Character encoding helpers for ARXML files

**************************************************/

#include "encoding.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>

#include <fmt/format.h>

namespace arxml::document {

namespace {
auto toUpper(std::string_view text) -> std::string {
    std::string result(text);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    return result;
}

constexpr std::array<std::string_view, 9> LATIN1_ALIASES = {
    "ISO-8859-1", "ISO8859-1", "ISO_8859-1", "ISO-IR-100", "LATIN1",
    "LATIN-1",    "L1",        "IBM819",     "CP819"};

constexpr std::array<std::string_view, 4> UTF8_ALIASES = {
    "UTF-8", "UTF8", "US-ASCII", "ASCII"};

auto isContinuation(unsigned char byte) -> bool {
    return (byte & 0xC0) == 0x80;
}
}  // namespace

auto encodingFromLabel(std::string_view label) -> TextEncoding {
    if (label.empty()) {
        return TextEncoding::Utf8;
    }
    const auto upper = toUpper(label);
    if (std::find(LATIN1_ALIASES.begin(), LATIN1_ALIASES.end(), upper) !=
        LATIN1_ALIASES.end()) {
        return TextEncoding::Latin1;
    }
    if (std::find(UTF8_ALIASES.begin(), UTF8_ALIASES.end(), upper) !=
        UTF8_ALIASES.end()) {
        return TextEncoding::Utf8;
    }
    return TextEncoding::Unsupported;
}

auto encodingLabel(TextEncoding encoding) -> std::string_view {
    switch (encoding) {
        case TextEncoding::Latin1:
            return LATIN1_LABEL;
        case TextEncoding::Utf8:
            return UTF8_LABEL;
        default:
            return "";
    }
}

auto declaredEncoding(std::string_view content) -> std::string {
    if (!content.starts_with("<?xml")) {
        return {};
    }
    const auto end = content.find("?>");
    if (end == std::string_view::npos) {
        return {};
    }
    auto decl = content.substr(0, end);
    auto pos = decl.find("encoding");
    if (pos == std::string_view::npos) {
        return {};
    }
    pos += 8;
    auto skipSpace = [&]() {
        while (pos < decl.size() &&
               std::isspace(static_cast<unsigned char>(decl[pos]))) {
            ++pos;
        }
    };
    skipSpace();
    if (pos >= decl.size() || decl[pos] != '=') {
        return {};
    }
    ++pos;
    skipSpace();
    if (pos >= decl.size() || (decl[pos] != '"' && decl[pos] != '\'')) {
        return {};
    }
    const char quote = decl[pos++];
    const auto close = decl.find(quote, pos);
    if (close == std::string_view::npos) {
        return {};
    }
    return std::string(decl.substr(pos, close - pos));
}

auto stripUtf8Bom(std::string& content) -> bool {
    if (content.size() >= 3 && static_cast<unsigned char>(content[0]) == 0xEF &&
        static_cast<unsigned char>(content[1]) == 0xBB &&
        static_cast<unsigned char>(content[2]) == 0xBF) {
        content.erase(0, 3);
        return true;
    }
    return false;
}

auto hasWideBom(std::string_view content) -> bool {
    if (content.size() < 2) {
        return false;
    }
    const auto b0 = static_cast<unsigned char>(content[0]);
    const auto b1 = static_cast<unsigned char>(content[1]);
    // UTF-32LE starts with FF FE 00 00 and is caught by the UTF-16LE check.
    if ((b0 == 0xFF && b1 == 0xFE) || (b0 == 0xFE && b1 == 0xFF)) {
        return true;
    }
    return content.size() >= 4 && b0 == 0x00 && b1 == 0x00 &&
           static_cast<unsigned char>(content[2]) == 0xFE &&
           static_cast<unsigned char>(content[3]) == 0xFF;
}

auto latin1ToUtf8(std::string_view input) -> std::string {
    std::string output;
    output.reserve(input.size() + input.size() / 8);
    for (char ch : input) {
        const auto byte = static_cast<unsigned char>(ch);
        if (byte < 0x80) {
            output.push_back(ch);
        } else {
            output.push_back(static_cast<char>(0xC0 | (byte >> 6)));
            output.push_back(static_cast<char>(0x80 | (byte & 0x3F)));
        }
    }
    return output;
}

auto utf8ToLatin1(std::string_view input) -> std::string {
    std::string output;
    output.reserve(input.size());

    size_t i = 0;
    while (i < input.size()) {
        const auto lead = static_cast<unsigned char>(input[i]);
        if (lead < 0x80) {
            output.push_back(static_cast<char>(lead));
            ++i;
            continue;
        }

        size_t length = 0;
        std::uint32_t codePoint = 0;
        if (lead >= 0xC2 && lead <= 0xDF) {
            length = 2;
            codePoint = lead & 0x1F;
        } else if (lead >= 0xE0 && lead <= 0xEF) {
            length = 3;
            codePoint = lead & 0x0F;
        } else if (lead >= 0xF0 && lead <= 0xF4) {
            length = 4;
            codePoint = lead & 0x07;
        }

        bool valid = length != 0 && i + length <= input.size();
        for (size_t k = 1; valid && k < length; ++k) {
            const auto next = static_cast<unsigned char>(input[i + k]);
            if (!isContinuation(next)) {
                valid = false;
            } else {
                codePoint = (codePoint << 6) | (next & 0x3F);
            }
        }
        if (valid && length == 3 &&
            (codePoint < 0x800 ||
             (codePoint >= 0xD800 && codePoint <= 0xDFFF))) {
            valid = false;
        }
        if (valid && length == 4 &&
            (codePoint < 0x10000 || codePoint > 0x10FFFF)) {
            valid = false;
        }

        if (!valid) {
            output.push_back(static_cast<char>(lead));
            ++i;
            continue;
        }

        if (codePoint <= 0xFF) {
            output.push_back(static_cast<char>(codePoint));
        } else {
            output += fmt::format("&#{};", codePoint);
        }
        i += length;
    }
    return output;
}

auto fitsLatin1(std::string_view input) -> bool {
    for (size_t i = 0; i < input.size(); ++i) {
        const auto lead = static_cast<unsigned char>(input[i]);
        if (lead < 0x80) {
            continue;
        }
        // U+0080..U+00FF is encoded as C2 or C3 followed by one continuation
        // byte; every other lead byte starts a wider code point.
        if ((lead != 0xC2 && lead != 0xC3) || i + 1 >= input.size() ||
            !isContinuation(static_cast<unsigned char>(input[i + 1]))) {
            return false;
        }
        ++i;
    }
    return true;
}

}  // namespace arxml::document
