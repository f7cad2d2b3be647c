/*
 * path_expression.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-15

Description: Parser for the restricted element path syntax

**************************************************/

#include "path_expression.hpp"

#include "errors.hpp"

#include <cctype>
#include <utility>

#include <spdlog/spdlog.h>

namespace arxml::document {

namespace {
auto isNameStart(char ch) -> bool {
    const auto byte = static_cast<unsigned char>(ch);
    return std::isalpha(byte) || ch == '_' || ch == ':' || byte >= 0x80;
}

auto isNameChar(char ch) -> bool {
    return isNameStart(ch) || std::isdigit(static_cast<unsigned char>(ch)) ||
           ch == '-' || ch == '.';
}
}  // namespace

auto PathExpression::parse(std::string_view expression) -> PathExpression {
    PathExpression result;
    result.text_ = std::string(expression);

    if (expression.empty()) {
        spdlog::warn("Rejected empty path expression");
        THROW_INVALID_QUERY("Invalid path expression: empty expression");
    }
    if (expression == ".") {
        return result;
    }

    size_t pos = 0;
    auto axis = PathStep::Axis::Child;
    if (expression.starts_with("//")) {
        result.origin_ = Origin::Document;
        axis = PathStep::Axis::Descendant;
        pos = 2;
    } else if (expression.starts_with("/")) {
        result.origin_ = Origin::Document;
        pos = 1;
    } else if (expression.starts_with(".//")) {
        axis = PathStep::Axis::Descendant;
        pos = 3;
    } else if (expression.starts_with("./")) {
        pos = 2;
    }

    while (true) {
        if (pos >= expression.size()) {
            THROW_INVALID_QUERY(
                "Invalid path expression '{}': expected a step at position {}",
                expression, pos);
        }

        PathStep step{axis, {}};
        if (expression[pos] == '*') {
            step.name = "*";
            ++pos;
        } else if (isNameStart(expression[pos])) {
            const auto start = pos;
            while (pos < expression.size() && isNameChar(expression[pos])) {
                ++pos;
            }
            step.name = std::string(expression.substr(start, pos - start));
        } else {
            spdlog::warn("Unsupported syntax in path expression '{}'",
                         expression);
            THROW_INVALID_QUERY(
                "Invalid path expression '{}': unsupported syntax '{}' at "
                "position {}",
                expression, expression[pos], pos);
        }
        result.steps_.push_back(std::move(step));

        if (pos == expression.size()) {
            break;
        }
        if (expression[pos] != '/') {
            spdlog::warn("Unsupported syntax in path expression '{}'",
                         expression);
            THROW_INVALID_QUERY(
                "Invalid path expression '{}': unsupported syntax '{}' at "
                "position {}",
                expression, expression[pos], pos);
        }
        if (pos + 1 < expression.size() && expression[pos + 1] == '/') {
            axis = PathStep::Axis::Descendant;
            pos += 2;
        } else {
            axis = PathStep::Axis::Child;
            pos += 1;
        }
        if (pos < expression.size() && expression[pos] == '/') {
            THROW_INVALID_QUERY(
                "Invalid path expression '{}': empty step at position {}",
                expression, pos);
        }
    }

    spdlog::trace("Parsed path expression '{}' into {} steps", expression,
                  result.steps_.size());
    return result;
}

}  // namespace arxml::document
