/*
 * exception.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2023-11-10

Description: Source-located exception base for the ARXML library

**************************************************/

#ifndef ARXML_ERROR_EXCEPTION_HPP
#define ARXML_ERROR_EXCEPTION_HPP

#include <exception>
#include <string>
#include <thread>
#include <utility>

#include <fmt/format.h>

#define ARXML_FILE_NAME __FILE__
#define ARXML_FILE_LINE __LINE__
#define ARXML_FUNC_NAME __func__

namespace arxml::error {

/**
 * @brief Base class for every exception thrown by the library.
 *
 * Records where the exception was raised (file, line, function and thread)
 * together with a message built from a fmt-style format string.
 */
class Exception : public std::exception {
public:
    /**
     * @brief Constructs an exception with a formatted message.
     *
     * @param file Source file raising the exception.
     * @param line Source line raising the exception.
     * @param func Function raising the exception.
     * @param format fmt format string for the message.
     * @param args Arguments substituted into the format string.
     */
    template <typename... Args>
    Exception(const char* file, int line, const char* func,
              fmt::format_string<Args...> format, Args&&... args)
        : file_(file),
          line_(line),
          func_(func),
          thread_id_(std::this_thread::get_id()),
          message_(fmt::format(format, std::forward<Args>(args)...)) {}

    /**
     * @brief Returns the full description including the source location.
     */
    auto what() const noexcept -> const char* override;

    auto getFile() const -> std::string;
    auto getLine() const -> int;
    auto getFunction() const -> std::string;

    /**
     * @brief Returns the bare message without the location preamble.
     */
    auto getMessage() const -> std::string;
    auto getThreadId() const -> std::thread::id;

private:
    std::string file_;
    int line_;
    std::string func_;
    std::thread::id thread_id_;
    std::string message_;
    mutable std::string full_message_;
};

}  // namespace arxml::error

#define THROW_EXCEPTION(...)                                           \
    throw arxml::error::Exception(ARXML_FILE_NAME, ARXML_FILE_LINE, \
                                  ARXML_FUNC_NAME, __VA_ARGS__)

#endif  // ARXML_ERROR_EXCEPTION_HPP
