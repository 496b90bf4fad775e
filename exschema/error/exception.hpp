/*
 * exception.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2023-11-10

Description: Exceptions raised while loading and compiling schemas

**************************************************/

#ifndef EXSCHEMA_ERROR_EXCEPTION_HPP
#define EXSCHEMA_ERROR_EXCEPTION_HPP

#include <exception>
#include <sstream>
#include <string>
#include <thread>
#include <utility>

#include "exschema/macro.hpp"

namespace exschema::error {

/**
 * @brief Base exception carrying the throw site and a message.
 *
 * The message is built by streaming every trailing constructor argument, so
 * call sites can pass strings, numbers and identifiers without formatting
 * them first.
 */
class Exception : public std::exception {
public:
    template <typename... Args>
    Exception(const char* file, int line, const char* func, Args&&... args)
        : file_(file),
          line_(line),
          func_(func),
          thread_id_(std::this_thread::get_id()) {
        std::ostringstream oss;
        ((oss << std::forward<Args>(args)), ...);
        message_ = oss.str();
    }

    /**
     * @brief Full description including the throw site.
     */
    auto what() const noexcept -> const char* override;

    EXSCHEMA_NODISCARD auto getFile() const -> std::string;
    EXSCHEMA_NODISCARD auto getLine() const -> int;
    EXSCHEMA_NODISCARD auto getFunction() const -> std::string;
    EXSCHEMA_NODISCARD auto getMessage() const -> std::string;
    EXSCHEMA_NODISCARD auto getThreadId() const -> std::thread::id;

private:
    std::string file_;
    int line_;
    std::string func_;
    std::string message_;
    mutable std::string full_message_;
    std::thread::id thread_id_;
};

/**
 * @brief A configuration document could not be turned into options.
 */
class InvalidOptions : public Exception {
public:
    using Exception::Exception;
};

/**
 * @brief Root of the compile-time failures.
 *
 * Every schema failure names the schema location (an identifier such as
 * `urn:example#/properties/name`) that caused it.
 */
class SchemaException : public Exception {
public:
    template <typename... Args>
    SchemaException(const char* file, int line, const char* func,
                    std::string location, Args&&... args)
        : Exception(file, line, func, "at '", location,
                    "': ", std::forward<Args>(args)...),
          location_(std::move(location)) {}

    EXSCHEMA_NODISCARD auto location() const noexcept -> const std::string& {
        return location_;
    }

private:
    std::string location_;
};

class MalformedSchema : public SchemaException {
public:
    using SchemaException::SchemaException;
};

class UnresolvedReference : public SchemaException {
public:
    using SchemaException::SchemaException;
};

class UnsupportedKeyword : public SchemaException {
public:
    using SchemaException::SchemaException;
};

/**
 * @brief A reference chain never reaches a real schema, or is too long.
 */
class RecursionLimitExceeded : public SchemaException {
public:
    using SchemaException::SchemaException;
};

}  // namespace exschema::error

#define THROW_INVALID_OPTIONS(...)                                  \
    throw exschema::error::InvalidOptions(                          \
        EXSCHEMA_FILE_NAME, EXSCHEMA_FILE_LINE, EXSCHEMA_FUNC_NAME, \
        __VA_ARGS__)

#define THROW_MALFORMED_SCHEMA(location, ...)                       \
    throw exschema::error::MalformedSchema(                         \
        EXSCHEMA_FILE_NAME, EXSCHEMA_FILE_LINE, EXSCHEMA_FUNC_NAME, \
        location, __VA_ARGS__)

#define THROW_UNRESOLVED_REFERENCE(location, ...)                   \
    throw exschema::error::UnresolvedReference(                     \
        EXSCHEMA_FILE_NAME, EXSCHEMA_FILE_LINE, EXSCHEMA_FUNC_NAME, \
        location, __VA_ARGS__)

#define THROW_UNSUPPORTED_KEYWORD(location, ...)                    \
    throw exschema::error::UnsupportedKeyword(                      \
        EXSCHEMA_FILE_NAME, EXSCHEMA_FILE_LINE, EXSCHEMA_FUNC_NAME, \
        location, __VA_ARGS__)

#define THROW_RECURSION_LIMIT_EXCEEDED(location, ...)               \
    throw exschema::error::RecursionLimitExceeded(                  \
        EXSCHEMA_FILE_NAME, EXSCHEMA_FILE_LINE, EXSCHEMA_FUNC_NAME, \
        location, __VA_ARGS__)

#endif  // EXSCHEMA_ERROR_EXCEPTION_HPP
