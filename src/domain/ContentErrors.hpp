/**
 * @file ContentErrors.hpp
 * @brief Typed failures of container reading and sub-document materialization.
 */

#pragma once
#include <stdexcept>
#include <string>

namespace omnisplit::domain {

/**
 * @brief Thrown by a ContainerReader when the archive cannot be opened or parsed.
 *
 * Never escapes extractWorks(); callers there see an empty work list instead.
 */
class ContainerUnreadableError : public std::runtime_error {
public:
    explicit ContainerUnreadableError(const std::string& message) : std::runtime_error(message) {}
};

enum class ContentErrorKind {
    InvalidOmnibusReference,
    ExtractionFailed,
    ExtractionTimedOut,
    ResourceAccessFailed
};

inline const char* ContentErrorKindToString(ContentErrorKind kind) {
    switch (kind) {
        case ContentErrorKind::InvalidOmnibusReference: return "InvalidOmnibusReference";
        case ContentErrorKind::ExtractionFailed: return "ExtractionFailed";
        case ContentErrorKind::ExtractionTimedOut: return "ExtractionTimedOut";
        case ContentErrorKind::ResourceAccessFailed: return "ResourceAccessFailed";
    }
    return "ExtractionFailed";
}

/**
 * @class ContentError
 * @brief Root of the errors surfaced by the content service.
 *
 * File servers map kind() to a status: InvalidOmnibusReference is "not found",
 * everything else is an internal error.
 */
class ContentError : public std::runtime_error {
public:
    ContentError(ContentErrorKind kind, const std::string& message)
        : std::runtime_error(message), m_kind(kind) {}

    ContentErrorKind kind() const { return m_kind; }

private:
    ContentErrorKind m_kind;
};

class ContentNotFoundError : public ContentError {
public:
    explicit ContentNotFoundError(const std::string& message)
        : ContentError(ContentErrorKind::InvalidOmnibusReference, message) {}
};

class ExtractionFailedError : public ContentError {
public:
    explicit ExtractionFailedError(const std::string& message)
        : ContentError(ContentErrorKind::ExtractionFailed, message) {}

protected:
    ExtractionFailedError(ContentErrorKind kind, const std::string& message) : ContentError(kind, message) {}
};

class ExtractionTimeoutError : public ExtractionFailedError {
public:
    explicit ExtractionTimeoutError(const std::string& message)
        : ExtractionFailedError(ContentErrorKind::ExtractionTimedOut, message) {}
};

/** @brief Raised inside a slicer when its CancellationToken fires. */
class ExtractionCancelledError : public ExtractionFailedError {
public:
    explicit ExtractionCancelledError(const std::string& message) : ExtractionFailedError(message) {}
};

class ResourceAccessError : public ContentError {
public:
    explicit ResourceAccessError(const std::string& message)
        : ContentError(ContentErrorKind::ResourceAccessFailed, message) {}
};

} // namespace omnisplit::domain
