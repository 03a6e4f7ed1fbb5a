#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace mm::core {

class Error : public std::runtime_error {
public:
    explicit Error(std::string message);
    virtual ~Error() = default;
};

inline Error::Error(std::string message)
    : std::runtime_error(std::move(message)) {}

enum class ParseErrorKind {
    UnexpectedEof,
    BadMagic,
    TypeMismatch,
    MissingField,
    InvalidData
};

constexpr std::string_view ToString(ParseErrorKind kind) {
    switch (kind) {
        case ParseErrorKind::UnexpectedEof: return "unexpected end of data";
        case ParseErrorKind::BadMagic:      return "bad magic";
        case ParseErrorKind::TypeMismatch:  return "type mismatch";
        case ParseErrorKind::MissingField:  return "missing field";
        case ParseErrorKind::InvalidData:   return "invalid data";
    }
    return "unknown";
}

/**
 * @brief Malformed, truncated or mistyped resource bytes.
 *
 * Codecs raise this without knowing which file they were handed; the dispatch
 * layer re-tags it with the resource path through WithResource().
 */
class ParseError : public Error {
public:
    ParseError(ParseErrorKind kind,
               std::string_view resource,
               std::string_view field,
               std::string details);

    ParseErrorKind kind() const noexcept { return m_kind; }
    std::string_view resource() const noexcept { return m_resource; }
    std::string_view field() const noexcept { return m_field; }
    std::string_view details() const noexcept { return m_details; }

    [[nodiscard]] ParseError WithResource(std::string_view resource) const;

private:
    static std::string BuildMessage(ParseErrorKind kind,
                                    std::string_view resource,
                                    std::string_view field,
                                    const std::string& details);

    ParseErrorKind m_kind;
    std::string m_resource;
    std::string m_field;
    std::string m_details;
};

inline std::string ParseError::BuildMessage(ParseErrorKind kind,
                                            std::string_view resource,
                                            std::string_view field,
                                            const std::string& details) {
    std::string message;
    message.reserve(resource.size() + field.size() + details.size() + 48);
    message.append("Parse error (");
    message.append(ToString(kind));
    message.append(")");
    if (!resource.empty()) {
        message.append(" in ");
        message.append(resource);
    }
    if (!field.empty()) {
        message.append(" at '");
        message.append(field);
        message.append("'");
    }
    if (!details.empty()) {
        message.append(": ");
        message.append(details);
    }
    return message;
}

inline ParseError::ParseError(ParseErrorKind kind,
                              std::string_view resource,
                              std::string_view field,
                              std::string details)
    : Error(BuildMessage(kind, resource, field, details)),
      m_kind(kind),
      m_resource(resource),
      m_field(field),
      m_details(std::move(details)) {}

inline ParseError ParseError::WithResource(std::string_view resource) const {
    return ParseError(m_kind, resource, m_field, m_details);
}

// Raised when byte sniffing matches no known schema or magic.
class UnsupportedFormatError : public Error {
public:
    UnsupportedFormatError(std::string_view resource, std::string details);

    std::string_view resource() const noexcept { return m_resource; }
    std::string_view details() const noexcept { return m_details; }

private:
    std::string m_resource;
    std::string m_details;
};

inline UnsupportedFormatError::UnsupportedFormatError(std::string_view resource, std::string details)
    : Error("Unsupported format for " + std::string(resource) + (details.empty() ? "" : ": " + details)),
      m_resource(resource),
      m_details(std::move(details)) {}

/**
 * @brief An archive entry or output path references a canonical key that is
 * absent from the resource table, or a platform-specific binary lacks data for
 * the requested platform.
 */
class MissingResourceError : public Error {
public:
    MissingResourceError(std::string_view entry, std::string_view canonicalKey, std::string details = {});

    std::string_view entry() const noexcept { return m_entry; }
    std::string_view canonicalKey() const noexcept { return m_canonicalKey; }

private:
    static std::string BuildMessage(std::string_view entry,
                                    std::string_view canonicalKey,
                                    const std::string& details);

    std::string m_entry;
    std::string m_canonicalKey;
};

inline std::string MissingResourceError::BuildMessage(std::string_view entry,
                                                      std::string_view canonicalKey,
                                                      const std::string& details) {
    std::string message("Missing resource for ");
    message.append(entry);
    if (!canonicalKey.empty() && canonicalKey != entry) {
        message.append(" (");
        message.append(canonicalKey);
        message.append(")");
    }
    if (!details.empty()) {
        message.append(": ");
        message.append(details);
    }
    return message;
}

inline MissingResourceError::MissingResourceError(std::string_view entry,
                                                  std::string_view canonicalKey,
                                                  std::string details)
    : Error(BuildMessage(entry, canonicalKey, details)),
      m_entry(entry),
      m_canonicalKey(canonicalKey) {}

/**
 * @brief Diff or merge invoked on two resources of incompatible declared type.
 *
 * This is a caller bug, not bad input data, so it derives from
 * std::logic_error and must not be caught and papered over.
 */
class SchemaMismatchError : public std::logic_error {
public:
    SchemaMismatchError(std::string_view operation,
                        std::string_view lhs,
                        std::string_view rhs);

    std::string_view operation() const noexcept { return m_operation; }
    std::string_view lhs() const noexcept { return m_lhs; }
    std::string_view rhs() const noexcept { return m_rhs; }

private:
    std::string m_operation;
    std::string m_lhs;
    std::string m_rhs;
};

inline SchemaMismatchError::SchemaMismatchError(std::string_view operation,
                                                std::string_view lhs,
                                                std::string_view rhs)
    : std::logic_error("Tried to " + std::string(operation) + " incompatible resources: " +
                       std::string(lhs) + " and " + std::string(rhs)),
      m_operation(operation),
      m_lhs(lhs),
      m_rhs(rhs) {}

} // namespace mm::core
