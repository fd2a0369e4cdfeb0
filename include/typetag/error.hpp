#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

namespace typetag {

class TypetagError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// A tag names a codec that is not in the registry.
class UnknownCodecError : public TypetagError {
public:
    std::string name;
    explicit UnknownCodecError(const std::string& name)
        : TypetagError("Unknown codec: '" + name + "'"), name(name) {}
};

/// A string starts with the tag marker but is not a valid tag,
/// or a tagged compound is missing its name or payload.
class MalformedTagError : public TypetagError {
public:
    std::string text;
    MalformedTagError(const std::string& msg, const std::string& text)
        : TypetagError(msg), text(text) {}
};

class DuplicateRegistrationError : public TypetagError {
public:
    std::string name;
    DuplicateRegistrationError(const std::string& msg, const std::string& name)
        : TypetagError(msg), name(name) {}
};

class DuplicateNameError : public DuplicateRegistrationError {
public:
    using DuplicateRegistrationError::DuplicateRegistrationError;
};

class DuplicateKindError : public DuplicateRegistrationError {
public:
    using DuplicateRegistrationError::DuplicateRegistrationError;
};

class EncodeError : public TypetagError {
public:
    using TypetagError::TypetagError;
};

class DecodeError : public TypetagError {
public:
    using TypetagError::TypetagError;
};

class DepthLimitError : public TypetagError {
public:
    std::size_t limit;
    explicit DepthLimitError(std::size_t limit)
        : TypetagError("Nesting depth exceeds limit of " + std::to_string(limit)), limit(limit) {}
};

/// Raised by the text codec on unreadable input.
class ParseError : public TypetagError {
public:
    using TypetagError::TypetagError;
};

} // namespace typetag
