#pragma once

#include <stdexcept>
#include <string>

namespace lungrisk {

// Missing, malformed or mutually inconsistent model artifacts. Fatal at startup.
class ArtifactError : public std::runtime_error {
public:
    explicit ArtifactError(const std::string& what) : std::runtime_error(what) {}
};

// Training data that cannot produce a model: unreadable file, missing columns, one class only
class SchemaError : public std::runtime_error {
public:
    explicit SchemaError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace lungrisk
