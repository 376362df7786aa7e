#pragma once

#include <stdexcept>
#include <string>
#include "cardstore/Document.hpp"

namespace cardstore {

// Thrown when no usable storage location can be prepared at startup.
class StartupError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Persistence capability shared by the file and remote table backends.
class Store {
public:
    virtual ~Store() = default;

    // Best effort: returns the default document on any failure.
    virtual Document read() = 0;

    // Replaces the stored document. Returns false on failure.
    virtual bool write(const Document& doc) = 0;

    // Appends an immutable copy of doc to the backend's history sink.
    virtual bool appendHistory(const Document& doc) = 0;

    virtual std::string describe() const = 0;
};

} // namespace cardstore
