#ifndef RANDOMFS_ERROR_HPP
#define RANDOMFS_ERROR_HPP

#include <stdexcept>
#include <string>

namespace randomfs {

class RandomFSError : public std::runtime_error {
public:
    explicit RandomFSError(const std::string& message)
        : std::runtime_error(message) {}
};

// Bad data directory, cache size or endpoint at construction
class ConfigurationError : public RandomFSError {
public:
    explicit ConfigurationError(const std::string& message)
        : RandomFSError("Configuration error: " + message) {}
};

// Content store could not be reached
class StoreUnavailable : public RandomFSError {
public:
    explicit StoreUnavailable(const std::string& message)
        : RandomFSError("Store unavailable: " + message) {}
};

// Content store answered with an error status
class StoreRejected : public RandomFSError {
public:
    explicit StoreRejected(const std::string& message)
        : RandomFSError("Store rejected: " + message) {}
};

class NotFound : public RandomFSError {
public:
    explicit NotFound(const std::string& message)
        : RandomFSError("Not found: " + message) {}
};

class MalformedLocator : public RandomFSError {
public:
    explicit MalformedLocator(const std::string& message)
        : RandomFSError("Malformed locator: " + message) {}
};

class ReconstructionFailed : public RandomFSError {
public:
    explicit ReconstructionFailed(const std::string& message)
        : RandomFSError("Reconstruction failed: " + message) {}
};

// Random source exhausted or unavailable while masking
class EntropyError : public RandomFSError {
public:
    explicit EntropyError(const std::string& message)
        : RandomFSError("Entropy error: " + message) {}
};

} // namespace randomfs

#endif // RANDOMFS_ERROR_HPP
