#ifndef RPROPNET_CORE_ERRORS_HPP
#define RPROPNET_CORE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace rpropnet {

// Label/image files with a bad magic number, a short body or mismatched counts.
class DatasetFormatError : public std::runtime_error {
public:
    explicit DatasetFormatError(const std::string& what) : std::runtime_error(what) {}
};

// Persisted model bytes that cannot be decoded into a consistent network.
class ModelDeserializationError : public std::runtime_error {
public:
    explicit ModelDeserializationError(const std::string& what) : std::runtime_error(what) {}
};

// Filesystem failure while saving or loading a model.
class ModelIOError : public std::runtime_error {
public:
    explicit ModelIOError(const std::string& what) : std::runtime_error(what) {}
};

// Programming error in how a network was put together (e.g. no layers).
class ContractViolation : public std::logic_error {
public:
    explicit ContractViolation(const std::string& what) : std::logic_error(what) {}
};

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace rpropnet

#endif // RPROPNET_CORE_ERRORS_HPP
