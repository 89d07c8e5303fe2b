#pragma once

#include <functional>
#include <stdexcept>
#include <string>

namespace xcore {
namespace common {

// Base exception class for xcore
class XcoreException : public std::runtime_error {
public:
    explicit XcoreException(const std::string& message)
        : std::runtime_error(message) {}
};

// Datafile could not be turned into a ProjectConfig
class ConfigException : public XcoreException {
public:
    explicit ConfigException(const std::string& message)
        : XcoreException("Configuration Error: " + message) {}
};

class InvalidDatafileVersionException : public ConfigException {
public:
    explicit InvalidDatafileVersionException(const std::string& version)
        : ConfigException("This version of the SDK does not support the given datafile version: " + version),
          version_(version) {}

    const std::string& get_version() const { return version_; }

private:
    std::string version_;
};

// Caller handed in something the core cannot work with
class InvalidInputException : public XcoreException {
public:
    explicit InvalidInputException(const std::string& input)
        : XcoreException("Provided " + input + " is in an invalid format."),
          input_(input) {}

    const std::string& get_input() const { return input_; }

private:
    std::string input_;
};

// Raised by collaborators (profile service, forced variation store)
class CollaboratorException : public XcoreException {
public:
    CollaboratorException(const std::string& collaborator, const std::string& message)
        : XcoreException(collaborator + " failure: " + message) {}
};

// Destination for exceptions the decision path catches instead of propagating.
// With no handler installed they are logged at ERROR.
class ErrorHandler {
public:
    using ErrorCallback = std::function<void(const std::exception&)>;

    static void set_global_error_handler(ErrorCallback callback);
    static void handle_error(const std::exception& e);

    // Installs a handler for the lifetime of the scope, then restores the previous one
    class ErrorScope {
    public:
        explicit ErrorScope(ErrorCallback callback);
        ~ErrorScope();

        ErrorScope(const ErrorScope&) = delete;
        ErrorScope& operator=(const ErrorScope&) = delete;

    private:
        ErrorCallback previous_callback_;
    };

private:
    static ErrorCallback global_callback_;
};

#define XCORE_THROW_IF(condition, exception_type, message) \
    do { \
        if (condition) { \
            throw exception_type(message); \
        } \
    } while(0)

// Rejects an empty caller-supplied key, naming it in the exception message
inline void require_input(const std::string& value, const std::string& input) {
    XCORE_THROW_IF(value.empty(), InvalidInputException, input);
}

} // namespace common
} // namespace xcore
