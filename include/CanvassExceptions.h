#ifndef CANVASS_EXCEPTIONS_H
#define CANVASS_EXCEPTIONS_H

#include <stdexcept>
#include <string>

namespace Canvass {

class CanvassException : public std::runtime_error {
public:
    explicit CanvassException(const std::string& message) : std::runtime_error(message) {}
};

class IOException : public CanvassException {
public:
    explicit IOException(const std::string& message) : CanvassException("IO Error: " + message) {}
};

class ConfigurationException : public CanvassException {
public:
    explicit ConfigurationException(const std::string& message) : CanvassException("Configuration Error: " + message) {}
};

class InsufficientDataException : public CanvassException {
public:
    explicit InsufficientDataException(const std::string& message) : CanvassException("Insufficient Data: " + message) {}
};

class VectorizationException : public CanvassException {
public:
    explicit VectorizationException(const std::string& message) : CanvassException("Vectorization Error: " + message) {}
};

class TrainingException : public CanvassException {
public:
    explicit TrainingException(const std::string& message) : CanvassException("Training Error: " + message) {}
};

class PersistenceException : public CanvassException {
public:
    explicit PersistenceException(const std::string& message) : CanvassException("Persistence Error: " + message) {}
};

} // namespace Canvass

#endif // CANVASS_EXCEPTIONS_H
