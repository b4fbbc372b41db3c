#ifndef PSYNET_EXCEPTIONS_H
#define PSYNET_EXCEPTIONS_H

#include <stdexcept>
#include <string>

namespace Psynet {

class PsynetException : public std::runtime_error {
public:
    explicit PsynetException(const std::string& message) : std::runtime_error(message) {}
};

class IOException : public PsynetException {
public:
    explicit IOException(const std::string& message) : PsynetException("IO Error: " + message) {}
};

class DatasetException : public PsynetException {
public:
    explicit DatasetException(const std::string& message) : PsynetException("Dataset Error: " + message) {}
};

class ConfigurationException : public PsynetException {
public:
    explicit ConfigurationException(const std::string& message) : PsynetException("Configuration Error: " + message) {}
};

// Raised when a covariance/correlation structure cannot be estimated
// (zero-variance items, singular matrices, non-finite weights).
class EstimationException : public PsynetException {
public:
    explicit EstimationException(const std::string& message) : PsynetException("Estimation Error: " + message) {}
};

} // namespace Psynet

#endif // PSYNET_EXCEPTIONS_H
