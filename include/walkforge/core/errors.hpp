#pragma once

#include <stdexcept>
#include <string>

namespace walkforge::core {

/**
 * @brief Invalid top-level configuration. Raised before any window is scheduled.
 */
class ConfigError : public std::invalid_argument {
public:
	explicit ConfigError(const std::string &message) : std::invalid_argument(message) {
	}
};

/**
 * @class Error
 * @brief Base class for runtime failures raised by walkforge components.
 */
class Error : public std::runtime_error {
public:
	explicit Error(const std::string &message) : std::runtime_error(message) {
	}
};

/// A window's slice is empty or malformed.
class DataError : public Error {
public:
	using Error::Error;
};

/// An adapter could not be trained on the rows it was given.
class TrainingError : public Error {
public:
	using Error::Error;
};

/// Prediction was requested with a feature schema that differs from fit time.
class InferenceError : public Error {
public:
	using Error::Error;
};

/// A serialized payload could not be decoded.
class SerializationError : public Error {
public:
	using Error::Error;
};

/// fit/predict exceeded the per-window time budget.
class TimeoutError : public Error {
public:
	using Error::Error;
};

/// An explicit version already exists with different content.
class RegistryConflictError : public Error {
public:
	using Error::Error;
};

/// Unknown family or version.
class RegistryNotFoundError : public Error {
public:
	using Error::Error;
};

} // namespace walkforge::core
