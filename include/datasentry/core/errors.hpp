#pragma once

#include <stdexcept>
#include <string>

namespace datasentry::core {

/**
 * @brief Raised when configuration values fall outside their documented ranges.
 *
 * Fatal for a detection run: parameters are validated once, before any
 * detector starts.
 */
class InvalidParameterError : public std::invalid_argument {
public:
	explicit InvalidParameterError(const std::string &message) : std::invalid_argument(message) {}
};

/**
 * @brief Raised by a sub-method when it has fewer points or documents than it needs.
 *
 * Non-fatal: the sub-method is skipped for the affected column.
 */
class InsufficientDataError : public std::runtime_error {
public:
	explicit InsufficientDataError(const std::string &message) : std::runtime_error(message) {}
};

/**
 * @brief Raised on zero variance, empty vocabulary or an empty bucket.
 *
 * Non-fatal: the affected check reports "no anomaly possible".
 */
class DegenerateInputError : public std::runtime_error {
public:
	explicit DegenerateInputError(const std::string &message) : std::runtime_error(message) {}
};

/// Raised when a column's analysis is abandoned because the run budget expired or was cancelled.
class TimeoutError : public std::runtime_error {
public:
	explicit TimeoutError(const std::string &message) : std::runtime_error(message) {}
};

} // namespace datasentry::core
