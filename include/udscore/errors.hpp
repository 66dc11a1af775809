#ifndef UDSCORE_ERRORS_HPP
#define UDSCORE_ERRORS_HPP

/**
 * @file errors.hpp
 * @brief Exception types raised by the framing engine and the connection
 *
 * Only caller mistakes and opt-in timeouts throw. A malformed frame received
 * from an ECU is never an exception: it is reported through
 * Response::valid / Response::invalid_reason instead.
 */

#include <stdexcept>
#include <string>

namespace udscore {

/// Root of every exception thrown by udscore
class Error : public std::runtime_error {
public:
  explicit Error(const std::string& what) : std::runtime_error(what) {}
};

/// Invalid or missing service, malformed subfunction, bad codec layout, selector out of range
class ConfigurationError : public Error {
public:
  explicit ConfigurationError(const std::string& what) : Error(what) {}
};

/// A DidCodec was used without a concrete layout
class NotImplementedError : public Error {
public:
  explicit NotImplementedError(const std::string& what) : Error(what) {}
};

/// Value does not fit the codec layout (count, range or payload length)
class CodecError : public Error {
public:
  explicit CodecError(const std::string& what) : Error(what) {}
};

/// No frame arrived within the requested wait
class TimeoutError : public Error {
public:
  explicit TimeoutError(const std::string& what) : Error(what) {}
};

/// Operation requires an open connection
class ConnectionError : public Error {
public:
  explicit ConnectionError(const std::string& what) : Error(what) {}
};

/// Failure reported by the ISO-TP socket
class TransportError : public Error {
public:
  explicit TransportError(const std::string& what) : Error(what) {}
};

} // namespace udscore

#endif // UDSCORE_ERRORS_HPP
