/**
 * @file errors.hpp
 * @brief Exception taxonomy for the meshwx delivery core.
 *
 * @details
 * Every error the core raises derives from `meshwx::Error`, so the host loop
 * can catch the family in one place and still tell the cases apart.
 *
 * | Type                 | Raised by                         | Fatal to            |
 * |----------------------|-----------------------------------|---------------------|
 * | DuplicateIdError     | registry register                 | that send attempt   |
 * | NotFoundError        | registry resolve, node lookup     | nothing (logged)    |
 * | RegistryFullError    | registry register                 | that send attempt   |
 * | TransportError       | transport send/query              | retried like a timeout |
 * | PersistenceError     | stats save/load                   | nothing (logged)    |
 * | CallbackParseError   | delivery-event frame decoding     | nothing (logged)    |
 * | ConfigError          | configuration loading             | startup             |
 *
 * Errors raised on the transport callback thread never leave it: the handler
 * logs and absorbs them because nobody is waiting on that thread.
 */
#ifndef MESHWX_ERRORS_HPP
#define MESHWX_ERRORS_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace meshwx {

/// Base of all meshwx errors.
class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// A message id was registered while another entry with the same id is live.
class DuplicateIdError : public Error {
public:
  explicit DuplicateIdError(uint32_t message_id)
  : Error("duplicate message id " + std::to_string(message_id)), message_id_(message_id) {}
  uint32_t message_id() const { return message_id_; }
private:
  uint32_t message_id_;
};

/// Lookup of an unknown message id or node name.
class NotFoundError : public Error {
public:
  using Error::Error;
};

/// The pending-message table has no free slot.
class RegistryFullError : public Error {
public:
  using Error::Error;
};

/// The radio refused, timed out on, or never received a request.
class TransportError : public Error {
public:
  using Error::Error;
};

/// Stats file could not be written or read back.
class PersistenceError : public Error {
public:
  using Error::Error;
};

/// A delivery-event frame did not decode.
class CallbackParseError : public Error {
public:
  using Error::Error;
};

/// The configuration file exists but is not usable.
class ConfigError : public Error {
public:
  using Error::Error;
};

} // namespace meshwx

#endif // MESHWX_ERRORS_HPP
