#pragma once
#include <stdexcept>
#include <string>
#include <system_error>

namespace cs {

// Invalid arguments (null parser, empty delimiter, unparseable media type)
// are reported with std::invalid_argument.

// Operation not allowed in the current state, e.g. read() after close().
class IllegalState : public std::logic_error {
public:
  using std::logic_error::logic_error;
};

// Low-level failure of a ByteSource (open, read or close).
class IoError : public std::system_error {
public:
  using std::system_error::system_error;
};

// A decode collaborator could not turn chunk bytes into a value.
class DecodeError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Malformed framing seen by a ChunkParser (truncated or oversize frame).
class FramingError : public DecodeError {
public:
  using DecodeError::DecodeError;
};

}
