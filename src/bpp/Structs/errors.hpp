#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

namespace bpp {

class ParseError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class EmptyInputError : public ParseError {
public:
  using ParseError::ParseError;
};

/**
 * @brief wrong token counts or types, line is 1-based (0 if unknown)
 */
class MalformedInputError : public ParseError {
public:
  MalformedInputError(std::size_t line, const std::string &reason)
      : ParseError(line == 0 ? reason
                             : "line " + std::to_string(line) + ": " + reason),
        line_(line) {}

  std::size_t line() const { return line_; }

private:
  std::size_t line_;
};

class InfeasibleItemError : public ParseError {
public:
  using ParseError::ParseError;
};

/**
 * @brief a packing lost or duplicated an item or overfilled a bin
 */
class EngineInvariantError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

} // namespace bpp
