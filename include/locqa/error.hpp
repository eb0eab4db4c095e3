#pragma once
#include <stdexcept>
#include <string>
#include <vector>

namespace locqa {

enum class ErrorKind {
  ParseError,
  InvalidPattern,
  UnknownRecordId,
  IOError,
  MissingResource,
  MessageFormat,
};

const char *to_string(ErrorKind k);

// Whole-operation failure. Thrown by loaders/savers and record stores.
class Error : public std::runtime_error {
public:
  Error(ErrorKind kind, const std::string &msg, int line = 0);

  ErrorKind kind() const { return kind_; }
  // 1-based line of a parse error, 0 when unknown
  int line() const { return line_; }

private:
  ErrorKind kind_;
  int line_{0};
};

// Per-item failure collected by partial-success operations.
struct Diagnostic {
  ErrorKind kind;
  std::string subject; // rule name, record id, ...
  std::string message;
};

using Diagnostics = std::vector<Diagnostic>;

} // namespace locqa
