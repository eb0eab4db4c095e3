#include <locqa/error.hpp>

#include <fmt/format.h>

namespace locqa {

const char *to_string(ErrorKind k) {
  switch (k) {
  case ErrorKind::ParseError:
    return "ParseError";
  case ErrorKind::InvalidPattern:
    return "InvalidPattern";
  case ErrorKind::UnknownRecordId:
    return "UnknownRecordId";
  case ErrorKind::IOError:
    return "IOError";
  case ErrorKind::MissingResource:
    return "MissingResource";
  case ErrorKind::MessageFormat:
    return "MessageFormat";
  }
  return "Unknown";
}

static std::string decorate(ErrorKind kind, const std::string &msg, int line) {
  if (line > 0)
    return fmt::format("{}: {} (line {})", to_string(kind), msg, line);
  return fmt::format("{}: {}", to_string(kind), msg);
}

Error::Error(ErrorKind kind, const std::string &msg, int line)
    : std::runtime_error(decorate(kind, msg, line)), kind_(kind), line_(line) {}

} // namespace locqa
