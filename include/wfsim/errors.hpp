#pragma once
#include <stdexcept>
#include <string>

namespace wfsim {

// Raised before any output is produced; a malformed configuration has no
// local recovery, so callers surface it.
class ConfigError : public std::invalid_argument {
public:
  enum class Kind {
    InvalidConfiguration,
    DegenerateGeometry,
  };

  ConfigError(Kind kind, const std::string& what)
    : std::invalid_argument(what), kind_(kind) {}

  Kind kind() const noexcept { return kind_; }

private:
  Kind kind_;
};

const char* kind_name(ConfigError::Kind k);

} // namespace wfsim
