#pragma once

#include <string_view>

namespace labelnorm::core {

/// Error codes for the layers around the pipeline; used with std::expected.
/// Normalizing a label never fails: these only come from configuration and I/O.
enum class LabelError {
  None = 0,
  InvalidConfig,
  LoadFailed,
  WriteFailed,
};

[[nodiscard]] constexpr std::string_view error_name(LabelError e) noexcept {
  switch (e) {
  case LabelError::None:
    return "None";
  case LabelError::InvalidConfig:
    return "InvalidConfig";
  case LabelError::LoadFailed:
    return "LoadFailed";
  case LabelError::WriteFailed:
    return "WriteFailed";
  }
  return "Unknown";
}

}  // namespace labelnorm::core
