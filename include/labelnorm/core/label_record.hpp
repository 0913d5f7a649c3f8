#pragma once

#include <string>

namespace labelnorm::core {

/// One row of a batch: the label as submitted and its corrected form.
/// Created by the batch runner with an empty correction; is_processing is
/// true only while the record is in flight.
struct LabelRecord {
  std::string original;
  std::string corrected;
  bool is_processing{false};
};

}  // namespace labelnorm::core
