#pragma once
#include "record_streamer/record_streamer.hpp"

#include <string>

namespace rs {

class SummaryJsonWriter {
public:
  // Serialize a run summary (plus the source it ran over) to JSON.
  static std::string to_json(const Summary& s, const std::string& source_path);
};

}
