#pragma once

#include <string>

namespace grounded_core {

// Attributes carried from the complaint record for citation display.
struct SourceMetadata {
  std::string product;
  std::string submission_date;
  std::string company;
};

struct Document {
  std::string id;
  SourceMetadata source;
  std::string text;
};

}  // namespace grounded_core
