#pragma once

#include <cstddef>

#include <nlohmann/json.hpp>

#include "dst/data/EvidenceSource.hpp"
#include "dst/data/FrameOfDiscernment.hpp"

namespace dst {

// Yields the entries of a JSON "sources" array in order:
//   [{"name": "camera", "masses": {"RED": 0.6, "RED|YELLOW": 0.4}}, ...]
// Entries with unknown labels or invalid masses are logged and skipped.
class JsonEvidenceSource : public IEvidenceSource {
public:
  JsonEvidenceSource(nlohmann::json sources, FrameOfDiscernment frame);

  bool next(Evidence_t& out) override;

  std::size_t skipped() const { return skippedCount; }

private:
  bool parseEntry(const nlohmann::json& node, Evidence_t& out) const;

  nlohmann::json sources;
  FrameOfDiscernment frame;
  std::size_t index = 0;
  std::size_t skippedCount = 0;
};

} // namespace dst
