#pragma once

#include <cstddef>
#include <vector>

#include "dst/config/FusionConfig.hpp"
#include "dst/core/Status.hpp"
#include "dst/core/Types.hpp"
#include "dst/data/EvidenceSource.hpp"

namespace dst {

struct FusionReport_t {
  FusionStatus_e status = FusionStatus_e::kEmptyInput;
  std::size_t sourceCount = 0;
  // Fused focal elements, padding removed.
  std::vector<FocalElement_t<Hypothesis>> focalElements;
};

// Drains an evidence source and fuses everything it yields with the
// configured strategy and capacity.
class FusionPipeline {
public:
  explicit FusionPipeline(FusionOptions_t options);

  FusionReport_t run(IEvidenceSource& source) const;

  const FusionOptions_t& options() const { return fusionOptions; }

private:
  FusionOptions_t fusionOptions;
};

} // namespace dst
