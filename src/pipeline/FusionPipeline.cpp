#include "dst/pipeline/FusionPipeline.hpp"

#include <stdexcept>
#include <string>
#include <utility>

#include "dst/core/Logger.hpp"
#include "dst/fusion/Approximation.hpp"
#include "dst/fusion/Fusion.hpp"

namespace dst {

namespace {

using RawAssignment = std::vector<FocalElement_t<Hypothesis>>;

template <typename Approx, std::size_t N>
FusionStatus_e fuseBounded(const std::vector<RawAssignment>& sources, RawAssignment& out) {
  BoundedAssignment<Hypothesis, N> fused{};
  const FusionStatus_e status = fuse<Approx>(sources, fused);
  if (status != FusionStatus_e::kOk) {
    return status;
  }
  out.clear();
  for (const auto& element : fused) {
    if (!isEmpty(element.hypothesis)) {
      out.push_back(element);
    }
  }
  return status;
}

template <std::size_t N>
FusionStatus_e fuseWithStrategy(ApproximationStrategy_e strategy,
                                const std::vector<RawAssignment>& sources,
                                RawAssignment& out) {
  switch (strategy) {
    case ApproximationStrategy_e::kSummarize:
      return fuseBounded<Summarize, N>(sources, out);
    case ApproximationStrategy_e::kTopN:
      break;
  }
  return fuseBounded<TopN, N>(sources, out);
}

FusionStatus_e dispatch(const FusionOptions_t& options,
                        const std::vector<RawAssignment>& sources,
                        RawAssignment& out) {
  switch (options.capacity) {
    case 2:
      return fuseWithStrategy<2>(options.strategy, sources, out);
    case 4:
      return fuseWithStrategy<4>(options.strategy, sources, out);
    case 8:
      return fuseWithStrategy<8>(options.strategy, sources, out);
    case 16:
      return fuseWithStrategy<16>(options.strategy, sources, out);
    case 32:
      return fuseWithStrategy<32>(options.strategy, sources, out);
    default:
      throw std::invalid_argument("FusionPipeline: unsupported capacity " + std::to_string(options.capacity));
  }
}

} // namespace

FusionPipeline::FusionPipeline(FusionOptions_t options) : fusionOptions(std::move(options)) {
  fusionOptions.capacity = supportedCapacity(fusionOptions.capacity);
  if (auto logger = Logger::GetClass("FusionPipeline")) {
    logger->info("FusionPipeline created strategy {} capacity {}",
                 toString(fusionOptions.strategy),
                 fusionOptions.capacity);
  }
}

FusionReport_t FusionPipeline::run(IEvidenceSource& source) const {
  std::vector<RawAssignment> sources;
  Evidence_t evidence;
  while (source.next(evidence)) {
    if (auto logger = Logger::GetClass("FusionPipeline")) {
      logger->debug("FusionPipeline: source '{}' with {} focal elements", evidence.name, evidence.masses.size());
    }
    sources.push_back(std::move(evidence.masses));
    evidence = Evidence_t{};
  }

  FusionReport_t report;
  report.sourceCount = sources.size();
  report.status = dispatch(fusionOptions, sources, report.focalElements);
  if (auto logger = Logger::GetClass("FusionPipeline")) {
    if (report.status == FusionStatus_e::kOk) {
      logger->info("FusionPipeline fused {} sources into {} focal elements",
                   report.sourceCount,
                   report.focalElements.size());
    } else {
      logger->error("FusionPipeline failed after {} sources: {}", report.sourceCount, toString(report.status));
    }
  }
  return report;
}

} // namespace dst
