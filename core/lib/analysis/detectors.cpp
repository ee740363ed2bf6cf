// defcheck/analysis/detectors.cpp - Detector registry
#include "defcheck/analysis/detectors.hpp"

#include <array>
#include <iterator>

#include "defcheck/analysis/tree_queries.hpp"

namespace defcheck
{

namespace
{

constexpr std::array<DetectorInfo, 7> k_detectors = {{
  {"null_safety", ViolationType::NullSafety, &detect_null_safety},
  {"collection_safety", ViolationType::CollectionSafety, &detect_collection_safety},
  {"external_call_safety", ViolationType::ExternalCallSafety, &detect_external_call_safety},
  {"type_safety", ViolationType::TypeSafety, &detect_type_safety},
  {"bounds_safety", ViolationType::BoundsSafety, &detect_bounds_safety},
  {"exception_handling", ViolationType::ExceptionHandling, &detect_exception_handling},
  {"concurrency_safety", ViolationType::ConcurrencySafety, &detect_concurrency_safety},
}};

}  // namespace

DetectorContext::DetectorContext(
  const SyntaxTree & t, const ParentIndex & p, const ContextWindow & w, const PatternLibrary & lib)
: tree(t), parents(p), window(w), patterns(lib), module_names(imported_names(t))
{
  module_names.insert(lib.allowed_modules.begin(), lib.allowed_modules.end());

  // Classes defined in the file are never None either.
  for (const NodeId cls : t.nodes_of_kind(NodeKind::ClassDefinition)) {
    const NodeId name = t.child_by_role(cls, FieldRole::Name);
    if (name != k_invalid_node) {
      module_names.emplace(t.text(name));
    }
  }
}

gsl::span<const DetectorInfo> all_detectors() noexcept
{
  return gsl::span<const DetectorInfo>(k_detectors.data(), k_detectors.size());
}

std::vector<Violation> run_all_detectors(const DetectorContext & ctx)
{
  std::vector<Violation> out;
  for (const auto & d : all_detectors()) {
    auto found = d.run(ctx);
    out.insert(
      out.end(), std::make_move_iterator(found.begin()), std::make_move_iterator(found.end()));
  }
  return out;
}

}  // namespace defcheck
