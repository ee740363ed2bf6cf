// defcheck/integration/component_graph.hpp - Component dependency graph
//
// A component is a directory under the components root. An edge A -> B is
// added when any source file of A references B by import or by name. The
// graph is rebuilt from scratch on every run.
//
#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "defcheck/basic/analysis_note.hpp"
#include "defcheck/basic/source_file.hpp"
#include "defcheck/integration/contract_loader.hpp"

namespace defcheck
{

struct ComponentNode
{
  std::string name;
  std::vector<SourceFile> sources;
  std::optional<int> timeout;
  std::optional<ContractFacts> contract;
};

struct ComponentEdge
{
  std::string caller;
  std::string callee;
  bool has_error_handling = false;  ///< try body references the callee, or a circuit/fallback marker
  bool has_retry = false;           ///< retry/backoff/tenacity near the callee's use
  std::optional<int> timeout;       ///< Caller's declared timeout
};

class ComponentGraph
{
public:
  /// Components ordered by name
  [[nodiscard]] const std::map<std::string, ComponentNode> & components() const noexcept
  {
    return components_;
  }

  /// Edges ordered by (caller, callee)
  [[nodiscard]] const std::vector<ComponentEdge> & edges() const noexcept { return edges_; }

  [[nodiscard]] const ComponentNode * find(const std::string & name) const;

  /// Callees of a component, in name order
  [[nodiscard]] std::set<std::string> successors(const std::string & name) const;

  [[nodiscard]] bool empty() const noexcept { return components_.empty(); }

private:
  friend class ComponentGraphBuilder;

  std::map<std::string, ComponentNode> components_;
  std::vector<ComponentEdge> edges_;
};

/**
 * Collects components, their sources and contracts, then derives edges.
 *
 * Sources and contracts can be added in memory or by scanning a project.
 * Problems with individual files are recorded as notes and never abort the
 * build.
 */
class ComponentGraphBuilder
{
public:
  void add_component(const std::string & name);

  /// Adds a source file to a component (creating the component if needed)
  void add_source(const std::string & component, std::filesystem::path path, std::string text);

  /// Attaches contract facts to an existing component; returns false if unknown
  bool add_contract(const std::string & component, ContractFacts facts);

  /**
   * Scan `components_dir` (one component per non-hidden subdirectory) and
   * `contracts_dir` (`*.yaml`, `*.yml`, `*.json`).
   */
  void scan(const std::filesystem::path & components_dir, const std::filesystem::path & contracts_dir);

  /// Derive edges and their error-handling facts
  [[nodiscard]] ComponentGraph build();

  [[nodiscard]] const std::vector<AnalysisNote> & notes() const noexcept { return notes_; }

private:
  void scan_component(const std::filesystem::path & dir);

  std::map<std::string, ComponentNode> components_;
  std::vector<AnalysisNote> notes_;
};

}  // namespace defcheck
