// defcheck/integration/component_graph.cpp
#include "defcheck/integration/component_graph.hpp"

#include <algorithm>
#include <memory>
#include <regex>

#include "defcheck/basic/string_utils.hpp"
#include "defcheck/syntax/frontend.hpp"

namespace defcheck
{

namespace
{

namespace fs = std::filesystem;

constexpr std::string_view k_handling_markers[] = {"circuit", "fallback"};
constexpr std::string_view k_retry_markers[] = {"retry", "backoff", "tenacity"};

template <size_t N>
bool mentions_any(const std::string & lower_text, const std::string_view (&markers)[N])
{
  return std::any_of(std::begin(markers), std::end(markers), [&](std::string_view m) {
    return contains(lower_text, m);
  });
}

/// Name and import alias (`-` -> `_`) of a component
std::vector<std::string> spellings(const std::string & name)
{
  std::string alias = name;
  std::replace(alias.begin(), alias.end(), '-', '_');
  if (alias == name) return {name};
  return {name, alias};
}

std::regex reference_pattern(const std::string & name)
{
  std::vector<std::string> escaped;
  for (const auto & s : spellings(name)) {
    escaped.push_back(regex_escape(s));
  }
  const std::string b = "(?:" + join(escaped, "|") + ")";
  return std::regex(
    "(?:from|import)\\s+components\\." + b + "\\b" + "|\\bimport\\s+" + b + "\\b" +
    "|\\bfrom\\s+" + b + "\\s+import\\b" + "|['\"]" + b + "['\"]");
}

bool module_mentions(std::string_view dotted, const std::vector<std::string> & names)
{
  size_t start = 0;
  while (start <= dotted.size()) {
    const size_t dot = dotted.find('.', start);
    const std::string_view part =
      trim(dotted.substr(start, dot == std::string_view::npos ? std::string_view::npos : dot - start));
    if (std::find(names.begin(), names.end(), part) != names.end()) return true;
    if (dot == std::string_view::npos) break;
    start = dot + 1;
  }
  return false;
}

/// Names a file binds by importing from a component
void collect_bound_names(
  const SyntaxTree & tree, const std::vector<std::string> & component, std::vector<std::string> & out)
{
  for (NodeId id = 0; id < tree.size(); ++id) {
    if (tree.is(id, NodeKind::ImportFromStatement)) {
      if (!module_mentions(tree.text(tree.child_by_role(id, FieldRole::ModuleName)), component)) {
        continue;
      }
      for (const NodeId n : tree.children_by_role(id, FieldRole::Name)) {
        const NodeId alias = tree.child_by_role(n, FieldRole::Alias);
        out.emplace_back(alias != k_invalid_node ? tree.text(alias) : tree.text(n));
      }
    } else if (tree.is(id, NodeKind::ImportStatement)) {
      for (const NodeId n : tree.children_by_role(id, FieldRole::Name)) {
        if (!tree.is(n, NodeKind::AliasedImport)) continue;
        if (!module_mentions(tree.text(tree.child_by_role(n, FieldRole::Name)), component)) {
          continue;
        }
        out.emplace_back(tree.text(tree.child_by_role(n, FieldRole::Alias)));
      }
    }
  }
}

/// Whether the body of any try statement mentions one of the names
bool try_body_mentions(const SyntaxTree & tree, const std::vector<std::string> & names)
{
  for (const NodeId stmt : tree.nodes_of_kind(NodeKind::TryStatement)) {
    const std::string_view body = tree.text(tree.child_by_role(stmt, FieldRole::Body));
    for (const auto & n : names) {
      if (contains_word(body, n)) return true;
    }
  }
  return false;
}

bool is_hidden(const fs::path & p)
{
  const std::string name = p.filename().string();
  return !name.empty() && name.front() == '.';
}

}  // namespace

// ============================================================================
// ComponentGraph
// ============================================================================

const ComponentNode * ComponentGraph::find(const std::string & name) const
{
  const auto it = components_.find(name);
  return it == components_.end() ? nullptr : &it->second;
}

std::set<std::string> ComponentGraph::successors(const std::string & name) const
{
  std::set<std::string> out;
  for (const auto & e : edges_) {
    if (e.caller == name) out.insert(e.callee);
  }
  return out;
}

// ============================================================================
// ComponentGraphBuilder
// ============================================================================

void ComponentGraphBuilder::add_component(const std::string & name)
{
  auto & node = components_[name];
  node.name = name;
}

void ComponentGraphBuilder::add_source(
  const std::string & component, fs::path path, std::string text)
{
  add_component(component);
  components_[component].sources.emplace_back(std::move(path), std::move(text));
}

bool ComponentGraphBuilder::add_contract(const std::string & component, ContractFacts facts)
{
  const auto it = components_.find(component);
  if (it == components_.end()) {
    return false;
  }
  it->second.timeout = facts.timeout;
  it->second.contract = std::move(facts);
  return true;
}

void ComponentGraphBuilder::scan_component(const fs::path & dir)
{
  const std::string name = dir.filename().string();
  add_component(name);

  std::error_code ec;
  std::vector<fs::path> files;
  for (auto it = fs::recursive_directory_iterator(dir, ec); !ec && it != fs::recursive_directory_iterator();
       it.increment(ec)) {
    const fs::path & p = it->path();
    if (it->is_directory() && (p.filename() == "__pycache__" || is_hidden(p))) {
      it.disable_recursion_pending();
      continue;
    }
    if (it->is_regular_file() && p.extension() == ".py") {
      files.push_back(p);
    }
  }
  if (ec) {
    notes_.push_back({dir.string(), NoteKind::IoError, ec.message()});
  }

  std::sort(files.begin(), files.end());
  for (const auto & f : files) {
    auto text = read_file(f);
    if (!text) {
      notes_.push_back({f.string(), NoteKind::IoError, "cannot read file"});
      continue;
    }
    add_source(name, f, std::move(*text));
  }
}

void ComponentGraphBuilder::scan(const fs::path & components_dir, const fs::path & contracts_dir)
{
  std::error_code ec;
  if (!fs::is_directory(components_dir, ec)) {
    return;
  }

  std::vector<fs::path> dirs;
  for (const auto & entry : fs::directory_iterator(components_dir, ec)) {
    if (entry.is_directory() && !is_hidden(entry.path()) &&
        entry.path().filename() != "__pycache__") {
      dirs.push_back(entry.path());
    }
  }
  std::sort(dirs.begin(), dirs.end());
  for (const auto & d : dirs) {
    scan_component(d);
  }

  if (!fs::is_directory(contracts_dir, ec)) {
    return;
  }

  std::vector<fs::path> contracts;
  for (const auto & entry : fs::directory_iterator(contracts_dir, ec)) {
    const auto ext = entry.path().extension();
    if (entry.is_regular_file() && (ext == ".yaml" || ext == ".yml" || ext == ".json")) {
      contracts.push_back(entry.path());
    }
  }
  std::sort(contracts.begin(), contracts.end());

  for (const auto & c : contracts) {
    auto loaded = load_contract(c);
    if (!loaded.success) {
      notes_.push_back({c.string(), NoteKind::ConfigError, loaded.error});
      continue;
    }
    // Contracts for unknown components are ignored.
    (void)add_contract(contract_component_name(c), std::move(loaded.facts));
  }
}

ComponentGraph ComponentGraphBuilder::build()
{
  ComponentGraph graph;
  SourceParser parser;

  // Parse every source once; failed parses keep a null tree.
  std::map<std::string, std::vector<std::unique_ptr<SyntaxTree>>> trees;
  for (const auto & [name, node] : components_) {
    auto & out = trees[name];
    for (const auto & src : node.sources) {
      ParseResult parsed = parser.parse_source(src.path(), std::string(src.content()));
      if (!parsed.success()) {
        notes_.push_back(
          {src.display_name(), NoteKind::ParseError,
           parsed.error ? parsed.error->message : "parse failed"});
      }
      out.push_back(std::move(parsed.tree));
    }
  }

  for (const auto & [a, caller] : components_) {
    for (const auto & [b, callee] : components_) {
      if (a == b) continue;

      const std::regex ref = reference_pattern(b);
      const std::vector<std::string> b_spellings = spellings(b);

      ComponentEdge edge;
      edge.caller = a;
      edge.callee = b;
      edge.timeout = caller.timeout;

      bool referenced = false;
      for (size_t i = 0; i < caller.sources.size(); ++i) {
        const std::string_view content = caller.sources[i].content();
        if (!std::regex_search(content.begin(), content.end(), ref)) continue;
        referenced = true;

        const std::string lower = to_lower(content);
        if (mentions_any(lower, k_retry_markers)) edge.has_retry = true;
        if (mentions_any(lower, k_handling_markers)) edge.has_error_handling = true;

        const SyntaxTree * tree = trees[a][i].get();
        if (tree != nullptr && !edge.has_error_handling) {
          std::vector<std::string> names = b_spellings;
          collect_bound_names(*tree, b_spellings, names);
          edge.has_error_handling = try_body_mentions(*tree, names);
        }
      }

      if (referenced) {
        graph.edges_.push_back(std::move(edge));
      }
    }
  }

  graph.components_ = components_;
  return graph;
}

}  // namespace defcheck
