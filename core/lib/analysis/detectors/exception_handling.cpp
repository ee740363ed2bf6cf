// defcheck/analysis/detectors/exception_handling.cpp - Bare and silent except clauses
#include "defcheck/analysis/detectors.hpp"

namespace defcheck
{

namespace
{

NodeId handler_block(const SyntaxTree & tree, NodeId clause)
{
  NodeId block = k_invalid_node;
  for (const NodeId c : tree.node(clause).children) {
    if (tree.is(c, NodeKind::Block)) block = c;
  }
  return block;
}

/// `except:` with no exception expression
bool is_bare(const SyntaxTree & tree, NodeId clause)
{
  for (const NodeId c : tree.node(clause).children) {
    if (!tree.is(c, NodeKind::Block) && !tree.is(c, NodeKind::Comment)) {
      return false;
    }
  }
  return true;
}

bool is_placeholder_statement(const SyntaxTree & tree, NodeId stmt)
{
  if (tree.is(stmt, NodeKind::PassStatement)) return true;
  if (!tree.is(stmt, NodeKind::ExpressionStatement)) return false;
  const auto & children = tree.node(stmt).children;
  return children.size() == 1 && tree.is(children.front(), NodeKind::Ellipsis);
}

/// Handler body holds nothing but `pass` / `...` (comments ignored)
bool is_silent(const SyntaxTree & tree, NodeId block)
{
  if (block == k_invalid_node) return false;
  bool any = false;
  for (const NodeId stmt : tree.node(block).children) {
    if (tree.is(stmt, NodeKind::Comment)) continue;
    if (!is_placeholder_statement(tree, stmt)) return false;
    any = true;
  }
  return any;
}

}  // namespace

std::vector<Violation> detect_exception_handling(const DetectorContext & ctx)
{
  const SyntaxTree & tree = ctx.tree;
  ViolationBag bag(tree.source());

  for (const NodeId clause : tree.nodes_of_kind(NodeKind::ExceptClause)) {
    const SourceRange where = tree.node(clause).range;

    if (is_bare(tree, clause)) {
      bag
        .report(
          where, ViolationType::ExceptionHandling, Severity::Critical,
          "Bare except clause catches all exceptions")
        .with_suggestion("except Exception as e:\n    logger.error(f'Error: {e}')");
    }

    if (is_silent(tree, handler_block(tree, clause))) {
      bag
        .report(
          where, ViolationType::ExceptionHandling, Severity::Warning,
          "Exception silently caught and ignored")
        .with_suggestion("except Exception as e:\n    logger.warning(f'Ignored error: {e}')");
    }
  }
  return bag.take();
}

}  // namespace defcheck
