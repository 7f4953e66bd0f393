// doc_deps.hpp
#ifndef DOC_DEPS_HPP
#define DOC_DEPS_HPP

#include "doc_errors.hpp"
#include "doc_tree.hpp"

#include <string>

struct DependencyNode {
  std::string slug;
  DocSortedSet<std::string> refs; // slugs this node depends on
};

struct LenientOrder {
  DocVector<std::string> order;                // resolved prefix
  CircularDependencyError::Remaining skipped; // unresolved slugs with their open dependencies

  bool complete() const { return skipped.empty(); }
};

/// Orders a batch so that every document comes after the documents it
/// references. Only edges whose target is in the batch count.
///
/// Rounds of Kahn's algorithm: each round emits, in input order, every node
/// without open dependencies. Identical input gives identical output.
class DependencyResolver {
public:
  /// Throws CircularDependencyError when some nodes can never be emitted.
  static DocVector<std::string> resolve_order(const DocVector<DependencyNode> &nodes);

  /// Same ordering, but a cycle stops the resolution instead of throwing.
  static LenientOrder resolve_order_lenient(const DocVector<DependencyNode> &nodes);
};

#endif // DOC_DEPS_HPP
