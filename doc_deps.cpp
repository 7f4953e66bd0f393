// doc_deps.cpp
#include "doc_deps.hpp"
#include "doc_log.hpp"

namespace {

LenientOrder kahn_rounds(const DocVector<DependencyNode> &nodes) {
  DocSet<std::string> batch;
  DocVector<DependencyNode> pending;
  for (const auto &node : nodes) {
    if (!batch.insert(node.slug).second) {
      DOCTREE_LOG_WARN("duplicate slug '" + node.slug + "' in batch, ignoring the later one");
      continue;
    }
    pending.push_back(DependencyNode{node.slug, {}});
  }
  // keep only in-batch edges; the first record of a duplicated slug wins
  DocSet<std::string> seen;
  size_t next = 0;
  for (const auto &node : nodes) {
    if (!seen.insert(node.slug).second) {
      continue;
    }
    for (const auto &ref : node.refs) {
      if (batch.count(ref)) {
        pending[next].refs.insert(ref);
      }
    }
    ++next;
  }

  LenientOrder result;
  while (!pending.empty()) {
    DocVector<std::string> ready;
    DocVector<DependencyNode> waiting;
    for (auto &node : pending) {
      if (node.refs.empty()) {
        ready.push_back(node.slug);
      } else {
        waiting.push_back(std::move(node));
      }
    }

    if (ready.empty()) {
      for (const auto &node : waiting) {
        result.skipped.emplace(node.slug, node.refs);
      }
      break;
    }

    for (auto &node : waiting) {
      for (const auto &slug : ready) {
        node.refs.erase(slug);
      }
    }
    result.order.insert(result.order.end(), ready.begin(), ready.end());
    pending = std::move(waiting);
  }
  return result;
}

} // namespace

LenientOrder DependencyResolver::resolve_order_lenient(const DocVector<DependencyNode> &nodes) {
  LenientOrder result = kahn_rounds(nodes);
  if (!result.complete()) {
    DOCTREE_LOG_WARN("skipping " + std::to_string(result.skipped.size()) +
                     " documents with circular dependencies: " + CircularDependencyError::describe(result.skipped));
  }
  return result;
}

DocVector<std::string> DependencyResolver::resolve_order(const DocVector<DependencyNode> &nodes) {
  LenientOrder result = kahn_rounds(nodes);
  if (!result.complete()) {
    throw CircularDependencyError(std::move(result.skipped));
  }
  return std::move(result.order);
}
