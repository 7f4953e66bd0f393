// doc_errors.hpp
#ifndef DOC_ERRORS_HPP
#define DOC_ERRORS_HPP

#include "doc_tree.hpp"

#include <stdexcept>
#include <string>

/// Base class of every failure raised by doctree.
class DocTreeException : public std::runtime_error {
public:
  explicit DocTreeException(const std::string &msg) : std::runtime_error(msg) {}
};

/// Base and overlay trees could not be combined.
class MergeError : public DocTreeException {
public:
  enum Kind { STRUCTURAL_MISMATCH, TYPE_CONFLICT };

  MergeError(Kind kind, std::string path, const std::string &detail)
      : DocTreeException(std::string(kind_name(kind)) + " at '" + path + "': " + detail), kind_(kind),
        path_(std::move(path)) {}

  Kind kind() const { return kind_; }

  /// Dotted path of the offending node, e.g. `aspects.2`.
  const std::string &path() const { return path_; }

  static const char *kind_name(Kind kind) {
    switch (kind) {
    case STRUCTURAL_MISMATCH:
      return "StructuralMismatch";
    case TYPE_CONFLICT:
      return "TypeConflict";
    }
    return "Unknown";
  }

private:
  Kind kind_;
  std::string path_;
};

/// A version outside `1..version` was requested, or a smash is not allowed.
class VersionError : public DocTreeException {
public:
  VersionError(uint64_t given, uint64_t max, const std::string &detail = "Invalid version number")
      : DocTreeException(detail + " (given: " + std::to_string(given) + ", min: 1, max: " + std::to_string(max) + ")"),
        given_(given), max_(max) {}

  uint64_t given() const { return given_; }
  uint64_t min() const { return 1; }
  uint64_t max() const { return max_; }

private:
  uint64_t given_;
  uint64_t max_;
};

/// The in-batch reference graph contains a cycle.
class CircularDependencyError : public DocTreeException {
public:
  using Remaining = DocSortedMap<DocKey, DocSortedSet<DocKey>>;

  explicit CircularDependencyError(Remaining remaining)
      : DocTreeException("Circular dependencies: " + describe(remaining)), remaining_(std::move(remaining)) {}

  /// Every unresolved slug with the in-batch slugs it still waits for.
  const Remaining &remaining() const { return remaining_; }

  static std::string describe(const Remaining &remaining) {
    std::string out = "{";
    bool first = true;
    for (const auto &[slug, deps] : remaining) {
      if (!first) {
        out += ", ";
      }
      first = false;
      out += slug + ": {";
      bool first_dep = true;
      for (const auto &dep : deps) {
        if (!first_dep) {
          out += ", ";
        }
        first_dep = false;
        out += dep;
      }
      out += "}";
    }
    return out + "}";
  }

private:
  Remaining remaining_;
};

/// A referenced document does not exist.
class NotFoundError : public DocTreeException {
public:
  /// @param reference human readable reference (slug, uuid)
  /// @param tried languages looked up, in order (empty for uuid/slug-only lookups)
  NotFoundError(std::string reference, DocVector<std::string> tried = {})
      : DocTreeException("Document not found: " + reference + describe(tried)), reference_(std::move(reference)),
        tried_(std::move(tried)) {}

  const std::string &reference() const { return reference_; }
  const DocVector<std::string> &tried() const { return tried_; }

private:
  static std::string describe(const DocVector<std::string> &tried) {
    if (tried.empty()) {
      return "";
    }
    std::string out = " (tried languages:";
    for (const auto &language : tried) {
      out += " " + language;
    }
    return out + ")";
  }

  std::string reference_;
  DocVector<std::string> tried_;
};

/// The document store failed to commit; the write did not happen.
class StoreCommitError : public DocTreeException {
public:
  explicit StoreCommitError(const std::string &msg) : DocTreeException(msg) {}
};

/// A document, aspect or serialised tree is malformed.
class DocumentParseError : public DocTreeException {
public:
  explicit DocumentParseError(const std::string &msg) : DocTreeException(msg) {}
};

#endif // DOC_ERRORS_HPP
