// doc_diff.hpp
#ifndef DOC_DIFF_HPP
#define DOC_DIFF_HPP

#include "doc_tree.hpp"

#include <optional>
#include <string>

/// One difference between two trees at a single path.
struct DiffRecord {
  enum Kind { ITEM_ADDED, ITEM_REMOVED, VALUE_CHANGED };

  Kind kind;
  DocPath path;
  DocTree old_value; // null for ITEM_ADDED
  DocTree new_value; // null for ITEM_REMOVED

  static const char *kind_name(Kind kind) {
    switch (kind) {
    case ITEM_ADDED:
      return "item_added";
    case ITEM_REMOVED:
      return "item_removed";
    case VALUE_CHANGED:
      return "value_changed";
    }
    return "unknown";
  }
};

using StructuredDiff = DocVector<DiffRecord>;

struct CompareResult {
  bool is_equal;
  StructuredDiff diff;
};

/// Structural comparison of document trees.
class ChangeDetector {
public:
  /// Top-level bookkeeping fields that never count as a content change:
  /// uuid, actors, template, tags, version.
  static const DocSortedSet<DocKey> &default_ignore_fields();

  /// Copy of `tree` without the top-level `ignore_fields` and without
  /// null-valued object members at any depth.
  static DocTree project(const DocTree &tree, const DocSortedSet<DocKey> &ignore_fields);

  /// Raw diff transforming `from` into `to`. Object members are compared key-wise,
  /// lists index-wise; any other difference is a VALUE_CHANGED at that path.
  static StructuredDiff diff(const DocTree &from, const DocTree &to);

  /// Diff of the two projections; `is_equal` iff it is empty.
  static CompareResult compare(const DocTree &persisted, const DocTree &incoming,
                               const DocSortedSet<DocKey> &ignore_fields = default_ignore_fields());
};

/// A replayable edit script between two trees. Used as the reverse delta of a
/// document version: applied to version N+1 it yields version N.
class DocPatch {
public:
  struct Op {
    enum Kind { SET, REMOVE, TRUNCATE, APPEND };

    Kind kind;
    DocPath path;  // SET/REMOVE: the member or item; TRUNCATE/APPEND: the list
    DocTree value; // SET/APPEND
    size_t length; // TRUNCATE
  };

  DocPatch() = default;

  /// Builds the patch that turns `from` into `to`.
  static DocPatch make(const DocTree &from, const DocTree &to);

  /// Replays the patch in place. Throws DocumentParseError when the tree does
  /// not have the shape the patch was made against.
  void apply(DocTree &tree) const;

  bool empty() const { return ops_.empty(); }
  const DocVector<Op> &ops() const { return ops_; }

  /// Text form stored in the delta log.
  std::string to_string() const;
  static DocPatch from_string(const std::string &text);

  bool operator==(const DocPatch &other) const { return to_string() == other.to_string(); }

private:
  DocVector<Op> ops_;
};

#endif // DOC_DIFF_HPP
