// doc_merge.hpp
#ifndef DOC_MERGE_HPP
#define DOC_MERGE_HPP

#include "doc_errors.hpp"
#include "doc_tree.hpp"

#include <optional>
#include <string>

/// Outcome of merging one aspect of a base document with the aspect at the
/// same index of a language overlay.
struct AspectMergeResult {
  size_t index;
  std::string base_name;                    // `name` of the base aspect (empty if none)
  std::optional<std::string> overlay_label; // `label` of the overlay aspect
  std::optional<DocTree> merged;            // set when the merge succeeded
  std::optional<MergeError> error;          // set when it failed

  bool ok() const { return !error.has_value(); }
};

/// Combines a language-neutral base tree with a per-language overlay tree.
///
/// Objects merge key-wise, lists positionally. When only one side has a value
/// that side is used. On a leaf collision the overlay wins.
///
/// In strict mode two lists must have the same length, and a collection may
/// only meet a collection of the same shape; otherwise MergeError is thrown
/// naming the path of the offending node. In lenient mode extra overlay items
/// are appended, extra base items are kept and shape conflicts go to the overlay.
class MergeEngine {
public:
  static DocTree merge(const DocTree &base, const DocTree &overlay, bool strict);

  /// Merges `base.aspects[i]` with `overlay.aspects[i]` one index at a time and
  /// collects the outcome per index instead of throwing. An index present on
  /// one side only is reported as a StructuralMismatch for that index.
  static DocVector<AspectMergeResult> merge_aspects_one_by_one(const DocTree &base, const DocTree &overlay,
                                                               bool strict);

  /// One line per failing aspect, for logs.
  static std::string describe_failures(const DocVector<AspectMergeResult> &results);
};

#endif // DOC_MERGE_HPP
