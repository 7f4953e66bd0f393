// doc_versions.hpp
#ifndef DOC_VERSIONS_HPP
#define DOC_VERSIONS_HPP

#include "doc_document.hpp"

/// Reverse-delta version history of a document.
///
/// The live content is always the newest version. Older versions are
/// reconstructed by replaying reverse deltas backwards from the live content,
/// so no snapshot besides the newest one is ever stored.
class VersionStore {
public:
  explicit VersionStore(DependentsIndex &dependents) : dependents_(dependents) {}

  /// Content of `target` (1..doc.version). Throws VersionError otherwise.
  DocTree get_version(const Document &doc, uint64_t target) const;

  /// Structural documents always count as depended upon; a concrete document
  /// only when some instance pins its current version.
  bool has_dependents(const Document &doc) const;

  /// Makes `new_content` the live content of `doc`.
  ///
  /// With dependents the current content is frozen as a new version (one more
  /// reverse delta, version + 1). Without, the current version is rewritten in
  /// place and its reverse delta recomputed. Equal content is a no-op.
  ///
  /// @return the version of `doc` after the update
  uint64_t update_version(Document &doc, const DocTree &new_content) const;

  /// True iff version > 1 and every dependent pins exactly the current version.
  bool can_smash(const Document &doc) const;

  /// Folds the newest version into the previous one: drops the last reverse
  /// delta, recomputes the new last one from the live content, decrements the
  /// version and moves every dependent to it. Throws VersionError when
  /// can_smash() is false.
  ///
  /// Only `doc` is modified in memory; the dependents are repinned through the
  /// index, so callers run this inside DocumentStore::atomically together with
  /// the put of `doc`.
  void smash_version(Document &doc) const;

private:
  DependentsIndex &dependents_;
};

#endif // DOC_VERSIONS_HPP
