// doc_versions.cpp
#include "doc_versions.hpp"
#include "doc_errors.hpp"
#include "doc_log.hpp"

DocTree VersionStore::get_version(const Document &doc, uint64_t target) const {
  if (target < 1 || target > doc.version) {
    throw VersionError(target, doc.version);
  }
  if (doc.reverse_deltas.size() + 1 != doc.version) {
    throw DocumentParseError("Delta log of " + doc.descriptor() + " has " + std::to_string(doc.reverse_deltas.size()) +
                             " entries for version " + std::to_string(doc.version));
  }
  DocTree result = doc.content;
  // reverse_deltas[i] turns version i+2 into i+1
  for (uint64_t v = doc.version; v > target; --v) {
    doc.reverse_deltas[v - 2].apply(result);
  }
  return result;
}

bool VersionStore::has_dependents(const Document &doc) const {
  if (doc.is_structural()) {
    return true;
  }
  return dependents_.has_dependent(doc, doc.version);
}

uint64_t VersionStore::update_version(Document &doc, const DocTree &new_content) const {
  if (ChangeDetector::compare(doc.content, new_content).is_equal) {
    return doc.version;
  }

  if (has_dependents(doc)) {
    doc.reverse_deltas.push_back(DocPatch::make(new_content, doc.content));
    doc.version += 1;
    DOCTREE_LOG_DEBUG("new version " + std::to_string(doc.version) + " of " + doc.descriptor());
  } else if (doc.version > 1) {
    DocTree previous = get_version(doc, doc.version - 1);
    doc.reverse_deltas.back() = DocPatch::make(new_content, previous);
    DOCTREE_LOG_DEBUG("rewrote version " + std::to_string(doc.version) + " of " + doc.descriptor());
  }
  doc.content = new_content;
  return doc.version;
}

bool VersionStore::can_smash(const Document &doc) const {
  if (doc.version <= 1) {
    return false;
  }
  for (const auto &dependent : dependents_.dependents(doc)) {
    if (dependent.pinned_version != doc.version) {
      return false;
    }
  }
  return true;
}

void VersionStore::smash_version(Document &doc) const {
  if (!can_smash(doc)) {
    throw VersionError(doc.version, doc.version, "Cannot smash version");
  }
  uint64_t old_version = doc.version;
  if (old_version > 2) {
    DocTree target = get_version(doc, old_version - 2);
    doc.reverse_deltas.pop_back();
    doc.reverse_deltas.back() = DocPatch::make(doc.content, target);
  } else {
    doc.reverse_deltas.pop_back();
  }
  doc.version = old_version - 1;
  dependents_.repin(doc, old_version, doc.version);
  DOCTREE_LOG_INFO("smashed " + doc.descriptor() + " to version " + std::to_string(doc.version));
}
