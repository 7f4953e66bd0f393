// doc_merge.cpp
#include "doc_merge.hpp"

#include <algorithm>

namespace {

DocTree merge_at(const DocTree &base, const DocTree &overlay, bool strict, const DocPath &path) {
  if (overlay.is_null()) {
    return base;
  }
  if (base.is_null()) {
    return overlay;
  }

  if (base.is_object() && overlay.is_object()) {
    DocTree result = base;
    auto &members = result.as_object();
    for (const auto &[key, value] : overlay.as_object()) {
      auto it = members.find(key);
      if (it == members.end()) {
        members.emplace(key, value);
      } else {
        it->second = merge_at(it->second, value, strict, path.child(key));
      }
    }
    return result;
  }

  if (base.is_list() && overlay.is_list()) {
    const auto &a = base.as_list();
    const auto &b = overlay.as_list();
    if (strict && a.size() != b.size()) {
      size_t first_unmatched = std::min(a.size(), b.size());
      throw MergeError(MergeError::STRUCTURAL_MISMATCH, path.child(first_unmatched).to_string(),
                       "base has " + std::to_string(a.size()) + " items, overlay has " + std::to_string(b.size()));
    }
    DocTree::List items;
    items.reserve(std::max(a.size(), b.size()));
    for (size_t i = 0; i < std::max(a.size(), b.size()); ++i) {
      if (i >= b.size()) {
        items.push_back(a[i]);
      } else if (i >= a.size()) {
        items.push_back(b[i]);
      } else {
        items.push_back(merge_at(a[i], b[i], strict, path.child(i)));
      }
    }
    return DocTree(std::move(items));
  }

  if (base.is_collection() || overlay.is_collection()) {
    if (strict) {
      throw MergeError(MergeError::TYPE_CONFLICT, path.to_string(),
                       std::string("cannot merge ") + DocTree::type_name(overlay.type()) + " into " +
                           DocTree::type_name(base.type()));
    }
    return overlay;
  }

  return overlay;
}

} // namespace

DocTree MergeEngine::merge(const DocTree &base, const DocTree &overlay, bool strict) {
  return merge_at(base, overlay, strict, DocPath());
}

DocVector<AspectMergeResult> MergeEngine::merge_aspects_one_by_one(const DocTree &base, const DocTree &overlay,
                                                                   bool strict) {
  static const DocTree::List no_aspects;
  const DocTree *base_aspects = base.find("aspects");
  const DocTree *overlay_aspects = overlay.find("aspects");
  const auto &a = (base_aspects && base_aspects->is_list()) ? base_aspects->as_list() : no_aspects;
  const auto &b = (overlay_aspects && overlay_aspects->is_list()) ? overlay_aspects->as_list() : no_aspects;

  DocPath root = DocPath().child("aspects");
  DocVector<AspectMergeResult> results;
  for (size_t i = 0; i < std::max(a.size(), b.size()); ++i) {
    AspectMergeResult result{i, "", std::nullopt, std::nullopt, std::nullopt};
    if (i < a.size()) {
      result.base_name = a[i].text_at("name").value_or("");
    }
    if (i < b.size()) {
      result.overlay_label = b[i].text_at("label");
    }

    if (i >= b.size()) {
      result.error = MergeError(MergeError::STRUCTURAL_MISMATCH, root.child(i).to_string(),
                                "overlay has no aspect at this index");
    } else if (i >= a.size()) {
      result.error = MergeError(MergeError::STRUCTURAL_MISMATCH, root.child(i).to_string(),
                                "base has no aspect at this index");
    } else {
      try {
        result.merged = merge_at(a[i], b[i], strict, root.child(i));
      } catch (const MergeError &e) {
        result.error = e;
      }
    }
    results.push_back(std::move(result));
  }
  return results;
}

std::string MergeEngine::describe_failures(const DocVector<AspectMergeResult> &results) {
  std::string out;
  for (const auto &result : results) {
    if (result.ok()) {
      continue;
    }
    if (!out.empty()) {
      out += "\n";
    }
    out += "aspect " + std::to_string(result.index) + " (base: '" + result.base_name + "', overlay: '" +
           result.overlay_label.value_or("") + "'): " + result.error->what();
  }
  return out;
}
