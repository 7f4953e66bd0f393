// doc_diff.cpp
#include "doc_diff.hpp"
#include "doc_errors.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>

// ChangeDetector implementation

const DocSortedSet<DocKey> &ChangeDetector::default_ignore_fields() {
  static const DocSortedSet<DocKey> fields = {"uuid", "actors", "template", "tags", "version"};
  return fields;
}

namespace {

DocTree strip_nulls(const DocTree &tree) {
  if (tree.is_object()) {
    DocTree::Object out;
    for (const auto &[key, value] : tree.as_object()) {
      if (!value.is_null()) {
        out.emplace(key, strip_nulls(value));
      }
    }
    return DocTree(std::move(out));
  }
  if (tree.is_list()) {
    DocTree::List out;
    out.reserve(tree.size());
    for (const auto &item : tree.as_list()) {
      out.push_back(strip_nulls(item));
    }
    return DocTree(std::move(out));
  }
  return tree;
}

void diff_into(const DocTree &from, const DocTree &to, const DocPath &path, StructuredDiff &out) {
  if (from.is_object() && to.is_object()) {
    const auto &a = from.as_object();
    const auto &b = to.as_object();
    for (const auto &[key, value] : a) {
      auto it = b.find(key);
      if (it == b.end()) {
        out.push_back(DiffRecord{DiffRecord::ITEM_REMOVED, path.child(key), value, DocTree()});
      } else {
        diff_into(value, it->second, path.child(key), out);
      }
    }
    for (const auto &[key, value] : b) {
      if (a.find(key) == a.end()) {
        out.push_back(DiffRecord{DiffRecord::ITEM_ADDED, path.child(key), DocTree(), value});
      }
    }
    return;
  }

  if (from.is_list() && to.is_list()) {
    const auto &a = from.as_list();
    const auto &b = to.as_list();
    size_t common = std::min(a.size(), b.size());
    for (size_t i = 0; i < common; ++i) {
      diff_into(a[i], b[i], path.child(i), out);
    }
    for (size_t i = common; i < a.size(); ++i) {
      out.push_back(DiffRecord{DiffRecord::ITEM_REMOVED, path.child(i), a[i], DocTree()});
    }
    for (size_t i = common; i < b.size(); ++i) {
      out.push_back(DiffRecord{DiffRecord::ITEM_ADDED, path.child(i), DocTree(), b[i]});
    }
    return;
  }

  if (from != to) {
    out.push_back(DiffRecord{DiffRecord::VALUE_CHANGED, path, from, to});
  }
}

} // namespace

DocTree ChangeDetector::project(const DocTree &tree, const DocSortedSet<DocKey> &ignore_fields) {
  if (!tree.is_object()) {
    return strip_nulls(tree);
  }
  DocTree::Object out;
  for (const auto &[key, value] : tree.as_object()) {
    if (ignore_fields.count(key) || value.is_null()) {
      continue;
    }
    out.emplace(key, strip_nulls(value));
  }
  return DocTree(std::move(out));
}

StructuredDiff ChangeDetector::diff(const DocTree &from, const DocTree &to) {
  StructuredDiff out;
  diff_into(from, to, DocPath(), out);
  return out;
}

CompareResult ChangeDetector::compare(const DocTree &persisted, const DocTree &incoming,
                                      const DocSortedSet<DocKey> &ignore_fields) {
  CompareResult result;
  result.diff = diff(project(persisted, ignore_fields), project(incoming, ignore_fields));
  result.is_equal = result.diff.empty();
  return result;
}

// DocPatch implementation

DocPatch DocPatch::make(const DocTree &from, const DocTree &to) {
  DocPatch patch;
  for (auto &record : ChangeDetector::diff(from, to)) {
    bool index_step = !record.path.empty() && record.path.back().is_index;
    switch (record.kind) {
    case DiffRecord::VALUE_CHANGED:
      patch.ops_.push_back(Op{Op::SET, record.path, std::move(record.new_value), 0});
      break;
    case DiffRecord::ITEM_ADDED:
      if (index_step) {
        patch.ops_.push_back(Op{Op::APPEND, record.path.parent(), std::move(record.new_value), 0});
      } else {
        patch.ops_.push_back(Op{Op::SET, record.path, std::move(record.new_value), 0});
      }
      break;
    case DiffRecord::ITEM_REMOVED:
      if (index_step) {
        // removed items are reported in ascending order; the first one is the new length
        DocPath list_path = record.path.parent();
        if (patch.ops_.empty() || patch.ops_.back().kind != Op::TRUNCATE || !(patch.ops_.back().path == list_path)) {
          patch.ops_.push_back(Op{Op::TRUNCATE, list_path, DocTree(), record.path.back().index});
        }
      } else {
        patch.ops_.push_back(Op{Op::REMOVE, record.path, DocTree(), 0});
      }
      break;
    }
  }
  return patch;
}

namespace {

DocTree &resolve_mutable(DocTree &root, const DocPath &path) {
  DocTree *node = &root;
  for (const auto &step : path.steps()) {
    if (step.is_index) {
      if (!node->is_list() || step.index >= node->size()) {
        throw DocumentParseError("Patch path does not exist: " + path.to_string());
      }
      node = &node->as_list()[step.index];
    } else {
      node = node->find(step.key);
      if (node == nullptr) {
        throw DocumentParseError("Patch path does not exist: " + path.to_string());
      }
    }
  }
  return *node;
}

const char *op_name(DocPatch::Op::Kind kind) {
  switch (kind) {
  case DocPatch::Op::SET:
    return "set";
  case DocPatch::Op::REMOVE:
    return "remove";
  case DocPatch::Op::TRUNCATE:
    return "truncate";
  case DocPatch::Op::APPEND:
    return "append";
  }
  return "unknown";
}

DocPatch::Op::Kind op_from_name(const std::string &name) {
  if (name == "set")
    return DocPatch::Op::SET;
  if (name == "remove")
    return DocPatch::Op::REMOVE;
  if (name == "truncate")
    return DocPatch::Op::TRUNCATE;
  if (name == "append")
    return DocPatch::Op::APPEND;
  throw DocumentParseError("Unknown patch operation: " + name);
}

nlohmann::json path_to_json(const DocPath &path) {
  nlohmann::json steps = nlohmann::json::array();
  for (const auto &step : path.steps()) {
    if (step.is_index) {
      steps.push_back(step.index);
    } else {
      steps.push_back(step.key);
    }
  }
  return steps;
}

DocPath path_from_json(const nlohmann::json &steps) {
  DocPath path;
  for (const auto &step : steps) {
    if (step.is_number_unsigned()) {
      path = path.child(step.get<size_t>());
    } else if (step.is_string()) {
      path = path.child(step.get<std::string>());
    } else {
      throw DocumentParseError("Invalid patch path step: " + step.dump());
    }
  }
  return path;
}

} // namespace

void DocPatch::apply(DocTree &tree) const {
  for (const auto &op : ops_) {
    switch (op.kind) {
    case Op::SET: {
      if (op.path.empty()) {
        tree = op.value;
        break;
      }
      DocTree &parent = resolve_mutable(tree, op.path.parent());
      const PathStep &last = op.path.back();
      if (last.is_index) {
        if (!parent.is_list() || last.index >= parent.size()) {
          throw DocumentParseError("Patch index out of range: " + op.path.to_string());
        }
        parent.as_list()[last.index] = op.value;
      } else {
        parent.as_object()[last.key] = op.value;
      }
      break;
    }
    case Op::REMOVE: {
      if (op.path.empty() || op.path.back().is_index) {
        throw DocumentParseError("Invalid remove path: " + op.path.to_string());
      }
      DocTree &parent = resolve_mutable(tree, op.path.parent());
      if (parent.as_object().erase(op.path.back().key) == 0) {
        throw DocumentParseError("Patch path does not exist: " + op.path.to_string());
      }
      break;
    }
    case Op::TRUNCATE: {
      auto &list = resolve_mutable(tree, op.path).as_list();
      if (list.size() > op.length) {
        list.erase(list.begin() + static_cast<std::ptrdiff_t>(op.length), list.end());
      }
      break;
    }
    case Op::APPEND:
      resolve_mutable(tree, op.path).as_list().push_back(op.value);
      break;
    }
  }
}

std::string DocPatch::to_string() const {
  nlohmann::json ops = nlohmann::json::array();
  for (const auto &op : ops_) {
    nlohmann::json entry = {{"op", op_name(op.kind)}, {"path", path_to_json(op.path)}};
    if (op.kind == Op::SET || op.kind == Op::APPEND) {
      entry["value"] = op.value;
    } else if (op.kind == Op::TRUNCATE) {
      entry["length"] = op.length;
    }
    ops.push_back(std::move(entry));
  }
  return ops.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

DocPatch DocPatch::from_string(const std::string &text) {
  DocPatch patch;
  try {
    nlohmann::json parsed = nlohmann::json::parse(text);
    if (!parsed.is_array()) {
      throw DocumentParseError("Patch text is not a list of operations");
    }
    for (const auto &entry : parsed) {
      if (!entry.is_object() || !entry.contains("op") || !entry.contains("path")) {
        throw DocumentParseError("Patch operation without op or path");
      }
      Op op{op_from_name(entry.at("op").get<std::string>()), path_from_json(entry.at("path")), DocTree(), 0};
      if (entry.contains("value")) {
        op.value = entry.at("value").get<DocTree>();
      }
      if (entry.contains("length")) {
        op.length = entry.at("length").get<size_t>();
      }
      patch.ops_.push_back(std::move(op));
    }
  } catch (const nlohmann::json::exception &e) {
    throw DocumentParseError(std::string("Invalid patch text: ") + e.what());
  }
  return patch;
}
