// doc_tree.cpp
#include "doc_tree.hpp"
#include "doc_errors.hpp"

#include <limits>

// DocPath implementation

std::string DocPath::to_string() const {
  std::string out;
  for (const auto &step : steps_) {
    if (!out.empty()) {
      out += '.';
    }
    if (step.is_index) {
      out += std::to_string(step.index);
    } else {
      out += step.key;
    }
  }
  return out;
}

DocPath DocPath::parse(const std::string &text) {
  DocPath path;
  if (text.empty()) {
    return path;
  }
  size_t start = 0;
  while (start <= text.size()) {
    size_t dot = text.find('.', start);
    if (dot == std::string::npos) {
      dot = text.size();
    }
    std::string segment = text.substr(start, dot - start);
    bool numeric = !segment.empty();
    for (char c : segment) {
      if (c < '0' || c > '9') {
        numeric = false;
        break;
      }
    }
    if (numeric) {
      path.steps_.push_back(PathStep::of_index(std::stoull(segment)));
    } else {
      path.steps_.push_back(PathStep::of_key(segment));
    }
    start = dot + 1;
  }
  return path;
}

// DocTree implementation

namespace {

[[noreturn]] void type_mismatch(DocTree::Type expected, DocTree::Type actual) {
  throw DocumentParseError(std::string("Expected ") + DocTree::type_name(expected) + " but found " +
                           DocTree::type_name(actual));
}

} // namespace

const char *DocTree::type_name(Type type) {
  switch (type) {
  case NULL_TYPE:
    return "null";
  case BOOLEAN:
    return "boolean";
  case INTEGER:
    return "integer";
  case REAL:
    return "real";
  case TEXT:
    return "text";
  case LIST:
    return "list";
  case OBJECT:
    return "object";
  }
  return "unknown";
}

bool DocTree::as_bool() const {
  if (type_ != BOOLEAN) {
    type_mismatch(BOOLEAN, type_);
  }
  return bool_val_;
}

int64_t DocTree::as_int() const {
  if (type_ != INTEGER) {
    type_mismatch(INTEGER, type_);
  }
  return int_val_;
}

double DocTree::as_real() const {
  if (type_ == INTEGER) {
    return static_cast<double>(int_val_);
  }
  if (type_ != REAL) {
    type_mismatch(REAL, type_);
  }
  return real_val_;
}

const std::string &DocTree::as_text() const {
  if (type_ != TEXT) {
    type_mismatch(TEXT, type_);
  }
  return text_val_;
}

const DocTree::List &DocTree::as_list() const {
  if (type_ != LIST) {
    type_mismatch(LIST, type_);
  }
  return list_val_;
}

DocTree::List &DocTree::as_list() {
  if (type_ != LIST) {
    type_mismatch(LIST, type_);
  }
  return list_val_;
}

const DocTree::Object &DocTree::as_object() const {
  if (type_ != OBJECT) {
    type_mismatch(OBJECT, type_);
  }
  return object_val_;
}

DocTree::Object &DocTree::as_object() {
  if (type_ != OBJECT) {
    type_mismatch(OBJECT, type_);
  }
  return object_val_;
}

DocTree &DocTree::operator[](const DocKey &key) {
  if (type_ == NULL_TYPE) {
    type_ = OBJECT;
  }
  return as_object()[key];
}

const DocTree *DocTree::find(const DocKey &key) const {
  if (type_ != OBJECT) {
    return nullptr;
  }
  auto it = object_val_.find(key);
  return it == object_val_.end() ? nullptr : &it->second;
}

DocTree *DocTree::find(const DocKey &key) {
  if (type_ != OBJECT) {
    return nullptr;
  }
  auto it = object_val_.find(key);
  return it == object_val_.end() ? nullptr : &it->second;
}

std::optional<std::string> DocTree::text_at(const DocKey &key) const {
  const DocTree *member = find(key);
  if (member == nullptr || !member->is_text()) {
    return std::nullopt;
  }
  return member->text_val_;
}

void DocTree::push_back(DocTree value) {
  if (type_ == NULL_TYPE) {
    type_ = LIST;
  }
  as_list().push_back(std::move(value));
}

size_t DocTree::size() const {
  switch (type_) {
  case LIST:
    return list_val_.size();
  case OBJECT:
    return object_val_.size();
  case NULL_TYPE:
  case BOOLEAN:
  case INTEGER:
  case REAL:
  case TEXT:
    return 0;
  }
  return 0;
}

const DocTree *DocTree::at_path(const DocPath &path) const {
  const DocTree *node = this;
  for (const auto &step : path.steps()) {
    if (step.is_index) {
      if (!node->is_list() || step.index >= node->list_val_.size()) {
        return nullptr;
      }
      node = &node->list_val_[step.index];
    } else {
      node = node->find(step.key);
      if (node == nullptr) {
        return nullptr;
      }
    }
  }
  return node;
}

bool DocTree::operator==(const DocTree &other) const {
  if (type_ != other.type_) {
    return false;
  }
  switch (type_) {
  case NULL_TYPE:
    return true;
  case BOOLEAN:
    return bool_val_ == other.bool_val_;
  case INTEGER:
    return int_val_ == other.int_val_;
  case REAL:
    return real_val_ == other.real_val_;
  case TEXT:
    return text_val_ == other.text_val_;
  case LIST:
    return list_val_ == other.list_val_;
  case OBJECT:
    return object_val_ == other.object_val_;
  }
  return false;
}

// JSON text goes through nlohmann::json

void to_json(nlohmann::json &j, const DocTree &tree) {
  switch (tree.type()) {
  case DocTree::NULL_TYPE:
    j = nullptr;
    break;
  case DocTree::BOOLEAN:
    j = tree.as_bool();
    break;
  case DocTree::INTEGER:
    j = tree.as_int();
    break;
  case DocTree::REAL:
    // non-finite reals are written as null
    j = tree.as_real();
    break;
  case DocTree::TEXT:
    j = tree.as_text();
    break;
  case DocTree::LIST:
    j = nlohmann::json::array();
    for (const auto &item : tree.as_list()) {
      j.push_back(item);
    }
    break;
  case DocTree::OBJECT:
    j = nlohmann::json::object();
    for (const auto &[key, value] : tree.as_object()) {
      j[key] = value;
    }
    break;
  }
}

void from_json(const nlohmann::json &j, DocTree &tree) {
  switch (j.type()) {
  case nlohmann::json::value_t::null:
  case nlohmann::json::value_t::discarded:
    tree = DocTree();
    break;
  case nlohmann::json::value_t::boolean:
    tree = DocTree(j.get<bool>());
    break;
  case nlohmann::json::value_t::number_integer:
    tree = DocTree(j.get<int64_t>());
    break;
  case nlohmann::json::value_t::number_unsigned: {
    uint64_t value = j.get<uint64_t>();
    // out of int64 range, keep it as a real
    if (value > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
      tree = DocTree(static_cast<double>(value));
    } else {
      tree = DocTree(static_cast<int64_t>(value));
    }
    break;
  }
  case nlohmann::json::value_t::number_float:
    tree = DocTree(j.get<double>());
    break;
  case nlohmann::json::value_t::string:
    tree = DocTree(j.get<std::string>());
    break;
  case nlohmann::json::value_t::array: {
    DocTree::List items;
    items.reserve(j.size());
    for (const auto &item : j) {
      items.push_back(item.get<DocTree>());
    }
    tree = DocTree(std::move(items));
    break;
  }
  case nlohmann::json::value_t::object: {
    DocTree::Object members;
    for (auto it = j.begin(); it != j.end(); ++it) {
      members[it.key()] = it.value().get<DocTree>();
    }
    tree = DocTree(std::move(members));
    break;
  }
  case nlohmann::json::value_t::binary:
    throw DocumentParseError("Binary JSON values are not supported");
  }
}

std::string DocTree::to_json() const {
  nlohmann::json j = *this;
  return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

DocTree DocTree::from_json(const std::string &text) {
  try {
    return nlohmann::json::parse(text).get<DocTree>();
  } catch (const nlohmann::json::parse_error &e) {
    throw DocumentParseError(std::string("Invalid JSON: ") + e.what());
  }
}

std::ostream &operator<<(std::ostream &os, const DocTree &tree) { return os << tree.to_json(); }

std::ostream &operator<<(std::ostream &os, const DocPath &path) { return os << path.to_string(); }
