// doc_tree.hpp
#ifndef DOC_TREE_HPP
#define DOC_TREE_HPP

#include <cstdint>

// Define this if you want to override the default collection types
// Basically define these before including this header and ensure this define is set before this header is included
// in any other files that include this file
#ifndef DOCTREE_COLLECTIONS_DEFINED
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <map>
#include <set>
#include <vector>

template <typename T> using DocVector = std::vector<T>;

using DocKey = std::string;

template <typename K, typename V, typename Hash = std::hash<K>, typename KeyEqual = std::equal_to<K>>
using DocMap = std::unordered_map<K, V, Hash, KeyEqual>;

template <typename K, typename V, typename Comparator = std::less<K>> using DocSortedMap = std::map<K, V, Comparator>;

template <typename K, typename Hash = std::hash<K>, typename KeyEqual = std::equal_to<K>>
using DocSet = std::unordered_set<K, Hash, KeyEqual>;

template <typename T, typename Comparator = std::less<T>> using DocSortedSet = std::set<T, Comparator>;
#endif

#include <nlohmann/json.hpp>

#include <optional>
#include <ostream>
#include <string>

/// One step of a path into a tree: an object key or a list index.
struct PathStep {
  bool is_index;
  DocKey key;
  size_t index;

  static PathStep of_key(DocKey k) { return PathStep{false, std::move(k), 0}; }
  static PathStep of_index(size_t i) { return PathStep{true, DocKey(), i}; }

  bool operator==(const PathStep &other) const {
    return is_index == other.is_index && (is_index ? index == other.index : key == other.key);
  }
};

/// Location of a node inside a tree. Renders as dotted text, e.g. `aspects.2.label`.
class DocPath {
public:
  DocPath() = default;

  DocPath child(const DocKey &key) const {
    DocPath p(*this);
    p.steps_.push_back(PathStep::of_key(key));
    return p;
  }

  DocPath child(size_t index) const {
    DocPath p(*this);
    p.steps_.push_back(PathStep::of_index(index));
    return p;
  }

  DocPath parent() const {
    DocPath p(*this);
    if (!p.steps_.empty()) {
      p.steps_.pop_back();
    }
    return p;
  }

  bool empty() const { return steps_.empty(); }
  size_t size() const { return steps_.size(); }
  const PathStep &back() const { return steps_.back(); }
  const DocVector<PathStep> &steps() const { return steps_; }

  bool operator==(const DocPath &other) const { return steps_ == other.steps_; }

  std::string to_string() const;

  /// Parses the dotted form. Purely numeric segments become list indices.
  static DocPath parse(const std::string &text);

private:
  DocVector<PathStep> steps_;
};

/// A dynamically typed document tree (the JSON data model).
///
/// Objects keep their keys sorted, so two trees holding the same members compare equal
/// no matter in which order the members were inserted. Lists keep their order.
class DocTree {
public:
  enum Type { NULL_TYPE, BOOLEAN, INTEGER, REAL, TEXT, LIST, OBJECT };

  using List = DocVector<DocTree>;
  using Object = DocSortedMap<DocKey, DocTree>;

  DocTree() : type_(NULL_TYPE), bool_val_(false), int_val_(0), real_val_(0.0) {}
  DocTree(std::nullptr_t) : DocTree() {}
  DocTree(bool b) : DocTree() {
    type_ = BOOLEAN;
    bool_val_ = b;
  }
  DocTree(int i) : DocTree(static_cast<int64_t>(i)) {}
  DocTree(int64_t i) : DocTree() {
    type_ = INTEGER;
    int_val_ = i;
  }
  DocTree(double d) : DocTree() {
    type_ = REAL;
    real_val_ = d;
  }
  DocTree(const char *s) : DocTree(std::string(s)) {}
  DocTree(std::string s) : DocTree() {
    type_ = TEXT;
    text_val_ = std::move(s);
  }
  DocTree(List l) : DocTree() {
    type_ = LIST;
    list_val_ = std::move(l);
  }
  DocTree(Object o) : DocTree() {
    type_ = OBJECT;
    object_val_ = std::move(o);
  }

  static DocTree object() { return DocTree(Object{}); }
  static DocTree list() { return DocTree(List{}); }

  Type type() const { return type_; }
  bool is_null() const { return type_ == NULL_TYPE; }
  bool is_bool() const { return type_ == BOOLEAN; }
  bool is_int() const { return type_ == INTEGER; }
  bool is_real() const { return type_ == REAL; }
  bool is_number() const { return type_ == INTEGER || type_ == REAL; }
  bool is_text() const { return type_ == TEXT; }
  bool is_list() const { return type_ == LIST; }
  bool is_object() const { return type_ == OBJECT; }
  bool is_collection() const { return type_ == LIST || type_ == OBJECT; }

  // Typed accessors throw DocumentParseError on a type mismatch.
  bool as_bool() const;
  int64_t as_int() const;
  double as_real() const;
  const std::string &as_text() const;
  const List &as_list() const;
  List &as_list();
  const Object &as_object() const;
  Object &as_object();

  /// Object member access; turns a null tree into an empty object first.
  DocTree &operator[](const DocKey &key);

  /// Returns the member or nullptr when this is not an object or has no such key.
  const DocTree *find(const DocKey &key) const;
  DocTree *find(const DocKey &key);

  bool contains(const DocKey &key) const { return find(key) != nullptr; }

  /// Text member or std::nullopt.
  std::optional<std::string> text_at(const DocKey &key) const;

  /// Appends to a list; turns a null tree into an empty list first.
  void push_back(DocTree value);

  size_t size() const;

  /// Resolves a path, nullptr when any step is missing.
  const DocTree *at_path(const DocPath &path) const;

  bool operator==(const DocTree &other) const;
  bool operator!=(const DocTree &other) const { return !(*this == other); }

  static const char *type_name(Type type);

  /// Compact JSON text, object keys sorted.
  std::string to_json() const;

  /// Parses JSON text, throws DocumentParseError on malformed input.
  static DocTree from_json(const std::string &text);

private:
  Type type_;
  bool bool_val_;
  int64_t int_val_;
  double real_val_;
  std::string text_val_;
  List list_val_;
  Object object_val_;
};

// nlohmann::json conversions, found by ADL
void to_json(nlohmann::json &j, const DocTree &tree);
void from_json(const nlohmann::json &j, DocTree &tree);

std::ostream &operator<<(std::ostream &os, const DocTree &tree);
std::ostream &operator<<(std::ostream &os, const DocPath &path);

#endif // DOC_TREE_HPP
