// doc_aspect.hpp
#ifndef DOC_ASPECT_HPP
#define DOC_ASPECT_HPP

#include "doc_document.hpp"
#include "doc_tree.hpp"

#include <memory>
#include <optional>
#include <string>
#include <variant>

/// How unknown keys in an aspect object are treated.
enum class ParseMode { Strict, Permissive };

struct AspectNode;

struct ScalarAspect {
  enum Kind { STR, INT, FLOAT };
  Kind kind;
};

struct SelectionAspect {
  enum Kind { SELECT, MULTISELECT, TREE, TREEMULTISELECT };
  Kind kind;
  // slug of a code document, or the inline item list / tree
  std::variant<std::string, DocTree> items;

  const std::string *code_slug() const { return std::get_if<std::string>(&items); }
};

struct ListAspect {
  std::shared_ptr<const AspectNode> item;
};

struct CompositeAspect {
  DocVector<AspectNode> components;
};

using AspectBody = std::variant<ScalarAspect, SelectionAspect, ListAspect, CompositeAspect>;

struct AspectNode {
  std::string name;
  std::string type; // type string as written in the document
  std::optional<std::string> label;
  std::optional<std::string> description;
  DocTree attr; // free-form attributes, null when absent
  AspectBody body;

  /// `attr.tag` when set: the selection is a tag reference with that group name.
  std::optional<std::string> tag() const { return attr.text_at("tag"); }
};

/// Parses the `aspects` list of a document. A missing list yields no aspects.
/// Throws DocumentParseError for an unknown type, a selection without items,
/// a list without list_items, a composite without components, and in Strict
/// mode for unknown keys.
DocVector<AspectNode> parse_aspects(const DocTree &document, ParseMode mode);

AspectNode parse_aspect(const DocTree &tree, ParseMode mode, const std::string &location = "aspect");

/// Every reference to another document reachable through the aspects.
DocVector<Reference> extract_references(const DocVector<AspectNode> &aspects);

#endif // DOC_ASPECT_HPP
