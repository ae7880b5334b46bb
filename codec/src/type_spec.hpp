#ifndef FORTREC_TYPE_SPEC_HPP
#define FORTREC_TYPE_SPEC_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace fortrec {

/* Element kinds understood by the codec. Closed set. */
enum class ElementKind {
  SignedInt,
  UnsignedInt,
  Float,
  Bool,
  FixedBytes,
};

/* Native means "the byte order the file was opened with". */
enum class ByteOrder {
  Native,
  Little,
  Big,
};

/* Unqualified numeric categories: Integer -> i4, Float -> f8. */
enum class TypeCategory {
  Integer,
  Float,
};

/* Caller-side type specification. Resolved into ElementDescriptors by
 * resolve() / resolve_element() in resolver.hpp; never interpreted elsewhere.
 *
 *   Category  -- TypeCategory::Integer or TypeCategory::Float
 *   Code      -- "i4", ">f8", "S3", "int32", "float64", "f8,S1", ...
 *   Explicit  -- kind + byte width (+ optional byte order)
 *   Sequence  -- ordered list of single-element specs (heterogeneous record)
 *   Record    -- ordered list of named fields, each with an element count
 */
struct TypeSpec {
  enum class Form { Category, Code, Explicit, Sequence, Record };
  Form form = Form::Code;

  TypeCategory category = TypeCategory::Integer;
  std::string code;
  ElementKind kind = ElementKind::SignedInt;
  size_t width = 0;
  ByteOrder order = ByteOrder::Native;
  std::vector<TypeSpec> elements;   // Sequence, Record
  std::vector<std::string> names;   // Record; same size as elements
  std::vector<size_t> counts;       // Record; same size as elements

  TypeSpec() = default;
  TypeSpec(const char* type_code);
  TypeSpec(std::string type_code);
  TypeSpec(TypeCategory c);

  static TypeSpec make_category(TypeCategory c);
  static TypeSpec make_code(std::string type_code);
  static TypeSpec make_explicit(ElementKind kind, size_t width, ByteOrder order = ByteOrder::Native);
  static TypeSpec make_sequence(std::vector<TypeSpec> elements);
  static TypeSpec make_record();

  /* Record only: append a named field holding `count` elements of `type`. */
  TypeSpec& add_field(std::string name, TypeSpec type, size_t count = 1);

  bool is_compound() const { return form == Form::Sequence || form == Form::Record; }
};

}  // namespace fortrec

#endif
