#pragma once

#include <weft/result.hpp>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace weft::abi {

// ---------------------------------------------------------------------------
// Class-file access flags (JVMS 4.1, 4.5, 4.6)
// ---------------------------------------------------------------------------

namespace acc {
constexpr int Public     = 0x0001;
constexpr int Private    = 0x0002;
constexpr int Protected  = 0x0004;
constexpr int Static     = 0x0008;
constexpr int Final      = 0x0010;
constexpr int Super      = 0x0020;  // classes
constexpr int Volatile   = 0x0040;  // fields
constexpr int Bridge     = 0x0040;  // methods
constexpr int Transient  = 0x0080;  // fields
constexpr int Varargs    = 0x0080;  // methods
constexpr int Native     = 0x0100;
constexpr int Interface  = 0x0200;
constexpr int Abstract   = 0x0400;
constexpr int Strict     = 0x0800;
constexpr int Synthetic  = 0x1000;
constexpr int Annotation = 0x2000;
constexpr int Enum       = 0x4000;
constexpr int Module     = 0x8000;
} // namespace acc

// ---------------------------------------------------------------------------
// Annotations
// ---------------------------------------------------------------------------

struct AnnotationSig;

enum class ValueKind {
    Const,       // primitive or string literal
    Enum,        // enum constant, by owner type + name
    Class,       // class literal
    Annotation,  // nested annotation
    Array
};

struct AnnotationValue {
    ValueKind kind = ValueKind::Const;
    char tag = 0;                  // element_value tag (B C D F I J S Z s e c @ [)
    std::string text;              // literal / enum constant name / class descriptor
    std::string enum_type;         // Enum only
    std::vector<AnnotationValue> elements;          // Array only
    std::shared_ptr<const AnnotationSig> nested;    // Annotation only

    static AnnotationValue constant(char tag, std::string text);
    static AnnotationValue enum_constant(std::string type_desc, std::string name);
    static AnnotationValue class_literal(std::string desc);
    static AnnotationValue annotation(AnnotationSig sig);
    static AnnotationValue array(std::vector<AnnotationValue> elements);

    bool operator==(const AnnotationValue& o) const;
    bool operator!=(const AnnotationValue& o) const { return !(*this == o); }
};

struct AnnotationSig {
    std::string desc;
    bool visible = true;  // RuntimeVisible vs RuntimeInvisible
    std::map<std::string, AnnotationValue> values;

    AnnotationSig() = default;
    AnnotationSig(std::string d, bool vis) : desc(std::move(d)), visible(vis) {}

    // Fails with Duplicate if the element name was already set
    Status put(const std::string& name, AnnotationValue value);

    bool operator==(const AnnotationSig& o) const;
    bool operator!=(const AnnotationSig& o) const { return !(*this == o); }
};

// ---------------------------------------------------------------------------
// Members
// ---------------------------------------------------------------------------

struct FieldSig {
    int access = 0;
    std::string name;
    std::string desc;
    std::optional<std::string> signature;
    std::optional<std::string> constant_value;  // ConstantValue attribute, rendered
    std::vector<AnnotationSig> annotations;     // declaration order

    FieldSig() = default;
    FieldSig(int acc, std::string n, std::string d,
             std::optional<std::string> sig = std::nullopt);

    AnnotationSig& add_annotation(std::string annotation_desc, bool visible);

    // Deterministic emission order: (access, name, desc, signature)
    bool operator<(const FieldSig& o) const;
};

struct MethodSig {
    int access = 0;
    std::string name;
    std::string desc;
    std::optional<std::string> signature;
    std::set<std::string> exceptions;
    std::vector<AnnotationSig> annotations;  // declaration order matters

    MethodSig() = default;
    MethodSig(int acc, std::string n, std::string d,
              std::optional<std::string> sig = std::nullopt,
              const std::vector<std::string>& thrown = {});

    AnnotationSig& add_annotation(std::string annotation_desc, bool visible);

    bool is_bridge() const { return (access & acc::Bridge) != 0; }
    bool is_synthetic() const { return (access & acc::Synthetic) != 0; }

    // Deterministic emission order: (access, name, desc, signature, exceptions)
    bool operator<(const MethodSig& o) const;
};

// ---------------------------------------------------------------------------
// ClassSig: immutable once built
// ---------------------------------------------------------------------------

class ClassSig {
public:
    int access() const { return access_; }
    const std::string& name() const { return name_; }
    const std::optional<std::string>& super_name() const { return super_name_; }
    const std::optional<std::string>& signature() const { return signature_; }
    const std::set<std::string>& interfaces() const { return interfaces_; }

    // Sorted by the member ordering relation
    const std::vector<FieldSig>& fields() const { return fields_; }
    const std::vector<MethodSig>& methods() const { return methods_; }

    // Discovery order; canonical form treats these as a set
    const std::vector<AnnotationSig>& annotations() const { return annotations_; }

    const FieldSig* find_field(const std::string& name, const std::string& desc) const;
    const MethodSig* find_method(const std::string& name, const std::string& desc) const;

    // Copy with only the members accepted by the predicates
    ClassSig retain(const std::function<bool(const FieldSig&)>& keep_field,
                    const std::function<bool(const MethodSig&)>& keep_method) const;

private:
    friend class ClassSigBuilder;
    ClassSig() = default;

    int access_ = 0;
    std::string name_;
    std::optional<std::string> super_name_;
    std::optional<std::string> signature_;
    std::set<std::string> interfaces_;
    std::vector<FieldSig> fields_;
    std::vector<MethodSig> methods_;
    std::vector<AnnotationSig> annotations_;
};

// Mutable accumulator used while a class file is being read. Members are
// keyed by (name, desc); build() sorts them and freezes the result.
class ClassSigBuilder {
public:
    ClassSigBuilder(int access, std::string name,
                    std::optional<std::string> super_name,
                    std::optional<std::string> signature,
                    const std::vector<std::string>& interfaces);

    Result<FieldSig*> add_field(FieldSig field);
    Result<MethodSig*> add_method(MethodSig method);
    AnnotationSig& add_annotation(std::string desc, bool visible);

    // The class Signature attribute follows the member tables
    void set_signature(std::optional<std::string> signature);

    size_t field_count() const { return fields_.size(); }
    size_t method_count() const { return methods_.size(); }

    ClassSig build() &&;

private:
    using Key = std::pair<std::string, std::string>;

    ClassSig sig_;
    std::map<Key, FieldSig> fields_;
    std::map<Key, MethodSig> methods_;
};

} // namespace weft::abi
