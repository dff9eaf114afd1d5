#include <weft/abi/sig.hpp>

#include <algorithm>
#include <iterator>
#include <tuple>

namespace weft::abi {

// ---------------------------------------------------------------------------
// AnnotationValue / AnnotationSig
// ---------------------------------------------------------------------------

AnnotationValue AnnotationValue::constant(char tag, std::string text) {
    AnnotationValue v;
    v.kind = ValueKind::Const;
    v.tag = tag;
    v.text = std::move(text);
    return v;
}

AnnotationValue AnnotationValue::enum_constant(std::string type_desc, std::string name) {
    AnnotationValue v;
    v.kind = ValueKind::Enum;
    v.tag = 'e';
    v.enum_type = std::move(type_desc);
    v.text = std::move(name);
    return v;
}

AnnotationValue AnnotationValue::class_literal(std::string desc) {
    AnnotationValue v;
    v.kind = ValueKind::Class;
    v.tag = 'c';
    v.text = std::move(desc);
    return v;
}

AnnotationValue AnnotationValue::annotation(AnnotationSig sig) {
    AnnotationValue v;
    v.kind = ValueKind::Annotation;
    v.tag = '@';
    v.nested = std::make_shared<const AnnotationSig>(std::move(sig));
    return v;
}

AnnotationValue AnnotationValue::array(std::vector<AnnotationValue> elements) {
    AnnotationValue v;
    v.kind = ValueKind::Array;
    v.tag = '[';
    v.elements = std::move(elements);
    return v;
}

bool AnnotationValue::operator==(const AnnotationValue& o) const {
    if (kind != o.kind || tag != o.tag || text != o.text || enum_type != o.enum_type)
        return false;
    if (elements != o.elements) return false;
    if (!nested || !o.nested) return !nested && !o.nested;
    return *nested == *o.nested;
}

Status AnnotationSig::put(const std::string& name, AnnotationValue value) {
    auto [it, inserted] = values.emplace(name, std::move(value));
    if (!inserted) {
        return WeftError(WeftError::Duplicate,
            "annotation " + desc + " sets element '" + name + "' twice");
    }
    return ok_status();
}

bool AnnotationSig::operator==(const AnnotationSig& o) const {
    return desc == o.desc && visible == o.visible && values == o.values;
}

// ---------------------------------------------------------------------------
// Members
// ---------------------------------------------------------------------------

FieldSig::FieldSig(int acc, std::string n, std::string d, std::optional<std::string> sig)
    : access(acc), name(std::move(n)), desc(std::move(d)), signature(std::move(sig)) {}

AnnotationSig& FieldSig::add_annotation(std::string annotation_desc, bool visible) {
    annotations.emplace_back(std::move(annotation_desc), visible);
    return annotations.back();
}

bool FieldSig::operator<(const FieldSig& o) const {
    const std::string& sig = signature ? *signature : std::string();
    const std::string& osig = o.signature ? *o.signature : std::string();
    return std::tie(access, name, desc, sig) < std::tie(o.access, o.name, o.desc, osig);
}

MethodSig::MethodSig(int acc, std::string n, std::string d,
                     std::optional<std::string> sig,
                     const std::vector<std::string>& thrown)
    : access(acc), name(std::move(n)), desc(std::move(d)), signature(std::move(sig)),
      exceptions(thrown.begin(), thrown.end()) {}

AnnotationSig& MethodSig::add_annotation(std::string annotation_desc, bool visible) {
    annotations.emplace_back(std::move(annotation_desc), visible);
    return annotations.back();
}

bool MethodSig::operator<(const MethodSig& o) const {
    const std::string& sig = signature ? *signature : std::string();
    const std::string& osig = o.signature ? *o.signature : std::string();
    // std::set iterates in natural order, so comparing the sets compares
    // the sorted exception lists lexicographically.
    return std::tie(access, name, desc, sig, exceptions)
         < std::tie(o.access, o.name, o.desc, osig, o.exceptions);
}

// ---------------------------------------------------------------------------
// ClassSig
// ---------------------------------------------------------------------------

const FieldSig* ClassSig::find_field(const std::string& name, const std::string& desc) const {
    for (const auto& f : fields_) {
        if (f.name == name && f.desc == desc) return &f;
    }
    return nullptr;
}

const MethodSig* ClassSig::find_method(const std::string& name, const std::string& desc) const {
    for (const auto& m : methods_) {
        if (m.name == name && m.desc == desc) return &m;
    }
    return nullptr;
}

ClassSig ClassSig::retain(const std::function<bool(const FieldSig&)>& keep_field,
                          const std::function<bool(const MethodSig&)>& keep_method) const {
    ClassSig out;
    out.access_ = access_;
    out.name_ = name_;
    out.super_name_ = super_name_;
    out.signature_ = signature_;
    out.interfaces_ = interfaces_;
    out.annotations_ = annotations_;
    std::copy_if(fields_.begin(), fields_.end(), std::back_inserter(out.fields_), keep_field);
    std::copy_if(methods_.begin(), methods_.end(), std::back_inserter(out.methods_), keep_method);
    return out;
}

// ---------------------------------------------------------------------------
// ClassSigBuilder
// ---------------------------------------------------------------------------

ClassSigBuilder::ClassSigBuilder(int access, std::string name,
                                 std::optional<std::string> super_name,
                                 std::optional<std::string> signature,
                                 const std::vector<std::string>& interfaces) {
    sig_.access_ = access;
    sig_.name_ = std::move(name);
    sig_.super_name_ = std::move(super_name);
    sig_.signature_ = std::move(signature);
    sig_.interfaces_.insert(interfaces.begin(), interfaces.end());
}

Result<FieldSig*> ClassSigBuilder::add_field(FieldSig field) {
    Key key{field.name, field.desc};
    auto [it, inserted] = fields_.emplace(std::move(key), std::move(field));
    if (!inserted) {
        return WeftError(WeftError::Duplicate,
            "duplicate field " + it->first.first + " " + it->first.second
            + " in " + sig_.name_);
    }
    return Result<FieldSig*>::ok(&it->second);
}

Result<MethodSig*> ClassSigBuilder::add_method(MethodSig method) {
    Key key{method.name, method.desc};
    auto [it, inserted] = methods_.emplace(std::move(key), std::move(method));
    if (!inserted) {
        return WeftError(WeftError::Duplicate,
            "duplicate method " + it->first.first + it->first.second
            + " in " + sig_.name_);
    }
    return Result<MethodSig*>::ok(&it->second);
}

AnnotationSig& ClassSigBuilder::add_annotation(std::string desc, bool visible) {
    sig_.annotations_.emplace_back(std::move(desc), visible);
    return sig_.annotations_.back();
}

void ClassSigBuilder::set_signature(std::optional<std::string> signature) {
    sig_.signature_ = std::move(signature);
}

ClassSig ClassSigBuilder::build() && {
    ClassSig out = std::move(sig_);
    out.fields_.reserve(fields_.size());
    for (auto& [key, f] : fields_) out.fields_.push_back(std::move(f));
    out.methods_.reserve(methods_.size());
    for (auto& [key, m] : methods_) out.methods_.push_back(std::move(m));
    std::sort(out.fields_.begin(), out.fields_.end());
    std::sort(out.methods_.begin(), out.methods_.end());
    fields_.clear();
    methods_.clear();
    return out;
}

} // namespace weft::abi
