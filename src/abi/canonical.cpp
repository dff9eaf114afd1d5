#include <weft/abi/canonical.hpp>

#include <algorithm>

namespace weft::abi {

static const char MAGIC[] = "WABI";
static constexpr size_t MAGIC_LEN = 4;

namespace ser {

static void write_varint(std::vector<uint8_t>& buf, uint64_t val) {
    while (val >= 0x80) {
        buf.push_back(static_cast<uint8_t>(val & 0x7F) | 0x80);
        val >>= 7;
    }
    buf.push_back(static_cast<uint8_t>(val));
}

static void write_string(std::vector<uint8_t>& buf, const std::string& s) {
    write_varint(buf, s.size());
    buf.insert(buf.end(), s.begin(), s.end());
}

static void write_optional(std::vector<uint8_t>& buf, const std::optional<std::string>& s) {
    buf.push_back(s ? 1 : 0);
    if (s) write_string(buf, *s);
}

static void write_blob(std::vector<uint8_t>& buf, const std::vector<uint8_t>& blob) {
    write_varint(buf, blob.size());
    buf.insert(buf.end(), blob.begin(), blob.end());
}

// Access flags are 16-bit; zig-zag is unnecessary
static void write_access(std::vector<uint8_t>& buf, int access) {
    write_varint(buf, static_cast<uint32_t>(access) & 0xFFFF);
}

} // namespace ser

static void write_annotation(std::vector<uint8_t>& buf, const AnnotationSig& a);

static void write_value(std::vector<uint8_t>& buf, const AnnotationValue& v) {
    buf.push_back(static_cast<uint8_t>(v.kind));
    switch (v.kind) {
        case ValueKind::Const:
            buf.push_back(static_cast<uint8_t>(v.tag));
            ser::write_string(buf, v.text);
            break;
        case ValueKind::Enum:
            ser::write_string(buf, v.enum_type);
            ser::write_string(buf, v.text);
            break;
        case ValueKind::Class:
            ser::write_string(buf, v.text);
            break;
        case ValueKind::Annotation:
            write_annotation(buf, *v.nested);
            break;
        case ValueKind::Array:
            // Element order is part of the value
            ser::write_varint(buf, v.elements.size());
            for (const auto& e : v.elements) write_value(buf, e);
            break;
    }
}

static void write_annotation(std::vector<uint8_t>& buf, const AnnotationSig& a) {
    ser::write_string(buf, a.desc);
    buf.push_back(a.visible ? 1 : 0);
    // std::map keeps element names sorted
    ser::write_varint(buf, a.values.size());
    for (const auto& [name, value] : a.values) {
        ser::write_string(buf, name);
        write_value(buf, value);
    }
}

static void write_annotation_list(std::vector<uint8_t>& buf,
                                  const std::vector<AnnotationSig>& list) {
    ser::write_varint(buf, list.size());
    for (const auto& a : list) write_annotation(buf, a);
}

// Class annotations form a set: order them by their own encoding
static void write_annotation_set(std::vector<uint8_t>& buf,
                                 const std::vector<AnnotationSig>& set) {
    std::vector<std::vector<uint8_t>> encoded;
    encoded.reserve(set.size());
    for (const auto& a : set) {
        std::vector<uint8_t> one;
        write_annotation(one, a);
        encoded.push_back(std::move(one));
    }
    std::sort(encoded.begin(), encoded.end());
    ser::write_varint(buf, encoded.size());
    for (const auto& e : encoded) ser::write_blob(buf, e);
}

template<typename T>
static std::vector<const T*> sorted_members(const std::vector<T>& members) {
    std::vector<const T*> out;
    out.reserve(members.size());
    for (const auto& m : members) out.push_back(&m);
    std::sort(out.begin(), out.end(), [](const T* a, const T* b) { return *a < *b; });
    return out;
}

std::vector<uint8_t> canonical_bytes(const ClassSig& sig) {
    std::vector<uint8_t> buf;
    buf.reserve(256);

    buf.insert(buf.end(), MAGIC, MAGIC + MAGIC_LEN);
    buf.push_back(CanonicalFormatVersion);

    ser::write_access(buf, sig.access());
    ser::write_string(buf, sig.name());
    ser::write_optional(buf, sig.super_name());
    ser::write_optional(buf, sig.signature());

    ser::write_varint(buf, sig.interfaces().size());
    for (const auto& i : sig.interfaces()) ser::write_string(buf, i);

    write_annotation_set(buf, sig.annotations());

    auto fields = sorted_members(sig.fields());
    ser::write_varint(buf, fields.size());
    for (const FieldSig* f : fields) {
        ser::write_access(buf, f->access);
        ser::write_string(buf, f->name);
        ser::write_string(buf, f->desc);
        ser::write_optional(buf, f->signature);
        ser::write_optional(buf, f->constant_value);
        write_annotation_list(buf, f->annotations);
    }

    auto methods = sorted_members(sig.methods());
    ser::write_varint(buf, methods.size());
    for (const MethodSig* m : methods) {
        ser::write_access(buf, m->access);
        ser::write_string(buf, m->name);
        ser::write_string(buf, m->desc);
        ser::write_optional(buf, m->signature);
        ser::write_varint(buf, m->exceptions.size());
        for (const auto& e : m->exceptions) ser::write_string(buf, e);
        write_annotation_list(buf, m->annotations);
    }

    return buf;
}

bool same_abi(const ClassSig& a, const ClassSig& b) {
    return canonical_bytes(a) == canonical_bytes(b);
}

bool Fingerprint::operator==(const Fingerprint& o) const {
    return class_name == o.class_name && digest == o.digest;
}

Fingerprint fingerprint(const ClassSig& sig) {
    Fingerprint fp;
    fp.class_name = sig.name();
    fp.canonical = canonical_bytes(sig);
    fp.digest = Sha256::of(fp.canonical);
    return fp;
}

Status check_collision(const Fingerprint& a, const Fingerprint& b) {
    if (a.digest != b.digest) return ok_status();
    if (a.canonical.empty() || b.canonical.empty()) return ok_status();
    if (a.canonical == b.canonical) return ok_status();
    return WeftError(WeftError::HashCollisionDetected,
        "SHA-256 collision between " + a.class_name + " and " + b.class_name
        + " (digest " + a.hex() + ")",
        "this is an integrity fault; clear the cache and report it");
}

} // namespace weft::abi
