#include <weft/abi/class_reader.hpp>

#include <cstdio>
#include <cstring>
#include <fstream>
#include <iterator>

namespace weft::abi {

namespace {

// Constant pool tags (JVMS 4.4)
enum CpTag : uint8_t {
    CpUtf8 = 1,
    CpInteger = 3,
    CpFloat = 4,
    CpLong = 5,
    CpDouble = 6,
    CpClass = 7,
    CpString = 8,
    CpFieldref = 9,
    CpMethodref = 10,
    CpInterfaceMethodref = 11,
    CpNameAndType = 12,
    CpMethodHandle = 15,
    CpMethodType = 16,
    CpDynamic = 17,
    CpInvokeDynamic = 18,
    CpModule = 19,
    CpPackage = 20
};

constexpr int MaxAnnotationDepth = 64;

struct CpEntry {
    uint8_t tag = 0;       // 0: unusable slot (index 0, second half of long/double)
    uint16_t ref = 0;      // Class/String/MethodType/Module/Package target
    uint64_t raw = 0;      // Integer/Float/Long/Double bits
    std::string utf8;
};

// Big-endian cursor over a byte range. Every read is bounds-checked.
class ByteReader {
public:
    ByteReader(const uint8_t* data, size_t len, size_t base = 0)
        : p_(data), end_(data + len), start_(data), base_(base) {}

    bool u1(uint8_t& v) {
        if (end_ - p_ < 1) return false;
        v = *p_++;
        return true;
    }

    bool u2(uint16_t& v) {
        if (end_ - p_ < 2) return false;
        v = static_cast<uint16_t>((p_[0] << 8) | p_[1]);
        p_ += 2;
        return true;
    }

    bool u4(uint32_t& v) {
        if (end_ - p_ < 4) return false;
        v = (uint32_t(p_[0]) << 24) | (uint32_t(p_[1]) << 16)
          | (uint32_t(p_[2]) << 8) | uint32_t(p_[3]);
        p_ += 4;
        return true;
    }

    bool bytes(size_t n, const uint8_t*& out) {
        if (static_cast<size_t>(end_ - p_) < n) return false;
        out = p_;
        p_ += n;
        return true;
    }

    bool skip(size_t n) {
        const uint8_t* ignored;
        return bytes(n, ignored);
    }

    // Sub-reader over the next n bytes; offsets stay file-relative
    bool slice(size_t n, ByteReader& out) {
        size_t at = offset();
        const uint8_t* b;
        if (!bytes(n, b)) return false;
        out = ByteReader(b, n, at);
        return true;
    }

    size_t offset() const { return base_ + static_cast<size_t>(p_ - start_); }
    bool at_end() const { return p_ == end_; }

private:
    const uint8_t* p_;
    const uint8_t* end_;
    const uint8_t* start_;
    size_t base_;
};

WeftError malformed(const std::string& what, size_t offset) {
    return WeftError(WeftError::MalformedClassFormat,
        what + " at offset " + std::to_string(offset));
}

std::string hex_bits(uint64_t bits, int width) {
    char buf[24];
    std::snprintf(buf, sizeof(buf), "0x%0*llx", width,
                  static_cast<unsigned long long>(bits));
    return buf;
}

class ClassFileParser {
public:
    ClassFileParser(const uint8_t* data, size_t len) : r_(data, len) {}

    Result<ClassSig> parse();

private:
    Status read_header();
    Status read_constant_pool();

    Result<const CpEntry*> entry(uint16_t index, uint8_t tag, size_t at);
    Result<std::string> utf8(uint16_t index, size_t at);
    Result<std::string> class_name(uint16_t index, size_t at);
    Result<std::string> render_constant(uint16_t index, char tag, size_t at);
    Result<std::string> render_constant_value(uint16_t index, size_t at);

    Result<AnnotationSig> read_annotation(ByteReader& r, bool visible, int depth);
    Result<AnnotationValue> read_element_value(ByteReader& r, int depth);
    Status read_annotations(ByteReader& r, bool visible,
                            std::vector<AnnotationSig>& out);

    Result<std::optional<std::string>> read_signature(ByteReader& attr);

    Status read_fields(ClassSigBuilder& b);
    Status read_methods(ClassSigBuilder& b);
    Status read_class_attributes(ClassSigBuilder& b);

    ByteReader r_;
    uint16_t major_ = 0;
    uint16_t minor_ = 0;
    std::vector<CpEntry> pool_;
};

// ---------------------------------------------------------------------------
// Header and constant pool
// ---------------------------------------------------------------------------

Status ClassFileParser::read_header() {
    uint32_t magic;
    if (!r_.u4(magic) || magic != ClassMagic) {
        return malformed("missing class file magic 0xCAFEBABE", 0);
    }
    if (!r_.u2(minor_) || !r_.u2(major_)) {
        return malformed("truncated version header", r_.offset());
    }
    if (major_ < MinMajorVersion || major_ > MaxMajorVersion) {
        return malformed("unsupported class file version " + std::to_string(major_)
                         + "." + std::to_string(minor_), 4);
    }
    // JVMS 4.1: from 56 on, minor is 0 or 0xFFFF (preview)
    if (major_ >= 56 && minor_ != 0 && minor_ != PreviewMinorVersion) {
        return malformed("invalid minor version " + std::to_string(minor_)
                         + " for major " + std::to_string(major_), 4);
    }
    if (major_ < 56 && minor_ == PreviewMinorVersion) {
        return malformed("preview minor version requires major >= 56", 4);
    }
    return ok_status();
}

Status ClassFileParser::read_constant_pool() {
    uint16_t count;
    if (!r_.u2(count) || count == 0) {
        return malformed("invalid constant pool count", r_.offset());
    }
    pool_.assign(count, CpEntry{});

    for (uint16_t i = 1; i < count; ++i) {
        size_t at = r_.offset();
        CpEntry& e = pool_[i];
        if (!r_.u1(e.tag)) return malformed("truncated constant pool", at);

        bool ok = true;
        switch (e.tag) {
            case CpUtf8: {
                uint16_t len;
                const uint8_t* b;
                ok = r_.u2(len) && r_.bytes(len, b);
                if (ok) e.utf8.assign(reinterpret_cast<const char*>(b), len);
                break;
            }
            case CpInteger:
            case CpFloat: {
                uint32_t v;
                ok = r_.u4(v);
                e.raw = v;
                break;
            }
            case CpLong:
            case CpDouble: {
                uint32_t hi, lo;
                ok = r_.u4(hi) && r_.u4(lo);
                e.raw = (uint64_t(hi) << 32) | lo;
                // 8-byte constants occupy two slots (JVMS 4.4.5)
                if (ok && ++i >= count) {
                    return malformed("8-byte constant overruns the pool", at);
                }
                break;
            }
            case CpClass:
            case CpString:
            case CpMethodType:
            case CpModule:
            case CpPackage:
                ok = r_.u2(e.ref);
                break;
            case CpFieldref:
            case CpMethodref:
            case CpInterfaceMethodref:
            case CpNameAndType:
            case CpDynamic:
            case CpInvokeDynamic:
                ok = r_.skip(4);
                break;
            case CpMethodHandle:
                ok = r_.skip(3);
                break;
            default:
                return malformed("unknown constant pool tag " + std::to_string(e.tag), at);
        }
        if (!ok) return malformed("truncated constant pool entry", at);
    }
    return ok_status();
}

Result<const CpEntry*> ClassFileParser::entry(uint16_t index, uint8_t tag, size_t at) {
    if (index == 0 || index >= pool_.size()) {
        return malformed("constant pool index " + std::to_string(index) + " out of range", at);
    }
    const CpEntry& e = pool_[index];
    if (e.tag != tag) {
        return malformed("constant pool entry " + std::to_string(index) + " has tag "
                         + std::to_string(e.tag) + ", expected " + std::to_string(tag), at);
    }
    return Result<const CpEntry*>::ok(&e);
}

Result<std::string> ClassFileParser::utf8(uint16_t index, size_t at) {
    auto e = entry(index, CpUtf8, at);
    WEFT_TRY(e);
    return Result<std::string>::ok(e.value()->utf8);
}

Result<std::string> ClassFileParser::class_name(uint16_t index, size_t at) {
    auto e = entry(index, CpClass, at);
    WEFT_TRY(e);
    return utf8(e.value()->ref, at);
}

// Annotation element constants (JVMS 4.7.16.1)
Result<std::string> ClassFileParser::render_constant(uint16_t index, char tag, size_t at) {
    switch (tag) {
        case 'B': case 'C': case 'I': case 'S': case 'Z': {
            auto e = entry(index, CpInteger, at);
            WEFT_TRY(e);
            return Result<std::string>::ok(
                std::to_string(static_cast<int32_t>(static_cast<uint32_t>(e.value()->raw))));
        }
        case 'J': {
            auto e = entry(index, CpLong, at);
            WEFT_TRY(e);
            return Result<std::string>::ok(
                std::to_string(static_cast<int64_t>(e.value()->raw)));
        }
        // Floating point constants are kept as raw bits so that every
        // platform renders them identically.
        case 'F': {
            auto e = entry(index, CpFloat, at);
            WEFT_TRY(e);
            return Result<std::string>::ok(hex_bits(e.value()->raw, 8));
        }
        case 'D': {
            auto e = entry(index, CpDouble, at);
            WEFT_TRY(e);
            return Result<std::string>::ok(hex_bits(e.value()->raw, 16));
        }
        case 's':
            return utf8(index, at);
    }
    return malformed(std::string("invalid constant tag '") + tag + "'", at);
}

// ConstantValue attribute (JVMS 4.7.2). The pool tag decides the rendering,
// prefixed so that 1 (int) and 1L (long) stay distinct.
Result<std::string> ClassFileParser::render_constant_value(uint16_t index, size_t at) {
    if (index == 0 || index >= pool_.size()) {
        return malformed("ConstantValue index out of range", at);
    }
    const CpEntry& e = pool_[index];
    switch (e.tag) {
        case CpInteger: {
            auto s = render_constant(index, 'I', at);
            WEFT_TRY(s);
            return Result<std::string>::ok("I:" + s.value());
        }
        case CpLong: {
            auto s = render_constant(index, 'J', at);
            WEFT_TRY(s);
            return Result<std::string>::ok("J:" + s.value());
        }
        case CpFloat:
            return Result<std::string>::ok("F:" + hex_bits(e.raw, 8));
        case CpDouble:
            return Result<std::string>::ok("D:" + hex_bits(e.raw, 16));
        case CpString: {
            auto s = utf8(e.ref, at);
            WEFT_TRY(s);
            return Result<std::string>::ok("s:" + s.value());
        }
    }
    return malformed("ConstantValue refers to tag " + std::to_string(e.tag), at);
}

// ---------------------------------------------------------------------------
// Annotations
// ---------------------------------------------------------------------------

Result<AnnotationValue> ClassFileParser::read_element_value(ByteReader& r, int depth) {
    size_t at = r.offset();
    if (depth > MaxAnnotationDepth) return malformed("annotation nesting too deep", at);

    uint8_t tag;
    if (!r.u1(tag)) return malformed("truncated element value", at);

    switch (tag) {
        case 'B': case 'C': case 'D': case 'F': case 'I':
        case 'J': case 'S': case 'Z': case 's': {
            uint16_t idx;
            if (!r.u2(idx)) return malformed("truncated constant element", at);
            auto text = render_constant(idx, static_cast<char>(tag), at);
            WEFT_TRY(text);
            return Result<AnnotationValue>::ok(
                AnnotationValue::constant(static_cast<char>(tag), std::move(text).value()));
        }
        case 'e': {
            uint16_t type_idx, name_idx;
            if (!r.u2(type_idx) || !r.u2(name_idx))
                return malformed("truncated enum element", at);
            auto type = utf8(type_idx, at);
            WEFT_TRY(type);
            auto name = utf8(name_idx, at);
            WEFT_TRY(name);
            return Result<AnnotationValue>::ok(AnnotationValue::enum_constant(
                std::move(type).value(), std::move(name).value()));
        }
        case 'c': {
            uint16_t idx;
            if (!r.u2(idx)) return malformed("truncated class element", at);
            auto desc = utf8(idx, at);
            WEFT_TRY(desc);
            return Result<AnnotationValue>::ok(
                AnnotationValue::class_literal(std::move(desc).value()));
        }
        case '@': {
            auto nested = read_annotation(r, true, depth + 1);
            WEFT_TRY(nested);
            return Result<AnnotationValue>::ok(
                AnnotationValue::annotation(std::move(nested).value()));
        }
        case '[': {
            uint16_t n;
            if (!r.u2(n)) return malformed("truncated array element", at);
            std::vector<AnnotationValue> elements;
            elements.reserve(n);
            for (uint16_t i = 0; i < n; ++i) {
                auto v = read_element_value(r, depth + 1);
                WEFT_TRY(v);
                elements.push_back(std::move(v).value());
            }
            return Result<AnnotationValue>::ok(AnnotationValue::array(std::move(elements)));
        }
    }
    return malformed("unknown element value tag " + std::to_string(tag), at);
}

// Nested annotations inherit nothing from the outer retention; `visible` only
// matters for top-level ones.
Result<AnnotationSig> ClassFileParser::read_annotation(ByteReader& r, bool visible, int depth) {
    size_t at = r.offset();
    uint16_t type_idx, pairs;
    if (!r.u2(type_idx) || !r.u2(pairs)) return malformed("truncated annotation", at);

    auto desc = utf8(type_idx, at);
    WEFT_TRY(desc);
    AnnotationSig sig(std::move(desc).value(), visible);

    for (uint16_t i = 0; i < pairs; ++i) {
        size_t pair_at = r.offset();
        uint16_t name_idx;
        if (!r.u2(name_idx)) return malformed("truncated annotation element", pair_at);
        auto name = utf8(name_idx, pair_at);
        WEFT_TRY(name);
        auto value = read_element_value(r, depth);
        WEFT_TRY(value);
        auto put = sig.put(name.value(), std::move(value).value());
        if (put.is_err()) return malformed(put.error().message, pair_at);
    }
    return Result<AnnotationSig>::ok(std::move(sig));
}

Status ClassFileParser::read_annotations(ByteReader& r, bool visible,
                                         std::vector<AnnotationSig>& out) {
    uint16_t n;
    if (!r.u2(n)) return malformed("truncated annotations attribute", r.offset());
    for (uint16_t i = 0; i < n; ++i) {
        auto a = read_annotation(r, visible, 0);
        WEFT_TRY(a);
        out.push_back(std::move(a).value());
    }
    if (!r.at_end()) return malformed("annotations attribute length mismatch", r.offset());
    return ok_status();
}

Result<std::optional<std::string>> ClassFileParser::read_signature(ByteReader& attr) {
    size_t at = attr.offset();
    uint16_t idx;
    if (!attr.u2(idx) || !attr.at_end()) return malformed("bad Signature attribute", at);
    auto s = utf8(idx, at);
    WEFT_TRY(s);
    return Result<std::optional<std::string>>::ok(std::move(s).value());
}

// ---------------------------------------------------------------------------
// Members
// ---------------------------------------------------------------------------

Status ClassFileParser::read_fields(ClassSigBuilder& b) {
    uint16_t count;
    if (!r_.u2(count)) return malformed("truncated field count", r_.offset());

    for (uint16_t i = 0; i < count; ++i) {
        size_t at = r_.offset();
        uint16_t access, name_idx, desc_idx, attr_count;
        if (!r_.u2(access) || !r_.u2(name_idx) || !r_.u2(desc_idx) || !r_.u2(attr_count))
            return malformed("truncated field_info", at);

        auto name = utf8(name_idx, at);
        WEFT_TRY(name);
        auto desc = utf8(desc_idx, at);
        WEFT_TRY(desc);
        FieldSig field(access, std::move(name).value(), std::move(desc).value());

        for (uint16_t a = 0; a < attr_count; ++a) {
            size_t attr_at = r_.offset();
            uint16_t attr_name_idx;
            uint32_t attr_len;
            ByteReader attr(nullptr, 0);
            if (!r_.u2(attr_name_idx) || !r_.u4(attr_len) || !r_.slice(attr_len, attr))
                return malformed("truncated field attribute", attr_at);
            auto attr_name = utf8(attr_name_idx, attr_at);
            WEFT_TRY(attr_name);

            const std::string& n = attr_name.value();
            if (n == "Signature") {
                auto s = read_signature(attr);
                WEFT_TRY(s);
                field.signature = std::move(s).value();
            } else if (n == "ConstantValue") {
                uint16_t idx;
                if (!attr.u2(idx) || !attr.at_end())
                    return malformed("bad ConstantValue attribute", attr_at);
                auto v = render_constant_value(idx, attr_at);
                WEFT_TRY(v);
                field.constant_value = std::move(v).value();
            } else if (n == "Synthetic") {
                // Pre-1.5 compilers mark synthetic members this way
                field.access |= acc::Synthetic;
            } else if (n == "RuntimeVisibleAnnotations") {
                WEFT_TRY(read_annotations(attr, true, field.annotations));
            } else if (n == "RuntimeInvisibleAnnotations") {
                WEFT_TRY(read_annotations(attr, false, field.annotations));
            }
        }

        auto added = b.add_field(std::move(field));
        if (added.is_err()) return malformed(added.error().message, at);
    }
    return ok_status();
}

Status ClassFileParser::read_methods(ClassSigBuilder& b) {
    uint16_t count;
    if (!r_.u2(count)) return malformed("truncated method count", r_.offset());

    for (uint16_t i = 0; i < count; ++i) {
        size_t at = r_.offset();
        uint16_t access, name_idx, desc_idx, attr_count;
        if (!r_.u2(access) || !r_.u2(name_idx) || !r_.u2(desc_idx) || !r_.u2(attr_count))
            return malformed("truncated method_info", at);

        auto name = utf8(name_idx, at);
        WEFT_TRY(name);
        auto desc = utf8(desc_idx, at);
        WEFT_TRY(desc);
        MethodSig method(access, std::move(name).value(), std::move(desc).value());

        for (uint16_t a = 0; a < attr_count; ++a) {
            size_t attr_at = r_.offset();
            uint16_t attr_name_idx;
            uint32_t attr_len;
            ByteReader attr(nullptr, 0);
            if (!r_.u2(attr_name_idx) || !r_.u4(attr_len) || !r_.slice(attr_len, attr))
                return malformed("truncated method attribute", attr_at);
            auto attr_name = utf8(attr_name_idx, attr_at);
            WEFT_TRY(attr_name);

            // Code, LineNumberTable, StackMapTable... are implementation only
            const std::string& n = attr_name.value();
            if (n == "Signature") {
                auto s = read_signature(attr);
                WEFT_TRY(s);
                method.signature = std::move(s).value();
            } else if (n == "Exceptions") {
                uint16_t n_ex;
                if (!attr.u2(n_ex)) return malformed("bad Exceptions attribute", attr_at);
                for (uint16_t e = 0; e < n_ex; ++e) {
                    uint16_t idx;
                    if (!attr.u2(idx)) return malformed("truncated Exceptions attribute", attr_at);
                    auto ex = class_name(idx, attr_at);
                    WEFT_TRY(ex);
                    method.exceptions.insert(std::move(ex).value());
                }
                if (!attr.at_end()) return malformed("Exceptions attribute length mismatch", attr_at);
            } else if (n == "Synthetic") {
                method.access |= acc::Synthetic;
            } else if (n == "RuntimeVisibleAnnotations") {
                WEFT_TRY(read_annotations(attr, true, method.annotations));
            } else if (n == "RuntimeInvisibleAnnotations") {
                WEFT_TRY(read_annotations(attr, false, method.annotations));
            }
        }

        auto added = b.add_method(std::move(method));
        if (added.is_err()) return malformed(added.error().message, at);
    }
    return ok_status();
}

Status ClassFileParser::read_class_attributes(ClassSigBuilder& b) {
    size_t at = r_.offset();
    uint16_t count;
    if (!r_.u2(count)) return malformed("truncated class attribute count", at);

    for (uint16_t a = 0; a < count; ++a) {
        size_t attr_at = r_.offset();
        uint16_t attr_name_idx;
        uint32_t attr_len;
        ByteReader attr(nullptr, 0);
        if (!r_.u2(attr_name_idx) || !r_.u4(attr_len) || !r_.slice(attr_len, attr))
            return malformed("truncated class attribute", attr_at);
        auto attr_name = utf8(attr_name_idx, attr_at);
        WEFT_TRY(attr_name);

        const std::string& n = attr_name.value();
        bool visible = n == "RuntimeVisibleAnnotations";
        if (n == "Signature") {
            auto s = read_signature(attr);
            WEFT_TRY(s);
            b.set_signature(std::move(s).value());
        } else if (visible || n == "RuntimeInvisibleAnnotations") {
            std::vector<AnnotationSig> found;
            WEFT_TRY(read_annotations(attr, visible, found));
            for (auto& sig : found) {
                AnnotationSig& dst = b.add_annotation(sig.desc, sig.visible);
                dst.values = std::move(sig.values);
            }
        }
    }
    return ok_status();
}

// ---------------------------------------------------------------------------
// Whole class
// ---------------------------------------------------------------------------

Result<ClassSig> ClassFileParser::parse() {
    WEFT_TRY(read_header());
    WEFT_TRY(read_constant_pool());

    size_t at = r_.offset();
    uint16_t access, this_idx, super_idx, n_interfaces;
    if (!r_.u2(access) || !r_.u2(this_idx) || !r_.u2(super_idx) || !r_.u2(n_interfaces))
        return malformed("truncated class header", at);

    auto name = class_name(this_idx, at);
    WEFT_TRY(name);

    std::optional<std::string> super_name;
    if (super_idx != 0) {
        auto s = class_name(super_idx, at);
        WEFT_TRY(s);
        super_name = std::move(s).value();
    }

    std::vector<std::string> interfaces;
    interfaces.reserve(n_interfaces);
    for (uint16_t i = 0; i < n_interfaces; ++i) {
        size_t iat = r_.offset();
        uint16_t idx;
        if (!r_.u2(idx)) return malformed("truncated interface table", iat);
        auto iface = class_name(idx, iat);
        WEFT_TRY(iface);
        interfaces.push_back(std::move(iface).value());
    }

    ClassSigBuilder builder(access, std::move(name).value(), std::move(super_name),
                            std::nullopt, interfaces);
    WEFT_TRY(read_fields(builder));
    WEFT_TRY(read_methods(builder));
    WEFT_TRY(read_class_attributes(builder));
    if (!r_.at_end()) return malformed("trailing bytes after class file", r_.offset());

    return Result<ClassSig>::ok(std::move(builder).build());
}

} // namespace

Result<ClassSig> extract_class(const uint8_t* data, size_t len) {
    ClassFileParser parser(data, len);
    return parser.parse();
}

Result<ClassSig> extract_class(const std::vector<uint8_t>& bytes) {
    return extract_class(bytes.data(), bytes.size());
}

Result<ClassSig> read_class_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return WeftError(WeftError::IO, "cannot open class file: " + path);
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)),
                               std::istreambuf_iterator<char>());
    auto sig = extract_class(bytes);
    if (sig.is_err()) {
        sig.error().file = path;
    }
    return sig;
}

} // namespace weft::abi
