#include <weft/abi/policy.hpp>

namespace weft::abi {

AbiPolicy AbiPolicy::all() {
    return AbiPolicy{};
}

// Private members are unreachable from other compilation units. Bridge
// methods only mirror an override that is itself part of the ABI. <clinit>
// appears and disappears with private static initializers.
AbiPolicy AbiPolicy::compile_avoidance() {
    AbiPolicy p;
    p.include_private = false;
    p.include_bridge = false;
    p.include_static_init = false;
    return p;
}

AbiPolicy AbiPolicy::public_api() {
    AbiPolicy p;
    p.include_private = false;
    p.include_package_private = false;
    p.include_synthetic = false;
    p.include_bridge = false;
    p.include_static_init = false;
    return p;
}

Result<AbiPolicy> AbiPolicy::by_name(const std::string& name) {
    if (name == "all") return Result<AbiPolicy>::ok(all());
    if (name == "compile-avoidance") return Result<AbiPolicy>::ok(compile_avoidance());
    if (name == "public-api") return Result<AbiPolicy>::ok(public_api());
    return WeftError(WeftError::Config, "unknown ABI policy: " + name,
                     "expected one of: all, compile-avoidance, public-api");
}

std::string AbiPolicy::describe() const {
    std::string out;
    out += "private=";
    out += include_private ? "1" : "0";
    out += ",package=";
    out += include_package_private ? "1" : "0";
    out += ",synthetic=";
    out += include_synthetic ? "1" : "0";
    out += ",bridge=";
    out += include_bridge ? "1" : "0";
    out += ",clinit=";
    out += include_static_init ? "1" : "0";
    if (predicate) out += ",custom";
    return out;
}

bool AbiPolicy::keep(const MemberRef& member) const {
    int a = member.access;
    if (!include_static_init && member.kind == MemberRef::Method && member.name == "<clinit>") {
        return false;
    }
    if (!include_private && (a & acc::Private)) return false;
    if (!include_package_private && !(a & (acc::Public | acc::Protected | acc::Private))) {
        // Interface members are implicitly public
        if (!(member.owner.access() & acc::Interface)) return false;
    }
    if (!include_synthetic && (a & acc::Synthetic)) return false;
    if (!include_bridge && member.kind == MemberRef::Method && (a & acc::Bridge)) return false;
    if (predicate && !predicate(member)) return false;
    return true;
}

ClassSig AbiPolicy::apply(const ClassSig& sig) const {
    return sig.retain(
        [&](const FieldSig& f) {
            return keep(MemberRef{MemberRef::Field, sig, f.access, f.name, f.desc});
        },
        [&](const MethodSig& m) {
            return keep(MemberRef{MemberRef::Method, sig, m.access, m.name, m.desc});
        });
}

} // namespace weft::abi
