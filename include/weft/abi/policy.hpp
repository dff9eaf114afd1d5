#pragma once

#include <weft/abi/sig.hpp>
#include <weft/result.hpp>
#include <functional>
#include <string>

namespace weft::abi {

// A member as seen by an AbiPolicy predicate
struct MemberRef {
    enum Kind { Field, Method };

    Kind kind;
    const ClassSig& owner;
    int access;
    const std::string& name;
    const std::string& desc;
};

// Decides which members of an extracted ClassSig count as its ABI.
// Extraction never filters; apply() is the only place this happens, so the
// compile-avoidance view and the public-API view can differ.
struct AbiPolicy {
    bool include_private = true;
    bool include_package_private = true;
    bool include_synthetic = true;
    bool include_bridge = true;
    // <clinit> runs class initialization; no other class can call it
    bool include_static_init = true;

    // Extra veto applied after the flags; empty means accept
    std::function<bool(const MemberRef&)> predicate;

    // Keep every member
    static AbiPolicy all();
    // Drop private members, bridge methods and <clinit>
    static AbiPolicy compile_avoidance();
    // Public and protected members only, no synthetic members or <clinit>
    static AbiPolicy public_api();

    // "all" | "compile-avoidance" | "public-api"
    static Result<AbiPolicy> by_name(const std::string& name);

    // Stable summary of the flags, e.g. "private=0,package=1,synthetic=1,bridge=0,clinit=0"
    std::string describe() const;

    bool keep(const MemberRef& member) const;
    ClassSig apply(const ClassSig& sig) const;
};

} // namespace weft::abi
