#include <catch2/catch.hpp>
#include <weft/abi/policy.hpp>

using namespace weft;
using namespace weft::abi;

static ClassSig mixed_class(int class_access = acc::Public | acc::Super) {
    ClassSigBuilder b(class_access, "com/acme/Mixed", std::string("java/lang/Object"),
                      std::nullopt, {});
    (void)b.add_field(FieldSig(acc::Public, "pub", "I"));
    (void)b.add_field(FieldSig(acc::Protected, "prot", "I"));
    (void)b.add_field(FieldSig(0, "pkg", "I"));
    (void)b.add_field(FieldSig(acc::Private, "priv", "I"));
    (void)b.add_field(FieldSig(acc::Public | acc::Volatile, "flag", "Z"));
    (void)b.add_method(MethodSig(acc::Public, "compareTo", "(Lcom/acme/Mixed;)I"));
    (void)b.add_method(MethodSig(acc::Public | acc::Bridge | acc::Synthetic,
                                 "compareTo", "(Ljava/lang/Object;)I"));
    (void)b.add_method(MethodSig(acc::Static | acc::Synthetic, "access$000", "()I"));
    (void)b.add_method(MethodSig(acc::Private, "helper", "()V"));
    return std::move(b).build();
}

TEST_CASE("all() keeps every member", "[policy]") {
    auto sig = AbiPolicy::all().apply(mixed_class());
    REQUIRE(sig.fields().size() == 5);
    REQUIRE(sig.methods().size() == 4);
}

TEST_CASE("compile_avoidance() drops private members and bridges", "[policy]") {
    auto sig = AbiPolicy::compile_avoidance().apply(mixed_class());
    REQUIRE(sig.find_field("priv", "I") == nullptr);
    REQUIRE(sig.find_field("pkg", "I") != nullptr);
    REQUIRE(sig.find_method("helper", "()V") == nullptr);
    REQUIRE(sig.find_method("compareTo", "(Ljava/lang/Object;)I") == nullptr);
    REQUIRE(sig.find_method("compareTo", "(Lcom/acme/Mixed;)I") != nullptr);
    // Non-bridge synthetic accessors stay
    REQUIRE(sig.find_method("access$000", "()I") != nullptr);
}

TEST_CASE("bridge flag is not confused with volatile fields", "[policy]") {
    // ACC_VOLATILE and ACC_BRIDGE share a bit
    auto sig = AbiPolicy::compile_avoidance().apply(mixed_class());
    REQUIRE(sig.find_field("flag", "Z") != nullptr);
}

TEST_CASE("public_api() keeps public and protected only", "[policy]") {
    auto sig = AbiPolicy::public_api().apply(mixed_class());
    REQUIRE(sig.fields().size() == 3);
    REQUIRE(sig.find_field("pkg", "I") == nullptr);
    REQUIRE(sig.methods().size() == 1);
    REQUIRE(sig.find_method("access$000", "()I") == nullptr);
}

TEST_CASE("interface members count as public", "[policy]") {
    ClassSigBuilder b(acc::Public | acc::Interface | acc::Abstract, "com/acme/Api",
                      std::string("java/lang/Object"), std::nullopt, {});
    (void)b.add_method(MethodSig(acc::Abstract, "call", "()V"));
    auto sig = AbiPolicy::public_api().apply(std::move(b).build());
    REQUIRE(sig.methods().size() == 1);
}

TEST_CASE("predicate vetoes after the flags", "[policy]") {
    AbiPolicy p = AbiPolicy::all();
    p.predicate = [](const MemberRef& m) {
        return !(m.kind == MemberRef::Method && m.name == "helper");
    };
    auto sig = p.apply(mixed_class());
    REQUIRE(sig.find_method("helper", "()V") == nullptr);
    REQUIRE(sig.find_field("priv", "I") != nullptr);
    REQUIRE(sig.methods().size() == 3);
}

TEST_CASE("by_name resolves presets", "[policy]") {
    REQUIRE(AbiPolicy::by_name("all").value().include_private);
    REQUIRE_FALSE(AbiPolicy::by_name("compile-avoidance").value().include_private);
    REQUIRE_FALSE(AbiPolicy::by_name("public-api").value().include_synthetic);

    auto bad = AbiPolicy::by_name("internal");
    REQUIRE(bad.is_err());
    REQUIRE(bad.error().code == WeftError::Config);
}

TEST_CASE("describe() reflects the flags", "[policy]") {
    REQUIRE(AbiPolicy::compile_avoidance().describe() ==
            "private=0,package=1,synthetic=1,bridge=0,clinit=0");
    AbiPolicy p = AbiPolicy::all();
    p.predicate = [](const MemberRef&) { return true; };
    REQUIRE(p.describe() == "private=1,package=1,synthetic=1,bridge=1,clinit=1,custom");
}

TEST_CASE("static initializer is dropped by every preset but all()", "[policy]") {
    ClassSigBuilder b(acc::Public | acc::Super, "com/acme/Seeded",
                      std::string("java/lang/Object"), std::nullopt, {});
    (void)b.add_method(MethodSig(acc::Static, "<clinit>", "()V"));
    (void)b.add_method(MethodSig(acc::Public, "get", "()I"));
    auto sig = std::move(b).build();

    REQUIRE(AbiPolicy::all().apply(sig).find_method("<clinit>", "()V") != nullptr);
    REQUIRE(AbiPolicy::compile_avoidance().apply(sig).find_method("<clinit>", "()V") == nullptr);
    REQUIRE(AbiPolicy::public_api().apply(sig).find_method("<clinit>", "()V") == nullptr);
    REQUIRE(AbiPolicy::compile_avoidance().apply(sig).methods().size() == 1);
}
