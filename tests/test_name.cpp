#include <catch2/catch.hpp>
#include <depot/name.hpp>

using namespace depot;

TEST_CASE("identity of a plain name is the name", "[name]") {
    auto r = PkgName::parse("ex_doc");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().raw() == "ex_doc");
    REQUIRE(r.value().identity() == "ex_doc");
}

TEST_CASE("identity folds case and dashes", "[name]") {
    auto r = PkgName::parse("Ex-Doc");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().raw() == "Ex-Doc");
    REQUIRE(r.value().identity() == "ex_doc");
}

TEST_CASE("names with one identity are equal", "[name]") {
    auto a = PkgName::parse("ex-doc").value();
    auto b = PkgName::parse("EX_DOC").value();
    REQUIRE(a == b);
    REQUIRE_FALSE(a != b);
}

TEST_CASE("different identities are not equal", "[name]") {
    auto a = PkgName::parse("postgrex").value();
    auto b = PkgName::parse("ecto").value();
    REQUIRE(a != b);
}

TEST_CASE("package_identity helper", "[name]") {
    REQUIRE(package_identity("Phoenix-HTML").value() == "phoenix_html");
    REQUIRE(package_identity("9lives").is_err());
}

TEST_CASE("invalid names", "[name]") {
    auto empty = PkgName::parse("");
    REQUIRE(empty.is_err());
    REQUIRE(empty.error().code == DepotError::InvalidArg);

    REQUIRE(PkgName::parse("123pkg").is_err());
    REQUIRE(PkgName::parse("_private").is_err());
    REQUIRE(PkgName::parse("my package").is_err());
    REQUIRE(PkgName::parse("my.package").is_err());
}

TEST_CASE("invalid character is named in the error", "[name]") {
    auto r = PkgName::parse("ex/doc");
    REQUIRE(r.is_err());
    REQUIRE(r.error().message.find("'/'") != std::string::npos);
}

TEST_CASE("single letter name valid", "[name]") {
    auto r = PkgName::parse("a");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().identity() == "a");
}
