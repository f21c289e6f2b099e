#include <catch2/catch.hpp>

#include <oscil/res/embedded_resources.hpp>

using namespace oscil;

TEST_CASE("Line shaders are embedded", "[res]") {
    auto vertex = res::LoadText("shaders/scope_line.vert");
    auto fragment = res::LoadText("shaders/scope_line.frag");

    REQUIRE(vertex.has_value());
    REQUIRE(fragment.has_value());
    CHECK(vertex->find("a_Position") != std::string_view::npos);
    CHECK(fragment->find("u_Color") != std::string_view::npos);
}

TEST_CASE("Missing resources are reported", "[res]") {
    CHECK_FALSE(res::LoadText("shaders/missing.vert").has_value());
}
