// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#include "material.hpp"
#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

using namespace elastic;
using namespace elastic::material;
using Catch::Matchers::WithinAbs;

namespace {

const MaterialInit DefaultInit{glm::vec2{640.0f, 480.0f},
                        glm::vec3{0.0f, 0.0f, 9.0f}};

} // namespace

TEST_CASE("Color from hex", "[material]") {
	REQUIRE(ColorFromHex(0xffffff) == glm::vec3{1.0f, 1.0f, 1.0f});
	REQUIRE(ColorFromHex(0xff00ff) == glm::vec3{1.0f, 0.0f, 1.0f});
	REQUIRE(ColorFromHex(0x000000) == glm::vec3{0.0f});
	REQUIRE_THAT(ColorFromHex(0x336699).g, WithinAbs(0.4, 1e-6));
}

TEST_CASE("Uniform set", "[material][uniform]") {
	UniformSet uniforms;
	uniforms.Declare("u_a", 1.0f);
	uniforms.Declare("u_b", glm::vec3{1.0f, 2.0f, 3.0f});

	SECTION("set declared uniform") {
		REQUIRE(uniforms.Set("u_a", 2.5f));
		REQUIRE(uniforms.GetFloat("u_a") == 2.5f);
	}

	SECTION("set undeclared uniform is ignored") {
		REQUIRE_FALSE(uniforms.Set("u_c", 2.5f));
		REQUIRE_FALSE(uniforms.Has("u_c"));
		REQUIRE(uniforms.size() == 2);
	}

	SECTION("getters check the type") {
		REQUIRE_FALSE(uniforms.GetVec3("u_a").has_value());
		REQUIRE_FALSE(uniforms.GetFloat("u_b").has_value());
		REQUIRE_FALSE(uniforms.GetFloat("u_c").has_value());
	}

	SECTION("declaration order is kept") {
		REQUIRE(uniforms.uniforms()[0].name == "u_a");
		REQUIRE(uniforms.uniforms()[1].name == "u_b");
	}

	SECTION("changing the type is fatal") {
		REQUIRE_THROWS_AS(uniforms.Set("u_a", glm::vec2{1.0f, 1.0f}),
		                  test::FatalError);
	}

	SECTION("declaring twice is fatal") {
		REQUIRE_THROWS_AS(uniforms.Declare("u_a", 0.0f), test::FatalError);
	}
}

TEST_CASE("Wave material", "[material]") {
	const Material material = MakeWaveMaterial(DefaultInit);
	const UniformSet &u = material.uniforms;

	REQUIRE(material.name == "wave");
	REQUIRE(material.program == gl_shader::ProgramId::Wave);
	REQUIRE(material.transparent);
	REQUIRE(material.doubleSided);

	REQUIRE(u.GetFloat(uniform::Time) == 0.0f);
	REQUIRE(u.GetVec2(uniform::Resolution) == glm::vec2{640.0f, 480.0f});
	REQUIRE(u.GetVec3(uniform::CameraPosition) == glm::vec3{0.0f, 0.0f, 9.0f});
	REQUIRE(u.GetFloat(uniform::Elasticity) == 0.0f);
	REQUIRE(u.GetFloat(uniform::ClickTime) == -1.0f);
	REQUIRE(u.GetVec3(uniform::ClickPosition) ==
	        glm::vec3{-1.0f, -1.0f, -1.0f});
	REQUIRE(u.GetFloat(uniform::Shininess) == 32.0f);
	REQUIRE(u.GetFloat(uniform::Transparency) == 0.6f);
	REQUIRE(u.GetFloat(uniform::JiggleIntensity) == 0.05f);
	REQUIRE(u.GetVec3(uniform::LightColor) == glm::vec3{1.0f});
	REQUIRE(u.GetVec3(uniform::ObjectColor) == glm::vec3{1.0f, 0.0f, 1.0f});

	const glm::vec3 light = u.GetVec3(uniform::LightDirection).value();
	REQUIRE_THAT(light.x, WithinAbs(0.57735, 1e-5));
	REQUIRE_THAT(light.y, WithinAbs(0.57735, 1e-5));
	REQUIRE_THAT(light.z, WithinAbs(0.57735, 1e-5));

	REQUIRE_FALSE(u.Has(uniform::InflateAmount));
}

TEST_CASE("Creative material", "[material]") {
	const Material material = MakeCreativeMaterial(DefaultInit);
	const UniformSet &u = material.uniforms;

	REQUIRE(material.name == "creative");
	REQUIRE(material.program == gl_shader::ProgramId::Creative);
	REQUIRE(u.GetFloat(uniform::InflateAmount) == 0.2f);
	REQUIRE(u.GetVec2(uniform::Resolution) == glm::vec2{640.0f, 480.0f});
	REQUIRE(u.GetVec3(uniform::ObjectColor) == glm::vec3{1.0f, 0.0f, 1.0f});
	REQUIRE_FALSE(u.Has(uniform::Elasticity));
	REQUIRE_FALSE(u.Has(uniform::ClickTime));
	REQUIRE_FALSE(u.Has(uniform::ClickPosition));
}

TEST_CASE("Material list", "[material]") {
	const auto materials = MakeMaterials(DefaultInit);
	REQUIRE(materials[WaveIndex].name == "wave");
	REQUIRE(materials[CreativeIndex].name == "creative");
}
