// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#pragma once

#include <glm/vec2.hpp>
#include <glm/vec3.hpp>

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace elastic {
namespace material {

// GLSL names of the uniforms the materials declare.
namespace uniform {
constexpr std::string_view Time = "u_time";
constexpr std::string_view Resolution = "u_resolution";
constexpr std::string_view Elasticity = "u_elasticity";
constexpr std::string_view ClickTime = "u_clickTime";
constexpr std::string_view ClickPosition = "u_clickPosition";
constexpr std::string_view Shininess = "u_shininess";
constexpr std::string_view Transparency = "u_transparency";
constexpr std::string_view JiggleIntensity = "u_jiggleIntensity";
constexpr std::string_view InflateAmount = "u_inflateAmount";
constexpr std::string_view LightDirection = "u_lightDirection";
constexpr std::string_view LightColor = "u_lightColor";
constexpr std::string_view ObjectColor = "u_objectColor";
constexpr std::string_view CameraPosition = "u_cameraPosition";
} // namespace uniform

// Value of a shader uniform. Colors are stored as RGB vectors.
using UniformValue = std::variant<float, glm::vec2, glm::vec3>;

// A named uniform value.
struct Uniform {
	std::string name;
	UniformValue value;
};

// Convert a 0xRRGGBB color to an RGB vector with components in 0-1.
glm::vec3 ColorFromHex(unsigned rgb);

// The uniforms of one material. The set of names and their types is fixed
// when the material is built, only values change afterwards.
class UniformSet {
public:
	// Add a uniform. The name must not already be declared.
	void Declare(std::string_view name, UniformValue value);

	// Set the value of a declared uniform, which must keep its type. Returns
	// false without doing anything if the uniform is not declared.
	bool Set(std::string_view name, UniformValue value);

	// Return true if the uniform is declared.
	bool Has(std::string_view name) const { return Find(name) != nullptr; }

	// Get a uniform's value, or null if it is not declared.
	const UniformValue *Find(std::string_view name) const;

	std::optional<float> GetFloat(std::string_view name) const;
	std::optional<glm::vec2> GetVec2(std::string_view name) const;
	std::optional<glm::vec3> GetVec3(std::string_view name) const;

	std::span<const Uniform> uniforms() const { return mUniforms; }
	std::size_t size() const { return mUniforms.size(); }

private:
	Uniform *FindMutable(std::string_view name);

	std::vector<Uniform> mUniforms;
};

} // namespace material
} // namespace elastic
