// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#pragma once

#include "gl_shader_data.hpp"
#include "uniform.hpp"

#include <glm/vec2.hpp>
#include <glm/vec3.hpp>

#include <array>
#include <string_view>

namespace elastic {
namespace material {

// A shader program together with the uniform values it is drawn with.
struct Material {
	std::string_view name;
	gl_shader::ProgramId program;
	bool transparent;
	bool doubleSided;
	UniformSet uniforms;
};

constexpr int MaterialCount = 2;

// Index of each material in the material list.
constexpr int WaveIndex = 0;
constexpr int CreativeIndex = 1;

// Values shared by all materials at startup.
struct MaterialInit {
	glm::vec2 resolution;
	glm::vec3 cameraPosition;
};

// Create the ripple material: jiggle and click ripples, Phong lighting.
Material MakeWaveMaterial(const MaterialInit &init);

// Create the creative material: inflation and toon shading.
Material MakeCreativeMaterial(const MaterialInit &init);

// Create all materials, in index order.
std::array<Material, MaterialCount> MakeMaterials(const MaterialInit &init);

} // namespace material
} // namespace elastic
