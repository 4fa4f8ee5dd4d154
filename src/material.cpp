// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#include "material.hpp"

#include <glm/geometric.hpp>

namespace elastic {
namespace material {

namespace {

constexpr unsigned White = 0xffffff;
constexpr unsigned Magenta = 0xff00ff;

// Uniforms that every material declares.
void DeclareCommon(UniformSet &uniforms, const MaterialInit &init) {
	uniforms.Declare(uniform::Time, 0.0f);
	uniforms.Declare(uniform::Resolution, init.resolution);
	uniforms.Declare(uniform::CameraPosition, init.cameraPosition);
}

void DeclareLighting(UniformSet &uniforms) {
	uniforms.Declare(uniform::LightDirection,
	                 glm::normalize(glm::vec3{1.0f, 1.0f, 1.0f}));
	uniforms.Declare(uniform::LightColor, ColorFromHex(White));
	uniforms.Declare(uniform::ObjectColor, ColorFromHex(Magenta));
}

} // namespace

Material MakeWaveMaterial(const MaterialInit &init) {
	Material material{"wave", gl_shader::ProgramId::Wave, true, true, {}};
	UniformSet &uniforms = material.uniforms;
	DeclareCommon(uniforms, init);
	uniforms.Declare(uniform::Elasticity, 0.0f);
	uniforms.Declare(uniform::ClickTime, -1.0f);
	uniforms.Declare(uniform::ClickPosition, glm::vec3{-1.0f, -1.0f, -1.0f});
	uniforms.Declare(uniform::Shininess, 32.0f);
	uniforms.Declare(uniform::Transparency, 0.6f);
	uniforms.Declare(uniform::JiggleIntensity, 0.05f);
	DeclareLighting(uniforms);
	return material;
}

Material MakeCreativeMaterial(const MaterialInit &init) {
	Material material{"creative", gl_shader::ProgramId::Creative, true, true,
	                  {}};
	UniformSet &uniforms = material.uniforms;
	DeclareCommon(uniforms, init);
	uniforms.Declare(uniform::InflateAmount, 0.2f);
	DeclareLighting(uniforms);
	return material;
}

std::array<Material, MaterialCount> MakeMaterials(const MaterialInit &init) {
	return {MakeWaveMaterial(init), MakeCreativeMaterial(init)};
}

} // namespace material
} // namespace elastic
