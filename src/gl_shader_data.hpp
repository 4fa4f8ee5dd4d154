// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#pragma once

#include <array>
#include <string_view>

namespace elastic {
namespace gl_shader {

// Shader programs, one per material.
enum class ProgramId {
	Wave,
	Creative,
};

// Shader stages are stored with all vertex shaders first. The order must match
// the order that embed_shaders.cmake is given.
constexpr int ShaderCount = 4;
constexpr int VertexShaderCount = 2;
constexpr int ProgramCount = 2;

// File names of the shaders, relative to the shader directory.
extern const std::array<std::string_view, ShaderCount> ShaderFilenames;

// The source code for a shader.
struct ShaderSource {
	const char *ptr;
	int size;
};

// Get the source code for shaders embedded in the program.
std::array<ShaderSource, ShaderCount> GetEmbeddedShaderSource();

// Specification for a shader program.
struct ProgramSpec {
	int vertex;   // Index into shader array.
	int fragment; // Index into shader array.
};

// Specifications for all programs, indexed by ProgramId.
extern const std::array<ProgramSpec, ProgramCount> ProgramSpecs;

} // namespace gl_shader
} // namespace elastic
