// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#pragma once

#include "gl.hpp"
#include "material.hpp"
#include "mesh.hpp"

#include <array>
#include <span>
#include <vector>

namespace elastic {
namespace viewer {
class Controller;
}

namespace render {

// Draws the viewer's mesh with its active material.
class Renderer {
public:
	Renderer()
		: mArray{0}, mBuffer{0, 0}, mIndexCount{0}, mWidth{0}, mHeight{0} {}
	Renderer(const Renderer &) = delete;
	Renderer &operator=(const Renderer &) = delete;

	// Upload the mesh and look up uniform locations. Shader programs must
	// already be compiled.
	void Init(const scene::MeshData &mesh,
	          std::span<const material::Material> materials);

	// Set the framebuffer size, in pixels.
	void SetSize(int width, int height);

	// Draw one frame.
	void Render(const viewer::Controller &controller);

private:
	// Uniform locations for one material's program.
	struct ProgramLocations {
		GLint projection;
		GLint modelView;
		GLint model;
		GLint normalMatrix;
		// Parallel to the material's uniform list.
		std::vector<GLint> uniforms;
	};

	GLuint mArray;
	GLuint mBuffer[2];
	GLsizei mIndexCount;
	int mWidth;
	int mHeight;
	std::array<ProgramLocations, material::MaterialCount> mLocations;
};

} // namespace render
} // namespace elastic
