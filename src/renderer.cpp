// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#include "renderer.hpp"

#include "gl_shader.hpp"
#include "log.hpp"
#include "viewer.hpp"

#include <glm/gtc/type_ptr.hpp>
#include <glm/mat3x3.hpp>
#include <glm/mat4x4.hpp>
#include <glm/matrix.hpp>

#include <cstddef>
#include <limits>
#include <string>
#include <variant>

namespace elastic {
namespace render {

namespace {

// Vertex attribute locations, matching the layout qualifiers in the shaders.
constexpr GLuint PositionAttrib = 0;
constexpr GLuint NormalAttrib = 1;
constexpr GLuint TexCoordAttrib = 2;

void *AttribOffset(std::size_t offset) {
	return reinterpret_cast<void *>(offset);
}

void UploadUniform(GLint location, const material::UniformValue &value) {
	if (location < 0) {
		return;
	}
	if (const float *v = std::get_if<float>(&value)) {
		glUniform1f(location, *v);
	} else if (const glm::vec2 *v = std::get_if<glm::vec2>(&value)) {
		glUniform2fv(location, 1, glm::value_ptr(*v));
	} else if (const glm::vec3 *v = std::get_if<glm::vec3>(&value)) {
		glUniform3fv(location, 1, glm::value_ptr(*v));
	}
}

} // namespace

void Renderer::Init(const scene::MeshData &mesh,
                    std::span<const material::Material> materials) {
	CHECK(materials.size() == mLocations.size());
	CHECK(mesh.indices.size() <=
	      static_cast<std::size_t>(std::numeric_limits<GLsizei>::max()));

	glGenVertexArrays(1, &mArray);
	glBindVertexArray(mArray);
	glGenBuffers(2, mBuffer);
	glBindBuffer(GL_ARRAY_BUFFER, mBuffer[0]);
	glBufferData(GL_ARRAY_BUFFER,
	             static_cast<GLsizeiptr>(mesh.vertices.size() *
	                                     sizeof(scene::Vertex)),
	             mesh.vertices.data(), GL_STATIC_DRAW);
	glEnableVertexAttribArray(PositionAttrib);
	glVertexAttribPointer(PositionAttrib, 3, GL_FLOAT, GL_FALSE,
	                      sizeof(scene::Vertex),
	                      AttribOffset(offsetof(scene::Vertex, position)));
	glEnableVertexAttribArray(NormalAttrib);
	glVertexAttribPointer(NormalAttrib, 3, GL_FLOAT, GL_FALSE,
	                      sizeof(scene::Vertex),
	                      AttribOffset(offsetof(scene::Vertex, normal)));
	glEnableVertexAttribArray(TexCoordAttrib);
	glVertexAttribPointer(TexCoordAttrib, 2, GL_FLOAT, GL_FALSE,
	                      sizeof(scene::Vertex),
	                      AttribOffset(offsetof(scene::Vertex, uv)));
	glBindBuffer(GL_ELEMENT_ARRAY_BUFFER, mBuffer[1]);
	glBufferData(GL_ELEMENT_ARRAY_BUFFER,
	             static_cast<GLsizeiptr>(mesh.indices.size() *
	                                     sizeof(unsigned short)),
	             mesh.indices.data(), GL_STATIC_DRAW);
	glBindVertexArray(0);
	mIndexCount = static_cast<GLsizei>(mesh.indices.size());

	for (std::size_t i = 0; i < materials.size(); i++) {
		const material::Material &material = materials[i];
		const GLuint program = gl_shader::Program(material.program);
		ProgramLocations &locations = mLocations[i];
		locations.projection = glGetUniformLocation(program, "u_projection");
		locations.modelView = glGetUniformLocation(program, "u_modelView");
		locations.model = glGetUniformLocation(program, "u_model");
		locations.normalMatrix =
			glGetUniformLocation(program, "u_normalMatrix");
		locations.uniforms.clear();
		for (const material::Uniform &uniform : material.uniforms.uniforms()) {
			const GLint location =
				glGetUniformLocation(program, uniform.name.c_str());
			if (location < 0) {
				// The compiler removes uniforms that the shader does not use.
				LOG(Debug, "Uniform not active.",
				    log::Attr{"material", material.name},
				    log::Attr{"uniform", uniform.name});
			}
			locations.uniforms.push_back(location);
		}
	}

	glEnable(GL_DEPTH_TEST);
	glDepthFunc(GL_LEQUAL);
}

void Renderer::SetSize(int width, int height) {
	if (width == mWidth && height == mHeight) {
		return;
	}
	mWidth = width;
	mHeight = height;
	glViewport(0, 0, width, height);
}

void Renderer::Render(const viewer::Controller &controller) {
	const scene::PerspectiveCamera &camera = controller.camera();
	const int materialIndex = controller.state().activeMaterial;
	const material::Material &material = controller.activeMaterial();
	const ProgramLocations &locations = mLocations[materialIndex];

	// The mesh stays at the origin.
	const glm::mat4 model{1.0f};
	const glm::mat4 projection = camera.ProjectionMatrix();
	const glm::mat4 modelView = camera.ViewMatrix() * model;
	const glm::mat3 normalMatrix = glm::transpose(glm::inverse(glm::mat3{model}));

	glClearColor(0.0f, 0.0f, 0.0f, 1.0f);
	glClear(GL_COLOR_BUFFER_BIT | GL_DEPTH_BUFFER_BIT);

	glUseProgram(gl_shader::Program(material.program));
	glUniformMatrix4fv(locations.projection, 1, GL_FALSE,
	                   glm::value_ptr(projection));
	glUniformMatrix4fv(locations.modelView, 1, GL_FALSE,
	                   glm::value_ptr(modelView));
	glUniformMatrix4fv(locations.model, 1, GL_FALSE, glm::value_ptr(model));
	glUniformMatrix3fv(locations.normalMatrix, 1, GL_FALSE,
	                   glm::value_ptr(normalMatrix));
	const std::span<const material::Uniform> uniforms =
		material.uniforms.uniforms();
	for (std::size_t i = 0; i < uniforms.size(); i++) {
		UploadUniform(locations.uniforms[i], uniforms[i].value);
	}

	if (material.transparent) {
		glEnable(GL_BLEND);
		glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);
	} else {
		glDisable(GL_BLEND);
	}
	if (material.doubleSided) {
		glDisable(GL_CULL_FACE);
	} else {
		glEnable(GL_CULL_FACE);
	}

	glBindVertexArray(mArray);
	glDrawElements(GL_TRIANGLES, mIndexCount, GL_UNSIGNED_SHORT,
	               AttribOffset(0));
	glBindVertexArray(0);
}

} // namespace render
} // namespace elastic
