// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#include "gl_shader.hpp"

#include "log.hpp"
#include "os_file.hpp"
#include "var.hpp"

#include <array>
#include <limits>
#include <string>
#include <string_view>

namespace elastic {
namespace gl_shader {

namespace {

// ============================================================================
// Shaders
// ============================================================================

struct Shader {
	GLuint shader;
};

std::array<Shader, ShaderCount> Shaders;

// Get the info log of a shader object.
std::string ShaderInfoLog(GLuint shader) {
	GLint length = 0;
	glGetShaderiv(shader, GL_INFO_LOG_LENGTH, &length);
	if (length <= 0) {
		return {};
	}
	std::string text(static_cast<std::size_t>(length), '\0');
	GLsizei written = 0;
	glGetShaderInfoLog(shader, length, &written, text.data());
	text.resize(static_cast<std::size_t>(written));
	return text;
}

// Get the info log of a program object.
std::string ProgramInfoLog(GLuint program) {
	GLint length = 0;
	glGetProgramiv(program, GL_INFO_LOG_LENGTH, &length);
	if (length <= 0) {
		return {};
	}
	std::string text(static_cast<std::size_t>(length), '\0');
	GLsizei written = 0;
	glGetProgramInfoLog(program, length, &written, text.data());
	text.resize(static_cast<std::size_t>(written));
	return text;
}

// Compile a shader, given the source code for that shader.
void CompileShader(int shaderId, std::string_view source) {
	CHECK(source.size() <=
	      static_cast<std::size_t>(std::numeric_limits<GLint>::max()));
	Shader &shader = Shaders[shaderId];
	const char *ptr[1] = {source.data()};
	const GLint len[1] = {static_cast<GLint>(source.size())};
	glShaderSource(shader.shader, 1, ptr, len);
	glCompileShader(shader.shader);
}

// Compile all shaders using the shader source code embedded in the executable.
void CompileEmbedded() {
	const std::array<ShaderSource, ShaderCount> sources =
		GetEmbeddedShaderSource();
	for (int shaderId = 0; shaderId < ShaderCount; shaderId++) {
		const ShaderSource source = sources[shaderId];
		const std::string_view sourceText{
			source.ptr, static_cast<std::size_t>(source.size)};
		CompileShader(shaderId, sourceText);
	}
}

// Compile shaders from the filesystem.
void CompileFiles() {
	std::string data;
	std::string filename;
	for (int shaderId = 0; shaderId < ShaderCount; shaderId++) {
		filename.assign("shader/");
		filename.append(ShaderFilenames[shaderId]);
		if (!ReadProjectFile(&data, filename)) {
			FAIL("Could not read shader.", log::Attr{"file", filename});
		}
		CompileShader(shaderId, data);
	}
}

// Fail if any shader did not compile. Only called after linking fails, so the
// driver can compile in the background until then.
void CheckShaders() {
	for (int shaderId = 0; shaderId < ShaderCount; shaderId++) {
		const GLuint shader = Shaders[shaderId].shader;
		GLint status;
		glGetShaderiv(shader, GL_COMPILE_STATUS, &status);
		if (!status) {
			const std::string text = ShaderInfoLog(shader);
			FAIL("Shader failed to compile.",
			     log::Attr{"file", ShaderFilenames[shaderId]},
			     log::Attr{"log", text});
		}
	}
}

// ============================================================================
// Shader Programs
// ============================================================================

std::array<GLuint, ProgramCount> Programs;

// Link all shader programs.
void LinkPrograms() {
	// Link and then check status separately. This way, the driver can compile
	// shaders in parallel.
	for (const GLuint program : Programs) {
		glLinkProgram(program);
	}

	for (int programId = 0; programId < ProgramCount; programId++) {
		const GLuint program = Programs[programId];
		GLint status;
		glGetProgramiv(program, GL_LINK_STATUS, &status);
		if (!status) {
			CheckShaders();
			const std::string text = ProgramInfoLog(program);
			FAIL("Shader program failed to link.",
			     log::Attr{"program", programId}, log::Attr{"log", text});
		}
	}
}

} // namespace

// ============================================================================
// Initialization
// ============================================================================

void Init() {
	// Create shader objects.
	for (int shaderId = 0; shaderId < ShaderCount; shaderId++) {
		GLuint shader =
			glCreateShader(shaderId < VertexShaderCount ? GL_VERTEX_SHADER
		                                                : GL_FRAGMENT_SHADER);
		if (shader == 0) {
			FAIL("Could not create shader.");
		}
		Shaders[shaderId].shader = shader;
	}

	// Create shader program objects and attach shaders.
	for (int programId = 0; programId < ProgramCount; programId++) {
		GLuint program = glCreateProgram();
		if (program == 0) {
			FAIL("Could not create program.");
		}
		Programs[programId] = program;
		const ProgramSpec &spec = ProgramSpecs[programId];
		glAttachShader(program, Shaders[spec.vertex].shader);
		glAttachShader(program, Shaders[spec.fragment].shader);
	}

	// Figure out where shader source code is coming from.
	if (var::ProjectPath.get().empty()) {
		LOG(Info, "Using embedded shaders.");
		CompileEmbedded();
	} else {
		LOG(Info, "Loading shaders from project.",
		    log::Attr{"path", var::ProjectPath.get()});
		CompileFiles();
	}
	LinkPrograms();

	// The programs keep working without the shader objects.
	for (int programId = 0; programId < ProgramCount; programId++) {
		const GLuint program = Programs[programId];
		const ProgramSpec &spec = ProgramSpecs[programId];
		glDetachShader(program, Shaders[spec.vertex].shader);
		glDetachShader(program, Shaders[spec.fragment].shader);
	}
	for (Shader &shader : Shaders) {
		glDeleteShader(shader.shader);
		shader.shader = 0;
	}
}

GLuint Program(ProgramId id) {
	return Programs[static_cast<int>(id)];
}

} // namespace gl_shader
} // namespace elastic
