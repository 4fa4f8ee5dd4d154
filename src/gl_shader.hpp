// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#pragma once

#include "gl.hpp"
#include "gl_shader_data.hpp"

namespace elastic {
namespace gl_shader {

// Compile all OpenGL shader programs. Shaders come from the ProjectPath
// directory if it is set, otherwise from the executable.
void Init();

// Get a linked shader program. Valid after Init.
GLuint Program(ProgramId id);

} // namespace gl_shader
} // namespace elastic
