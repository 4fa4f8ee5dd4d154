// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#pragma once

// This file provides the OpenGL API.

#if __APPLE__

// ============================================================================
// macOS
// ============================================================================

// On macOS, an OpenGL loader is not necessary. We can just get the definitions
// directly from the OpenGL framework.

// OpenGL is deprecated on macOS. We don't care. This silences the warnings.
#define GL_SILENCE_DEPRECATION 1

#include <OpenGL/gl3.h> // IWYU pragma: export

#else

// ============================================================================
// Linux
// ============================================================================

// The GL library exports every core profile entry point, so no loader is
// needed here either. Only core profile declarations are visible.

#define GL_GLEXT_PROTOTYPES 1

#include <GL/glcorearb.h> // IWYU pragma: export

#endif

#include <string_view>

namespace elastic {
namespace gl_api {

// OpenGL extensions that the program checks for.
enum class Extension {
	KHR_debug,
};

// Query which extensions are available. Requires a current context.
void LoadExtensions();

// Return true if the extension was reported by the driver.
bool HasExtension(Extension extension);

// Return a string from glGetString, or an empty string.
std::string_view GetString(GLenum name);

} // namespace gl_api
} // namespace elastic
