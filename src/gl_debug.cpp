// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#include "gl_debug.hpp"

#include "gl.hpp"
#include "log.hpp"

#if GL_KHR_debug

#include <string_view>

namespace elastic {
namespace gl_debug {

namespace {

void APIENTRY DebugCallback(GLenum source, GLenum type, GLuint id,
                            GLenum severity, GLsizei length,
                            const GLchar *message, const void *userParam) {
	(void)source;
	(void)userParam;

	const std::string_view messageText =
		length >= 0
			? std::string_view(message, static_cast<std::size_t>(length))
			: std::string_view{message};

	log::Level level;
	switch (severity) {
	default:
	case GL_DEBUG_SEVERITY_HIGH:
		level = log::Level::Error;
		break;
	case GL_DEBUG_SEVERITY_MEDIUM:
		level = log::Level::Warn;
		break;
	case GL_DEBUG_SEVERITY_LOW:
		level = log::Level::Info;
		break;
	case GL_DEBUG_SEVERITY_NOTIFICATION:
		level = log::Level::Debug;
		break;
	}

	log::Record{level, log::Location::Zero, "OpenGL",
	            log::Attr{"message", messageText}, log::Attr{"type", type},
	            log::Attr{"id", id}}
		.Log();
}

} // namespace

void Init() {
	if (!gl_api::HasExtension(gl_api::Extension::KHR_debug)) {
		LOG(Info, "KHR_debug not supported by driver.");
		return;
	}

	LOG(Info, "Using KHR_debug.");
	glDebugMessageCallback(DebugCallback, nullptr);
	glDebugMessageControl(GL_DONT_CARE, GL_DONT_CARE, GL_DONT_CARE, 0, nullptr,
	                      GL_TRUE);
	glEnable(GL_DEBUG_OUTPUT);
	glEnable(GL_DEBUG_OUTPUT_SYNCHRONOUS);
}

} // namespace gl_debug
} // namespace elastic

#else

namespace elastic {
namespace gl_debug {

void Init() {
	LOG(Debug, "KHR_debug not available.");
}

} // namespace gl_debug
} // namespace elastic

#endif
