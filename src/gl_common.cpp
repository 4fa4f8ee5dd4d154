// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#include "gl.hpp"

#include <array>
#include <cstring>

namespace elastic {
namespace gl_api {

namespace {

// Names of the extensions in Extension, in the same order.
constexpr std::array<std::string_view, 1> ExtensionNames = {
	"GL_KHR_debug",
};

std::array<bool, ExtensionNames.size()> ExtensionAvailable;

} // namespace

void LoadExtensions() {
	ExtensionAvailable.fill(false);
	int extensionCount = 0;
	glGetIntegerv(GL_NUM_EXTENSIONS, &extensionCount);
	for (int i = 0; i < extensionCount; i++) {
		const char *const ptr = reinterpret_cast<const char *>(
			glGetStringi(GL_EXTENSIONS, static_cast<GLuint>(i)));
		if (ptr == nullptr) {
			continue;
		}
		const std::string_view name{ptr, std::strlen(ptr)};
		for (std::size_t j = 0; j < ExtensionNames.size(); j++) {
			if (ExtensionNames[j] == name) {
				ExtensionAvailable[j] = true;
			}
		}
	}
}

bool HasExtension(Extension extension) {
	return ExtensionAvailable[static_cast<std::size_t>(extension)];
}

std::string_view GetString(GLenum name) {
	const char *ptr = reinterpret_cast<const char *>(glGetString(name));
	return ptr != nullptr ? std::string_view{ptr} : std::string_view{};
}

} // namespace gl_api
} // namespace elastic
