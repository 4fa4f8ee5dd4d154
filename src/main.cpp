// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#include "main.hpp"

#include "gl.hpp"
#include "gl_debug.hpp"
#include "gl_shader.hpp"
#include "log.hpp"
#include "mesh.hpp"
#include "orbit_controls.hpp"
#include "renderer.hpp"
#include "var.hpp"
#include "viewer.hpp"

#define GLFW_INCLUDE_NONE 1
#include <GLFW/glfw3.h>

#include <cstdlib>
#include <optional>
#include <string_view>
#include <utility>

#define FAIL_GLFW(...) FAIL(__VA_ARGS__, GLFWErrorInfo::Get())

namespace elastic {
namespace {

// Information about GLFW errors to add to log messages.
class GLFWErrorInfo {
public:
	static GLFWErrorInfo Get() {
		const char *description;
		int error = glfwGetError(&description);
		if (error == 0) {
			return GLFWErrorInfo{};
		}
		return GLFWErrorInfo{error, description};
	}

	GLFWErrorInfo() : mError{0}, mDescription{} {}
	GLFWErrorInfo(int error, const char *description)
		: mError{error},
		  mDescription{description != nullptr ? description : ""} {}

	void AddToRecord(log::Record &record) const {
		record.Add("domain", "GLFW");
		if (mError != 0) {
			record.Add("error", mError);
			record.Add("description", mDescription);
		}
	}

private:
	int mError;
	std::string_view mDescription;
};

extern "C" void ErrorCallback(int error, const char *description) {
	log::Record{log::Level::Error, log::Location::Zero, "GLFW error.",
	            GLFWErrorInfo{error, description}}
		.Log();
}

// Everything the window callbacks need.
struct App {
	App(int width, int height, scene::MeshData mesh, double startTime)
		: controller{width, height, std::move(mesh), startTime} {}

	viewer::Controller controller;
	render::Renderer renderer;
	scene::OrbitControls controls;
};

App &GetApp(GLFWwindow *window) {
	return *static_cast<App *>(glfwGetWindowUserPointer(window));
}

extern "C" void WindowSizeCallback(GLFWwindow *window, int width,
                                   int height) {
	GetApp(window).controller.OnResize(width, height);
}

extern "C" void FramebufferSizeCallback(GLFWwindow *window, int width,
                                        int height) {
	GetApp(window).renderer.SetSize(width, height);
}

extern "C" void MouseButtonCallback(GLFWwindow *window, int button, int action,
                                    int mods) {
	(void)mods;
	if (button != GLFW_MOUSE_BUTTON_LEFT) {
		return;
	}
	App &app = GetApp(window);
	double x, y;
	glfwGetCursorPos(window, &x, &y);
	if (action == GLFW_PRESS) {
		app.controls.BeginDrag(x, y);
	} else if (action == GLFW_RELEASE) {
		app.controls.EndDrag();
		// Like a DOM click, this fires on release even after a drag.
		int width, height;
		glfwGetWindowSize(window, &width, &height);
		app.controller.OnClick(x, y, width, height, glfwGetTime());
	}
}

extern "C" void CursorPosCallback(GLFWwindow *window, double x, double y) {
	App &app = GetApp(window);
	if (app.controls.is_dragging()) {
		int width, height;
		glfwGetWindowSize(window, &width, &height);
		app.controls.Drag(x, y, height);
	}
}

extern "C" void ScrollCallback(GLFWwindow *window, double xoffset,
                               double yoffset) {
	(void)xoffset;
	GetApp(window).controls.Dolly(yoffset);
}

extern "C" void CharCallback(GLFWwindow *window, unsigned codepoint) {
	GetApp(window).controller.OnKey(static_cast<char32_t>(codepoint));
}

extern "C" void KeyCallback(GLFWwindow *window, int key, int scancode,
                            int action, int mods) {
	(void)scancode;
	(void)mods;
	if (key == GLFW_KEY_ESCAPE && action == GLFW_PRESS) {
		glfwSetWindowShouldClose(window, GLFW_TRUE);
	}
}

void Main() {
	std::optional<scene::MeshData> mesh = scene::MakeNamedMesh(var::Mesh.get());
	if (!mesh.has_value()) {
		FAIL("Unknown mesh.", log::Attr{"mesh", var::Mesh.get()});
	}

	glfwSetErrorCallback(ErrorCallback);
	if (!glfwInit()) {
		FAIL_GLFW("Could not initialize GLFW.");
	}

	// All of these are necessary.
	//
	// - On Apple devices, context will be version 2.1 if no hints are
	//   provided. FORWARD_COMPAT, PROFILE, and VERSION are all required to get
	//   a different result.
	//
	// - On Mesa, 3.0 is the maximum without FORWARD_COMPAT, and 3.1 is the
	//   maximum with FORWARD_COMPAT but without CORE_PROFILE.
	glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GLFW_TRUE);
	glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
	glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
	glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
	glfwWindowHint(GLFW_SAMPLES, 4);

	if (var::DebugContext.get()) {
		glfwWindowHint(GLFW_OPENGL_DEBUG_CONTEXT, GLFW_TRUE);
	}

	GLFWwindow *window =
		glfwCreateWindow(var::WindowWidth.get(), var::WindowHeight.get(),
	                     "Elastic", nullptr, nullptr);
	if (window == nullptr) {
		FAIL_GLFW("Could not create window.");
	}

	glfwMakeContextCurrent(window);
	gl_api::LoadExtensions();
	LOG(Info, "Created OpenGL context.",
	    log::Attr{"version", gl_api::GetString(GL_VERSION)},
	    log::Attr{"renderer", gl_api::GetString(GL_RENDERER)});
	if (var::DebugContext.get()) {
		gl_debug::Init();
	}
	gl_shader::Init();

	int width, height;
	glfwGetWindowSize(window, &width, &height);
	App app{width, height, std::move(*mesh), glfwGetTime()};
	app.renderer.Init(app.controller.mesh(), app.controller.materials());
	glfwGetFramebufferSize(window, &width, &height);
	app.renderer.SetSize(width, height);

	glfwSetWindowUserPointer(window, &app);
	glfwSetWindowSizeCallback(window, WindowSizeCallback);
	glfwSetFramebufferSizeCallback(window, FramebufferSizeCallback);
	glfwSetMouseButtonCallback(window, MouseButtonCallback);
	glfwSetCursorPosCallback(window, CursorPosCallback);
	glfwSetScrollCallback(window, ScrollCallback);
	glfwSetCharCallback(window, CharCallback);
	glfwSetKeyCallback(window, KeyCallback);

	glfwSwapInterval(var::VSync.get() ? 1 : 0);
	LOG(Info, "Press M to switch materials.");

	while (!glfwWindowShouldClose(window)) {
		glfwPollEvents();
		app.controls.Update(app.controller.camera());
		app.controller.OnFrame(glfwGetTime());
		app.renderer.Render(app.controller);
		glfwSwapBuffers(window);
	}

	glfwSetWindowUserPointer(window, nullptr);
	glfwDestroyWindow(window);
	glfwTerminate();
}

} // namespace

[[noreturn]]
void ExitError() {
	glfwTerminate();
	std::exit(1);
}

} // namespace elastic

int main(int argc, char **argv) {
	elastic::log::Init();
	if (argc > 1) {
		elastic::ParseCommandArguments(argc - 1, argv + 1);
	}
	elastic::Main();
	return 0;
}
