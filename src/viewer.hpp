// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#pragma once

#include "camera.hpp"
#include "material.hpp"
#include "mesh.hpp"

#include <glm/vec3.hpp>

#include <array>
#include <optional>
#include <span>

namespace elastic {
namespace viewer {

// Click time when no click ripple is active.
constexpr float NoClickTime = -1.0f;

// Elasticity loses this fraction of its value each frame.
constexpr float ElasticityDecay = 0.02f;

// Elasticity at or below this value snaps to zero.
constexpr float ElasticityCutoff = 0.001f;

// Camera parameters.
constexpr float CameraFov = 75.0f;
constexpr float CameraNear = 0.1f;
constexpr float CameraFar = 1000.0f;
constexpr float CameraDistance = 9.0f;

// Interaction state of the viewer.
struct State {
	double elapsed = 0.0;      // Seconds since start.
	float elasticity = 0.0f;   // In 0-1, decays toward zero.
	float clickTime = NoClickTime;
	glm::vec3 clickPosition{-1.0f, -1.0f, -1.0f};
	int activeMaterial = 0;    // Index into the material list.
};

// Return the elasticity after one frame of decay. Never negative.
float DecayElasticity(float elasticity);

// Return the state after a frame tick at the given elapsed time.
State AdvanceFrame(const State &state, double elapsed);

// Return the state after a click. The hit is the point where the click ray
// meets the mesh, or nullopt if it missed. The elapsed time is the time of
// the click, not the time of the last frame.
State ApplyClick(const State &state, const std::optional<glm::vec3> &hit,
                 double elapsed);

// Return the state after a key press. The key is a Unicode code point.
State ApplyKey(const State &state, char32_t key);

// Owns the viewer state, camera, mesh and materials, and writes the state
// into the material uniforms after every event. Has no dependency on the
// graphics API, the renderer reads from it.
class Controller {
public:
	// Set up the camera and materials for a window of the given size. The
	// start time is the clock value corresponding to elapsed time zero.
	Controller(int width, int height, scene::MeshData mesh, double startTime);

	Controller(const Controller &) = delete;
	Controller &operator=(const Controller &) = delete;

	// Advance to the given clock time.
	void OnFrame(double now);

	// Handle a change in window size, in the same units as click positions.
	// Zero sizes are ignored.
	void OnResize(int width, int height);

	// Handle a click at a position in window coordinates, at the given clock
	// time.
	void OnClick(double x, double y, double width, double height, double now);

	// Handle the result of a click's raycast.
	void OnClickResult(const std::optional<glm::vec3> &hit, double now);

	// Handle a key press. The key is a Unicode code point.
	void OnKey(char32_t key);

	const State &state() const { return mState; }
	const scene::PerspectiveCamera &camera() const { return mCamera; }
	scene::PerspectiveCamera &camera() { return mCamera; }
	const scene::MeshData &mesh() const { return mMesh; }
	std::span<const material::Material> materials() const {
		return mMaterials;
	}
	const material::Material &activeMaterial() const {
		return mMaterials[mState.activeMaterial];
	}

private:
	// Write the state into every material which declares the uniform.
	void WriteUniforms();

	State mState;
	double mStartTime;
	scene::PerspectiveCamera mCamera;
	scene::MeshData mMesh;
	std::array<material::Material, material::MaterialCount> mMaterials;
};

} // namespace viewer
} // namespace elastic
