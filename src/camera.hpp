// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#pragma once

#include <glm/mat4x4.hpp>
#include <glm/vec2.hpp>
#include <glm/vec3.hpp>

namespace elastic {
namespace scene {

// A ray in world space. The direction is normalized.
struct Ray {
	glm::vec3 origin;
	glm::vec3 direction;
};

// Convert a position in window coordinates (origin at top left, y down) to
// normalized device coordinates (origin at center, y up, range -1 to +1).
glm::vec2 ScreenToNDC(double x, double y, double width, double height);

// Perspective camera which looks at a target point.
class PerspectiveCamera {
public:
	// Field of view is vertical, in degrees.
	PerspectiveCamera(float fov, float aspect, float nearPlane, float farPlane);

	float fov() const { return mFov; }
	float aspect() const { return mAspect; }
	float nearPlane() const { return mNear; }
	float farPlane() const { return mFar; }
	const glm::vec3 &position() const { return mPosition; }
	const glm::vec3 &target() const { return mTarget; }

	void SetAspect(float aspect) { mAspect = aspect; }
	void SetPosition(const glm::vec3 &position) { mPosition = position; }
	void LookAt(const glm::vec3 &target) { mTarget = target; }

	glm::mat4 ProjectionMatrix() const;
	glm::mat4 ViewMatrix() const;

	// Get the ray from the camera through a point in normalized device
	// coordinates.
	Ray RayFromNDC(glm::vec2 ndc) const;

private:
	float mFov;
	float mAspect;
	float mNear;
	float mFar;
	glm::vec3 mPosition;
	glm::vec3 mTarget;
};

} // namespace scene
} // namespace elastic
