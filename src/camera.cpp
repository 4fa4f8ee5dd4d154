// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#include "camera.hpp"

#include <glm/geometric.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <glm/mat4x4.hpp>
#include <glm/matrix.hpp>
#include <glm/trigonometric.hpp>
#include <glm/vec4.hpp>

namespace elastic {
namespace scene {

glm::vec2 ScreenToNDC(double x, double y, double width, double height) {
	return glm::vec2{static_cast<float>((x / width) * 2.0 - 1.0),
	                 static_cast<float>(-(y / height) * 2.0 + 1.0)};
}

PerspectiveCamera::PerspectiveCamera(float fov, float aspect, float nearPlane,
                                     float farPlane)
	: mFov{fov},
	  mAspect{aspect},
	  mNear{nearPlane},
	  mFar{farPlane},
	  mPosition{0.0f},
	  mTarget{0.0f} {}

glm::mat4 PerspectiveCamera::ProjectionMatrix() const {
	return glm::perspective(glm::radians(mFov), mAspect, mNear, mFar);
}

glm::mat4 PerspectiveCamera::ViewMatrix() const {
	return glm::lookAt(mPosition, mTarget, glm::vec3{0.0f, 1.0f, 0.0f});
}

Ray PerspectiveCamera::RayFromNDC(glm::vec2 ndc) const {
	// Unproject a point halfway into the depth range and shoot the ray from
	// the eye through it.
	const glm::mat4 inverse = glm::inverse(ProjectionMatrix() * ViewMatrix());
	glm::vec4 point = inverse * glm::vec4{ndc.x, ndc.y, 0.5f, 1.0f};
	const glm::vec3 world = glm::vec3{point} / point.w;
	return Ray{mPosition, glm::normalize(world - mPosition)};
}

} // namespace scene
} // namespace elastic
