// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#include "orbit_controls.hpp"

#include <glm/geometric.hpp>

#include <algorithm>
#include <cmath>
#include <numbers>

namespace elastic {
namespace scene {

namespace {

constexpr float Pi = std::numbers::pi_v<float>;

// Dolly scale per scroll step.
constexpr double DollyStep = 0.95;

} // namespace

OrbitControls::OrbitControls()
	: mDragging{false},
	  mLastX{0.0},
	  mLastY{0.0},
	  mThetaDelta{0.0f},
	  mPhiDelta{0.0f},
	  mScale{1.0f} {}

void OrbitControls::BeginDrag(double x, double y) {
	mDragging = true;
	mLastX = x;
	mLastY = y;
}

void OrbitControls::Drag(double x, double y, double viewportHeight) {
	if (!mDragging || viewportHeight <= 0.0) {
		return;
	}
	const double scale = 2.0 * std::numbers::pi / viewportHeight;
	mThetaDelta -= static_cast<float>((x - mLastX) * scale);
	mPhiDelta -= static_cast<float>((y - mLastY) * scale);
	mLastX = x;
	mLastY = y;
}

void OrbitControls::EndDrag() {
	mDragging = false;
}

void OrbitControls::Dolly(double steps) {
	mScale *= static_cast<float>(std::pow(DollyStep, steps));
}

void OrbitControls::Update(PerspectiveCamera &camera) {
	const glm::vec3 target = camera.target();
	const glm::vec3 offset = camera.position() - target;
	float radius = glm::length(offset);
	float theta = 0.0f;
	float phi = Pi * 0.5f;
	if (radius > 0.0f) {
		theta = std::atan2(offset.x, offset.z);
		phi = std::acos(std::clamp(offset.y / radius, -1.0f, 1.0f));
	}

	theta += mThetaDelta * DampingFactor;
	phi += mPhiDelta * DampingFactor;
	phi = std::clamp(phi, PolarMargin, Pi - PolarMargin);
	radius *= mScale;

	const float sinPhi = std::sin(phi);
	camera.SetPosition(target + radius * glm::vec3{sinPhi * std::sin(theta),
	                                               std::cos(phi),
	                                               sinPhi * std::cos(theta)});
	camera.LookAt(target);

	mThetaDelta *= 1.0f - DampingFactor;
	mPhiDelta *= 1.0f - DampingFactor;
	mScale = 1.0f;
}

} // namespace scene
} // namespace elastic
