// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#pragma once

#include "camera.hpp"

namespace elastic {
namespace scene {

// Mouse-driven camera orbit around a target point, with damping. Input
// accumulates rotation and dolly deltas; Update applies a fraction of them
// to the camera each frame.
class OrbitControls {
public:
	// Fraction of the remaining motion applied per update.
	static constexpr float DampingFactor = 0.05f;
	// Polar angle is kept this far from the poles, in radians.
	static constexpr float PolarMargin = 1e-3f;

	OrbitControls();

	bool is_dragging() const { return mDragging; }

	// Start a rotation drag at a position in window coordinates.
	void BeginDrag(double x, double y);
	// Continue a drag. The rotation is scaled so that dragging the full
	// viewport height rotates a full turn.
	void Drag(double x, double y, double viewportHeight);
	void EndDrag();

	// Dolly in (positive steps) or out (negative steps), as from a scroll
	// wheel.
	void Dolly(double steps);

	// Move the camera by the damped deltas and point it at the target.
	void Update(PerspectiveCamera &camera);

private:
	bool mDragging;
	double mLastX;
	double mLastY;
	float mThetaDelta;
	float mPhiDelta;
	float mScale;
};

} // namespace scene
} // namespace elastic
