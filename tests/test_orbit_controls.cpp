// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#include "orbit_controls.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <glm/geometric.hpp>

#include <cmath>
#include <numbers>

using namespace elastic::scene;
using Catch::Matchers::WithinAbs;

namespace {

PerspectiveCamera MakeCamera() {
	PerspectiveCamera camera{75.0f, 1.0f, 0.1f, 1000.0f};
	camera.SetPosition(glm::vec3{0.0f, 0.0f, 9.0f});
	camera.LookAt(glm::vec3{0.0f});
	return camera;
}

} // namespace

TEST_CASE("Orbit controls without input", "[orbit]") {
	PerspectiveCamera camera = MakeCamera();
	OrbitControls controls;
	controls.Update(camera);
	REQUIRE_THAT(camera.position().x, WithinAbs(0.0, 1e-5));
	REQUIRE_THAT(camera.position().y, WithinAbs(0.0, 1e-5));
	REQUIRE_THAT(camera.position().z, WithinAbs(9.0, 1e-5));
	REQUIRE(camera.target() == glm::vec3{0.0f});
}

TEST_CASE("Orbit controls drag", "[orbit]") {
	PerspectiveCamera camera = MakeCamera();
	OrbitControls controls;

	SECTION("motion is damped and converges") {
		controls.BeginDrag(0.0, 0.0);
		REQUIRE(controls.is_dragging());
		// A sixth of the viewport height is a sixth of a turn.
		controls.Drag(100.0, 0.0, 600.0);
		controls.EndDrag();
		REQUIRE_FALSE(controls.is_dragging());

		controls.Update(camera);
		const float first = std::atan2(camera.position().x, camera.position().z);
		REQUIRE_THAT(first, WithinAbs(-std::numbers::pi / 3.0 * 0.05, 1e-5));

		for (int i = 0; i < 500; i++) {
			controls.Update(camera);
			REQUIRE_THAT(glm::length(camera.position()), WithinAbs(9.0, 1e-3));
		}
		REQUIRE_THAT(camera.position().x,
		             WithinAbs(-9.0 * std::sin(std::numbers::pi / 3.0), 1e-3));
		REQUIRE_THAT(camera.position().z,
		             WithinAbs(9.0 * std::cos(std::numbers::pi / 3.0), 1e-3));
	}

	SECTION("motion without a drag is ignored") {
		controls.Drag(100.0, 100.0, 600.0);
		controls.Update(camera);
		REQUIRE_THAT(camera.position().z, WithinAbs(9.0, 1e-5));
	}

	SECTION("polar angle stays away from the poles") {
		controls.BeginDrag(0.0, 0.0);
		controls.Drag(0.0, -100000.0, 600.0);
		controls.EndDrag();
		controls.Update(camera);
		REQUIRE(camera.position().y < -8.99f);
		REQUIRE(camera.position().y > -9.0f);
		REQUIRE_THAT(glm::length(camera.position()), WithinAbs(9.0, 1e-3));
	}
}

TEST_CASE("Orbit controls dolly", "[orbit]") {
	PerspectiveCamera camera = MakeCamera();
	OrbitControls controls;

	controls.Dolly(1.0);
	controls.Update(camera);
	REQUIRE_THAT(glm::length(camera.position()), WithinAbs(8.55, 1e-4));

	// The scale applies once.
	controls.Update(camera);
	REQUIRE_THAT(glm::length(camera.position()), WithinAbs(8.55, 1e-4));

	controls.Dolly(-2.0);
	controls.Update(camera);
	REQUIRE_THAT(glm::length(camera.position()),
	             WithinAbs(8.55 / (0.95 * 0.95), 1e-3));
}
