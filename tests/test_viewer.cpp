// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#include "test_support.hpp"
#include "viewer.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <optional>
#include <string_view>

using namespace elastic;
using namespace elastic::viewer;
using Catch::Matchers::WithinAbs;

namespace uniform = elastic::material::uniform;

namespace {

const material::UniformSet &Uniforms(const Controller &controller, int index) {
	return controller.materials()[index].uniforms;
}

float WaveFloat(const Controller &controller, std::string_view name) {
	return Uniforms(controller, material::WaveIndex).GetFloat(name).value();
}

} // namespace

// =============================================================================
// State transitions
// =============================================================================

TEST_CASE("Elasticity decay", "[viewer][elasticity]") {
	SECTION("zero stays zero") {
		REQUIRE(DecayElasticity(0.0f) == 0.0f);
	}

	SECTION("loses two percent per frame") {
		REQUIRE_THAT(DecayElasticity(1.0f), WithinAbs(0.98, 1e-6));
		REQUIRE_THAT(DecayElasticity(0.5f), WithinAbs(0.49, 1e-6));
	}

	SECTION("snaps to zero at the cutoff") {
		REQUIRE(DecayElasticity(ElasticityCutoff) == 0.0f);
		REQUIRE(DecayElasticity(0.0005f) == 0.0f);
		REQUIRE(DecayElasticity(0.0011f) > 0.0f);
	}

	SECTION("decreases monotonically and reaches exactly zero") {
		float elasticity = 1.0f;
		int ticks = 0;
		while (elasticity > 0.0f) {
			const float next = DecayElasticity(elasticity);
			REQUIRE(next < elasticity);
			REQUIRE(next >= 0.0f);
			elasticity = next;
			ticks++;
			REQUIRE(ticks < 1000);
		}
		// 0.98^n falls below the cutoff after about 342 frames.
		REQUIRE(ticks > 340);
		REQUIRE(ticks < 346);
	}
}

TEST_CASE("Frame tick", "[viewer]") {
	State state;
	state.elasticity = 1.0f;
	const State next = AdvanceFrame(state, 1.25);
	REQUIRE(next.elapsed == 1.25);
	REQUIRE_THAT(next.elasticity, WithinAbs(0.98, 1e-6));
	REQUIRE(next.clickTime == state.clickTime);
	REQUIRE(next.activeMaterial == state.activeMaterial);
}

TEST_CASE("Click transitions", "[viewer][click]") {
	State state;
	state.elasticity = 0.25f;
	state.activeMaterial = 1;

	SECTION("hit starts a ripple") {
		const State next = ApplyClick(state, glm::vec3{1.0f, 2.0f, 3.0f}, 2.0);
		REQUIRE(next.elasticity == 1.0f);
		REQUIRE(next.clickTime == 2.0f);
		REQUIRE(next.clickPosition == glm::vec3{1.0f, 2.0f, 3.0f});
		REQUIRE(next.activeMaterial == 1);
	}

	SECTION("miss only clears the click time") {
		State hit = ApplyClick(state, glm::vec3{1.0f, 2.0f, 3.0f}, 2.0);
		hit.elasticity = 0.5f;
		const State next = ApplyClick(hit, std::nullopt, 3.0);
		REQUIRE(next.clickTime == NoClickTime);
		REQUIRE(next.elasticity == 0.5f);
		REQUIRE(next.clickPosition == glm::vec3{1.0f, 2.0f, 3.0f});
	}
}

TEST_CASE("Key transitions", "[viewer][key]") {
	State state;

	SECTION("m cycles through the materials") {
		const State once = ApplyKey(state, U'm');
		REQUIRE(once.activeMaterial == material::CreativeIndex);
		const State twice = ApplyKey(once, U'm');
		REQUIRE(twice.activeMaterial == material::WaveIndex);
	}

	SECTION("upper case M works too") {
		REQUIRE(ApplyKey(state, U'M').activeMaterial == 1);
	}

	SECTION("other keys do nothing") {
		for (const char32_t key : {U'n', U'x', U' ', U'1', U'µ'}) {
			REQUIRE(ApplyKey(state, key).activeMaterial == 0);
		}
	}
}

// =============================================================================
// Controller
// =============================================================================

TEST_CASE("Controller startup", "[viewer][controller]") {
	Controller controller{800, 600, scene::MakeBox(4.0f, 4.0f, 4.0f), 10.0};

	REQUIRE(controller.state().elapsed == 0.0);
	REQUIRE(controller.state().elasticity == 0.0f);
	REQUIRE(controller.state().clickTime == NoClickTime);
	REQUIRE(controller.state().activeMaterial == 0);
	REQUIRE(controller.activeMaterial().name == "wave");

	const scene::PerspectiveCamera &camera = controller.camera();
	REQUIRE(camera.position() == glm::vec3{0.0f, 0.0f, CameraDistance});
	REQUIRE(camera.target() == glm::vec3{0.0f});
	REQUIRE(camera.fov() == CameraFov);
	REQUIRE_THAT(camera.aspect(), WithinAbs(800.0 / 600.0, 1e-6));

	for (int i = 0; i < material::MaterialCount; i++) {
		const material::UniformSet &uniforms = Uniforms(controller, i);
		REQUIRE(uniforms.GetVec2(uniform::Resolution) ==
		        glm::vec2{800.0f, 600.0f});
		REQUIRE(uniforms.GetVec3(uniform::CameraPosition) ==
		        glm::vec3{0.0f, 0.0f, CameraDistance});
	}
}

TEST_CASE("Controller frames", "[viewer][controller]") {
	Controller controller{800, 600, scene::MakeBox(4.0f, 4.0f, 4.0f), 10.0};

	SECTION("time reaches every material") {
		controller.OnFrame(10.5);
		REQUIRE(controller.state().elapsed == 0.5);
		for (int i = 0; i < material::MaterialCount; i++) {
			REQUIRE(Uniforms(controller, i).GetFloat(uniform::Time) == 0.5f);
		}
		REQUIRE(WaveFloat(controller, uniform::Elasticity) == 0.0f);
	}

	SECTION("camera movement reaches the uniforms") {
		controller.camera().SetPosition(glm::vec3{9.0f, 0.0f, 0.0f});
		controller.OnFrame(11.0);
		REQUIRE(Uniforms(controller, material::CreativeIndex)
		            .GetVec3(uniform::CameraPosition) ==
		        glm::vec3{9.0f, 0.0f, 0.0f});
	}
}

TEST_CASE("Controller clicks", "[viewer][controller][click]") {
	Controller controller{800, 600, scene::MakeBox(4.0f, 4.0f, 4.0f), 10.0};

	SECTION("hit writes the ripple uniforms") {
		controller.OnClickResult(glm::vec3{1.0f, 2.0f, 3.0f}, 12.0);
		REQUIRE(controller.state().elasticity == 1.0f);
		REQUIRE(WaveFloat(controller, uniform::Elasticity) == 1.0f);
		REQUIRE(WaveFloat(controller, uniform::ClickTime) == 2.0f);
		REQUIRE(Uniforms(controller, material::WaveIndex)
		            .GetVec3(uniform::ClickPosition) ==
		        glm::vec3{1.0f, 2.0f, 3.0f});
	}

	SECTION("ripple decays over frames") {
		controller.OnClickResult(glm::vec3{1.0f, 2.0f, 3.0f}, 12.0);
		float previous = WaveFloat(controller, uniform::Elasticity);
		for (int i = 1; i <= 400; i++) {
			controller.OnFrame(12.0 + i / 60.0);
			const float elasticity = WaveFloat(controller, uniform::Elasticity);
			REQUIRE(elasticity <= previous);
			previous = elasticity;
		}
		REQUIRE(previous == 0.0f);
	}

	SECTION("miss clears only the click time") {
		controller.OnClickResult(glm::vec3{1.0f, 2.0f, 3.0f}, 12.0);
		controller.OnFrame(12.5);
		const float elasticity = WaveFloat(controller, uniform::Elasticity);
		controller.OnClickResult(std::nullopt, 13.0);
		REQUIRE(WaveFloat(controller, uniform::ClickTime) == NoClickTime);
		REQUIRE(WaveFloat(controller, uniform::Elasticity) == elasticity);
		REQUIRE(Uniforms(controller, material::WaveIndex)
		            .GetVec3(uniform::ClickPosition) ==
		        glm::vec3{1.0f, 2.0f, 3.0f});
	}

	SECTION("creative material has no ripple uniforms") {
		controller.OnClickResult(glm::vec3{1.0f, 2.0f, 3.0f}, 12.0);
		const material::UniformSet &creative =
			Uniforms(controller, material::CreativeIndex);
		REQUIRE_FALSE(creative.Has(uniform::Elasticity));
		REQUIRE_FALSE(creative.Has(uniform::ClickTime));
		REQUIRE_FALSE(creative.Has(uniform::ClickPosition));
	}

	SECTION("screen click raycasts the mesh") {
		// Slightly up and to the right of center, on the front face.
		controller.OnClick(440.0, 270.0, 800.0, 600.0, 11.0);
		REQUIRE(controller.state().elasticity == 1.0f);
		REQUIRE(controller.state().clickTime == 1.0f);
		const glm::vec3 point = controller.state().clickPosition;
		REQUIRE_THAT(point.z, WithinAbs(2.0, 1e-4));
		REQUIRE(point.x > 0.0f);
		REQUIRE(point.y > 0.0f);
		REQUIRE(point.x < 2.0f);
		REQUIRE(point.y < 2.0f);
	}

	SECTION("screen click in the corner misses") {
		controller.OnClick(0.0, 0.0, 800.0, 600.0, 11.0);
		REQUIRE(controller.state().elasticity == 0.0f);
		REQUIRE(controller.state().clickTime == NoClickTime);
	}
}

TEST_CASE("Controller keys", "[viewer][controller][key]") {
	Controller controller{800, 600, scene::MakeBox(4.0f, 4.0f, 4.0f), 0.0};
	controller.OnKey(U'm');
	REQUIRE(controller.activeMaterial().name == "creative");
	controller.OnKey(U'q');
	REQUIRE(controller.activeMaterial().name == "creative");
	controller.OnKey(U'M');
	REQUIRE(controller.activeMaterial().name == "wave");
}

TEST_CASE("Controller resize", "[viewer][controller]") {
	Controller controller{800, 600, scene::MakeBox(4.0f, 4.0f, 4.0f), 0.0};

	SECTION("updates aspect and resolution") {
		controller.OnResize(1000, 500);
		REQUIRE_THAT(controller.camera().aspect(), WithinAbs(2.0, 1e-6));
		for (int i = 0; i < material::MaterialCount; i++) {
			REQUIRE(Uniforms(controller, i).GetVec2(uniform::Resolution) ==
			        glm::vec2{1000.0f, 500.0f});
		}
	}

	SECTION("ignores zero sizes") {
		controller.OnResize(0, 0);
		REQUIRE_THAT(controller.camera().aspect(),
		             WithinAbs(800.0 / 600.0, 1e-6));
	}

	SECTION("rejects an empty window at startup") {
		REQUIRE_THROWS_AS(
			(Controller{0, 600, scene::MakeBox(1.0f, 1.0f, 1.0f), 0.0}),
			test::FatalError);
	}
}
