// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#include "viewer.hpp"

#include "log.hpp"

#include <utility>

namespace elastic {
namespace viewer {

namespace uniform = material::uniform;

float DecayElasticity(float elasticity) {
	if (elasticity > ElasticityCutoff) {
		return elasticity - ElasticityDecay * elasticity;
	}
	return 0.0f;
}

State AdvanceFrame(const State &state, double elapsed) {
	State next = state;
	next.elapsed = elapsed;
	next.elasticity = DecayElasticity(state.elasticity);
	return next;
}

State ApplyClick(const State &state, const std::optional<glm::vec3> &hit,
                 double elapsed) {
	State next = state;
	if (hit.has_value()) {
		next.clickPosition = *hit;
		next.clickTime = static_cast<float>(elapsed);
		next.elasticity = 1.0f;
	} else {
		// A running ripple keeps decaying, only the click is cancelled.
		next.clickTime = NoClickTime;
	}
	return next;
}

State ApplyKey(const State &state, char32_t key) {
	State next = state;
	if (key == U'm' || key == U'M') {
		next.activeMaterial =
			(state.activeMaterial + 1) % material::MaterialCount;
	}
	return next;
}

Controller::Controller(int width, int height, scene::MeshData mesh,
                       double startTime)
	: mState{},
	  mStartTime{startTime},
	  mCamera{CameraFov,
              static_cast<float>(width) / static_cast<float>(height),
              CameraNear, CameraFar},
	  mMesh{std::move(mesh)},
	  mMaterials{} {
	CHECK(width > 0 && height > 0);
	mCamera.SetPosition(glm::vec3{0.0f, 0.0f, CameraDistance});
	mCamera.LookAt(glm::vec3{0.0f});
	mMaterials = material::MakeMaterials(material::MaterialInit{
		glm::vec2{static_cast<float>(width), static_cast<float>(height)},
		mCamera.position()});
	WriteUniforms();
}

void Controller::OnFrame(double now) {
	mState = AdvanceFrame(mState, now - mStartTime);
	WriteUniforms();
}

void Controller::OnResize(int width, int height) {
	if (width <= 0 || height <= 0) {
		return;
	}
	mCamera.SetAspect(static_cast<float>(width) / static_cast<float>(height));
	const glm::vec2 resolution{static_cast<float>(width),
	                           static_cast<float>(height)};
	for (material::Material &material : mMaterials) {
		material.uniforms.Set(uniform::Resolution, resolution);
	}
}

void Controller::OnClick(double x, double y, double width, double height,
                         double now) {
	if (width <= 0.0 || height <= 0.0) {
		return;
	}
	const scene::Ray ray =
		mCamera.RayFromNDC(scene::ScreenToNDC(x, y, width, height));
	const std::optional<scene::RayHit> hit = scene::Raycast(mMesh, ray);
	OnClickResult(hit.has_value() ? std::optional<glm::vec3>{hit->point}
	                              : std::nullopt,
	              now);
}

void Controller::OnClickResult(const std::optional<glm::vec3> &hit,
                               double now) {
	const double elapsed = now - mStartTime;
	mState = ApplyClick(mState, hit, elapsed);
	if (hit.has_value()) {
		LOG(Debug, "Click hit mesh.", log::Attr{"point", *hit},
		    log::Attr{"time", elapsed});
	} else {
		LOG(Debug, "Click missed mesh.", log::Attr{"time", elapsed});
	}
	WriteUniforms();
}

void Controller::OnKey(char32_t key) {
	const int previous = mState.activeMaterial;
	mState = ApplyKey(mState, key);
	if (mState.activeMaterial != previous) {
		LOG(Info, "Material changed.", log::Attr{"index", mState.activeMaterial},
		    log::Attr{"material", activeMaterial().name});
	}
}

void Controller::WriteUniforms() {
	const float time = static_cast<float>(mState.elapsed);
	for (material::Material &material : mMaterials) {
		material::UniformSet &uniforms = material.uniforms;
		uniforms.Set(uniform::Time, time);
		uniforms.Set(uniform::CameraPosition, mCamera.position());
		uniforms.Set(uniform::Elasticity, mState.elasticity);
		uniforms.Set(uniform::ClickTime, mState.clickTime);
		uniforms.Set(uniform::ClickPosition, mState.clickPosition);
	}
}

} // namespace viewer
} // namespace elastic
