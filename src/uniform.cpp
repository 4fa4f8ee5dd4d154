// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#include "uniform.hpp"

#include "log.hpp"

namespace elastic {
namespace material {

namespace {

template <typename T>
std::optional<T> GetAs(const UniformValue *value) {
	if (value == nullptr) {
		return std::nullopt;
	}
	const T *ptr = std::get_if<T>(value);
	if (ptr == nullptr) {
		return std::nullopt;
	}
	return *ptr;
}

} // namespace

glm::vec3 ColorFromHex(unsigned rgb) {
	return glm::vec3{static_cast<float>((rgb >> 16) & 0xff) / 255.0f,
	                 static_cast<float>((rgb >> 8) & 0xff) / 255.0f,
	                 static_cast<float>(rgb & 0xff) / 255.0f};
}

void UniformSet::Declare(std::string_view name, UniformValue value) {
	CHECK(!Has(name));
	mUniforms.push_back(Uniform{std::string{name}, value});
}

bool UniformSet::Set(std::string_view name, UniformValue value) {
	Uniform *uniform = FindMutable(name);
	if (uniform == nullptr) {
		return false;
	}
	if (uniform->value.index() != value.index()) {
		FAIL("Uniform type mismatch.", log::Attr{"uniform", name});
	}
	uniform->value = value;
	return true;
}

const UniformValue *UniformSet::Find(std::string_view name) const {
	for (const Uniform &uniform : mUniforms) {
		if (uniform.name == name) {
			return &uniform.value;
		}
	}
	return nullptr;
}

Uniform *UniformSet::FindMutable(std::string_view name) {
	for (Uniform &uniform : mUniforms) {
		if (uniform.name == name) {
			return &uniform;
		}
	}
	return nullptr;
}

std::optional<float> UniformSet::GetFloat(std::string_view name) const {
	return GetAs<float>(Find(name));
}

std::optional<glm::vec2> UniformSet::GetVec2(std::string_view name) const {
	return GetAs<glm::vec2>(Find(name));
}

std::optional<glm::vec3> UniformSet::GetVec3(std::string_view name) const {
	return GetAs<glm::vec3>(Find(name));
}

} // namespace material
} // namespace elastic
