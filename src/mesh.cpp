// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#include "mesh.hpp"

#include "log.hpp"

#include <glm/geometric.hpp>

#include <cmath>
#include <limits>
#include <numbers>

namespace elastic {
namespace scene {

namespace {

// Parameters for one face of a box. The face spans u and v, and faces
// toward the normal.
struct BoxFace {
	glm::vec3 normal;
	glm::vec3 u;
	glm::vec3 v;
};

const BoxFace BoxFaces[6] = {
	{{+1, 0, 0}, {0, 0, -1}, {0, 1, 0}}, // +x
	{{-1, 0, 0}, {0, 0, +1}, {0, 1, 0}}, // -x
	{{0, +1, 0}, {1, 0, 0}, {0, 0, -1}}, // +y
	{{0, -1, 0}, {1, 0, 0}, {0, 0, +1}}, // -y
	{{0, 0, +1}, {1, 0, 0}, {0, 1, 0}},  // +z
	{{0, 0, -1}, {-1, 0, 0}, {0, 1, 0}}, // -z
};

constexpr int MaxVertexCount = std::numeric_limits<unsigned short>::max();

} // namespace

MeshData MakeBox(float width, float height, float depth) {
	const glm::vec3 half{width * 0.5f, height * 0.5f, depth * 0.5f};
	MeshData mesh;
	mesh.vertices.reserve(6 * 4);
	mesh.indices.reserve(6 * 6);
	for (const BoxFace &face : BoxFaces) {
		const auto base = static_cast<unsigned short>(mesh.vertices.size());
		for (int j = 0; j < 2; j++) {
			for (int i = 0; i < 2; i++) {
				const float s = i == 0 ? -1.0f : 1.0f;
				const float t = j == 0 ? -1.0f : 1.0f;
				const glm::vec3 position =
					(face.normal + s * face.u + t * face.v) * half;
				mesh.vertices.push_back(Vertex{
					position, face.normal,
					glm::vec2{static_cast<float>(i), static_cast<float>(j)}});
			}
		}
		// Vertices are (0,0), (1,0), (0,1), (1,1) in face coordinates.
		const unsigned short quad[6] = {0, 1, 3, 0, 3, 2};
		for (const unsigned short index : quad) {
			mesh.indices.push_back(static_cast<unsigned short>(base + index));
		}
	}
	return mesh;
}

MeshData MakeSphere(float radius, int widthSegments, int heightSegments) {
	CHECK(widthSegments >= 3 && heightSegments >= 2);
	const int rowSize = widthSegments + 1;
	CHECK(rowSize * (heightSegments + 1) <= MaxVertexCount);
	constexpr float pi = std::numbers::pi_v<float>;

	MeshData mesh;
	mesh.vertices.reserve(rowSize * (heightSegments + 1));
	for (int y = 0; y <= heightSegments; y++) {
		const float v = static_cast<float>(y) / heightSegments;
		const float theta = v * pi;
		for (int x = 0; x <= widthSegments; x++) {
			const float u = static_cast<float>(x) / widthSegments;
			const float phi = u * 2.0f * pi;
			const glm::vec3 normal{-std::cos(phi) * std::sin(theta),
			                       std::cos(theta),
			                       std::sin(phi) * std::sin(theta)};
			mesh.vertices.push_back(
				Vertex{normal * radius, normal, glm::vec2{u, 1.0f - v}});
		}
	}

	// The first and last rows are the poles, which only need one triangle
	// per segment.
	for (int y = 0; y < heightSegments; y++) {
		for (int x = 0; x < widthSegments; x++) {
			const auto a = static_cast<unsigned short>(y * rowSize + x + 1);
			const auto b = static_cast<unsigned short>(y * rowSize + x);
			const auto c = static_cast<unsigned short>((y + 1) * rowSize + x);
			const auto d =
				static_cast<unsigned short>((y + 1) * rowSize + x + 1);
			if (y != 0) {
				mesh.indices.insert(mesh.indices.end(), {a, b, d});
			}
			if (y != heightSegments - 1) {
				mesh.indices.insert(mesh.indices.end(), {b, c, d});
			}
		}
	}
	return mesh;
}

std::optional<MeshData> MakeNamedMesh(std::string_view name) {
	if (name == "box") {
		return MakeBox(4.0f, 4.0f, 4.0f);
	}
	if (name == "sphere") {
		return MakeSphere(3.0f, 32, 32);
	}
	return std::nullopt;
}

std::optional<RayHit> Raycast(const MeshData &mesh, const Ray &ray) {
	// Möller-Trumbore, without back face culling.
	constexpr float epsilon = 1e-7f;
	std::optional<RayHit> nearest;
	for (std::size_t i = 0; i + 2 < mesh.indices.size(); i += 3) {
		const glm::vec3 &p0 = mesh.vertices[mesh.indices[i]].position;
		const glm::vec3 &p1 = mesh.vertices[mesh.indices[i + 1]].position;
		const glm::vec3 &p2 = mesh.vertices[mesh.indices[i + 2]].position;
		const glm::vec3 edge1 = p1 - p0;
		const glm::vec3 edge2 = p2 - p0;
		const glm::vec3 pvec = glm::cross(ray.direction, edge2);
		const float det = glm::dot(edge1, pvec);
		if (std::abs(det) < epsilon) {
			continue;
		}
		const float invDet = 1.0f / det;
		const glm::vec3 tvec = ray.origin - p0;
		const float u = glm::dot(tvec, pvec) * invDet;
		if (u < 0.0f || u > 1.0f) {
			continue;
		}
		const glm::vec3 qvec = glm::cross(tvec, edge1);
		const float v = glm::dot(ray.direction, qvec) * invDet;
		if (v < 0.0f || u + v > 1.0f) {
			continue;
		}
		const float t = glm::dot(edge2, qvec) * invDet;
		if (t < 0.0f) {
			continue;
		}
		if (!nearest.has_value() || t < nearest->distance) {
			nearest = RayHit{t, ray.origin + t * ray.direction};
		}
	}
	return nearest;
}

} // namespace scene
} // namespace elastic
