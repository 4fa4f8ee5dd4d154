// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#pragma once

#include "camera.hpp"

#include <glm/vec2.hpp>
#include <glm/vec3.hpp>

#include <optional>
#include <string_view>
#include <vector>

namespace elastic {
namespace scene {

struct Vertex {
	glm::vec3 position;
	glm::vec3 normal;
	glm::vec2 uv;
};

// Indexed triangle list.
struct MeshData {
	std::vector<Vertex> vertices;
	std::vector<unsigned short> indices;
};

// Create an axis-aligned box centered on the origin, with one quad per face.
MeshData MakeBox(float width, float height, float depth);

// Create a UV sphere centered on the origin. The poles are on the Y axis.
MeshData MakeSphere(float radius, int widthSegments, int heightSegments);

// Create the mesh with the given name ("box" or "sphere"). Returns nullopt
// for unknown names.
std::optional<MeshData> MakeNamedMesh(std::string_view name);

// Intersection of a ray with a mesh.
struct RayHit {
	float distance;
	glm::vec3 point;
};

// Find the nearest intersection of a ray with the mesh triangles. Both sides
// of each triangle are hit.
std::optional<RayHit> Raycast(const MeshData &mesh, const Ray &ray);

} // namespace scene
} // namespace elastic
