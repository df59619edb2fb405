/**
 * @file TerrainMesh.cpp
 * @brief Implementation of the indexed triangle mesh
 */

#include "TerrainMesh.hpp"
#include <algorithm>
#include <limits>

namespace terrain3d {

TerrainMesh::TerrainMesh() : logger_("TerrainMesh") {
}

VertexId TerrainMesh::add_vertex(const Point3D& vertex) {
    if (vertices_.size() >= std::numeric_limits<VertexId>::max()) {
        throw std::length_error("TerrainMesh vertex limit exceeded");
    }
    vertices_.push_back(vertex);
    return static_cast<VertexId>(vertices_.size() - 1);
}

FaceId TerrainMesh::add_triangle(VertexId v0, VertexId v1, VertexId v2) {
    faces_.push_back(Face{v0, v1, v2});
    return static_cast<FaceId>(faces_.size() - 1);
}

const Point3D& TerrainMesh::get_vertex(VertexId vertex_id) const {
    if (vertex_id >= vertices_.size()) {
        throw std::out_of_range("Vertex ID " + std::to_string(vertex_id) + " out of range");
    }
    return vertices_[vertex_id];
}

const Face& TerrainMesh::get_face(FaceId face_id) const {
    if (face_id >= faces_.size()) {
        throw std::out_of_range("Face ID " + std::to_string(face_id) + " out of range");
    }
    return faces_[face_id];
}

Vector3D TerrainMesh::compute_face_normal(FaceId face_id) const {
    const Face& face = get_face(face_id);
    const Point3D& a = get_vertex(face[0]);
    const Point3D& b = get_vertex(face[1]);
    const Point3D& c = get_vertex(face[2]);

    return Vector3D(a, b).cross(Vector3D(a, c)).normalized();
}

double TerrainMesh::face_area(const Face& face) const {
    const Point3D& a = vertices_[face[0]];
    const Point3D& b = vertices_[face[1]];
    const Point3D& c = vertices_[face[2]];
    return 0.5 * Vector3D(a, b).cross(Vector3D(a, c)).length();
}

std::pair<Point3D, Point3D> TerrainMesh::compute_extents() const {
    if (vertices_.empty()) {
        return {Point3D(), Point3D()};
    }

    double min_x = std::numeric_limits<double>::max();
    double min_y = min_x, min_z = min_x;
    double max_x = std::numeric_limits<double>::lowest();
    double max_y = max_x, max_z = max_x;

    for (const auto& v : vertices_) {
        min_x = std::min(min_x, v.x()); max_x = std::max(max_x, v.x());
        min_y = std::min(min_y, v.y()); max_y = std::max(max_y, v.y());
        min_z = std::min(min_z, v.z()); max_z = std::max(max_z, v.z());
    }

    return {Point3D(min_x, min_y, min_z), Point3D(max_x, max_y, max_z)};
}

MeshValidationResult TerrainMesh::validate_topology() const {
    MeshValidationResult result;
    std::unordered_map<EdgeId, EdgeInfo, EdgeHash> edge_registry;
    edge_registry.reserve(faces_.size() * 2);

    for (const Face& face : faces_) {
        bool indices_valid = std::all_of(face.begin(), face.end(),
            [this](VertexId id) { return id < vertices_.size(); });
        if (!indices_valid) {
            result.num_invalid_indices++;
            continue;
        }

        if (face[0] == face[1] || face[1] == face[2] || face[0] == face[2] ||
            face_area(face) < 1e-12) {
            result.num_degenerate_triangles++;
        }

        for (int k = 0; k < 3; ++k) {
            VertexId from = face[k];
            VertexId to = face[(k + 1) % 3];
            if (from == to) continue;

            // Key on the undirected edge, count the direction separately
            EdgeInfo& info = edge_registry[make_edge_id(std::min(from, to), std::max(from, to))];
            if (from < to) {
                info.forward_uses++;
            } else {
                info.backward_uses++;
            }
        }
    }

    for (const auto& [edge_id, info] : edge_registry) {
        size_t uses = info.total();
        if (uses == 1) {
            result.boundary_edge_count++;
        } else if (uses > 2) {
            result.excess_edge_count++;
        } else if (info.forward_uses != 1 || info.backward_uses != 1) {
            result.inconsistent_edge_count++;
        }
    }

    result.is_manifold = result.excess_edge_count == 0;
    result.is_watertight = result.boundary_edge_count == 0 && result.excess_edge_count == 0;
    result.is_consistently_oriented = result.inconsistent_edge_count == 0;

    logger_.debug("Topology: " + std::to_string(edge_registry.size()) + " edges, " +
                  std::to_string(result.boundary_edge_count) + " boundary, " +
                  std::to_string(result.excess_edge_count) + " excess, " +
                  std::to_string(result.inconsistent_edge_count) + " inconsistent");

    return result;
}

MeshValidationResult TerrainMesh::require_closed() const {
    MeshValidationResult result = validate_topology();
    if (!result.is_valid()) {
        std::string message = "Mesh is not a closed solid: " +
            std::to_string(result.boundary_edge_count) + " boundary, " +
            std::to_string(result.excess_edge_count) + " non-manifold, " +
            std::to_string(result.inconsistent_edge_count) + " inconsistent edges, " +
            std::to_string(result.num_degenerate_triangles) + " degenerate faces, " +
            std::to_string(result.num_invalid_indices) + " invalid indices";
        logger_.error(message);
        throw SerializationError(message);
    }
    return result;
}

void TerrainMesh::clear() {
    vertices_.clear();
    faces_.clear();
}

} // namespace terrain3d
