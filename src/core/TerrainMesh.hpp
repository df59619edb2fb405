#pragma once

/**
 * @file TerrainMesh.hpp
 * @brief Indexed triangle mesh with topology validation
 *
 * Vertices are stored once and referenced by position from the face list.
 * Topology checks work on directed edges so that both manifoldness and
 * consistent winding can be verified in one pass.
 */

#include "terrain3d.hpp"
#include "Logger.hpp"
#include <unordered_map>

namespace terrain3d {

/**
 * @brief Edge hash function for unordered containers
 */
struct EdgeHash {
    std::size_t operator()(const EdgeId& edge_id) const noexcept {
        return std::hash<EdgeId>{}(edge_id);
    }
};

/**
 * @brief Usage of one undirected edge, split by traversal direction
 */
struct EdgeInfo {
    size_t forward_uses = 0;    ///< Faces traversing low -> high vertex id
    size_t backward_uses = 0;   ///< Faces traversing high -> low vertex id

    size_t total() const { return forward_uses + backward_uses; }
};

/**
 * @brief Triangle mesh produced by MeshBuilder and consumed by STLExporter
 */
class TerrainMesh {
public:
    TerrainMesh();

    TerrainMesh(TerrainMesh&& other) noexcept
        : vertices_(std::move(other.vertices_))
        , faces_(std::move(other.faces_))
        , logger_("TerrainMesh") {}

    TerrainMesh& operator=(TerrainMesh&& other) noexcept {
        if (this != &other) {
            vertices_ = std::move(other.vertices_);
            faces_ = std::move(other.faces_);
        }
        return *this;
    }

    // Large objects should be moved
    TerrainMesh(const TerrainMesh&) = delete;
    TerrainMesh& operator=(const TerrainMesh&) = delete;

    VertexId add_vertex(const Point3D& vertex);
    FaceId add_triangle(VertexId v0, VertexId v1, VertexId v2);

    const Point3D& get_vertex(VertexId vertex_id) const;
    const Face& get_face(FaceId face_id) const;

    size_t num_vertices() const { return vertices_.size(); }
    size_t num_triangles() const { return faces_.size(); }

    const std::vector<Point3D>& vertices() const { return vertices_; }
    const std::vector<Face>& faces() const { return faces_; }

    /**
     * @brief Unit normal of a face from its winding; zero when degenerate
     */
    Vector3D compute_face_normal(FaceId face_id) const;

    /**
     * @brief Minimum and maximum corner of the vertex cloud
     */
    std::pair<Point3D, Point3D> compute_extents() const;

    /**
     * @brief Check closed-manifold topology and winding consistency
     *
     * Every undirected edge must be used by exactly two faces that traverse
     * it in opposite directions.
     */
    MeshValidationResult validate_topology() const;

    /**
     * @brief validate_topology(), throwing SerializationError unless the
     * mesh is a closed, consistently oriented 2-manifold
     */
    MeshValidationResult require_closed() const;

    void reserve_vertices(size_t count) { vertices_.reserve(count); }
    void reserve_triangles(size_t count) { faces_.reserve(count); }
    void clear();

private:
    std::vector<Point3D> vertices_;
    std::vector<Face> faces_;

    Logger logger_;

    double face_area(const Face& face) const;
};

} // namespace terrain3d
