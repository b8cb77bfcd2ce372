#ifndef PAGECURL_SERIALIZATION_MESH_JSON_HPP
#define PAGECURL_SERIALIZATION_MESH_JSON_HPP

#include <nlohmann/json.hpp>
#include <mesh/page_mesh.hpp>
#include <algorithm>
#include <vector>

namespace pagecurl {

namespace detail {

inline nlohmann::json float_slice(const std::vector<float>& buffer, int count, int stride) {
    auto n = static_cast<size_t>(std::max(count, 0)) * static_cast<size_t>(stride);
    n = std::min(n, buffer.size());
    return nlohmann::json(std::vector<float>(buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(n)));
}

}  // namespace detail

// Counts and the in-use portion of every buffer of a mesh
inline nlohmann::json page_mesh_to_json(const PageMesh& mesh) {
    int vertex_count = mesh.front_count() + mesh.back_count();
    int shadow_count = mesh.drop_shadow_count() + mesh.self_shadow_count();

    nlohmann::json j;
    j["id"] = mesh.id();
    j["rect"] = nlohmann::json::array({mesh.rect().left, mesh.rect().top,
                                       mesh.rect().right, mesh.rect().bottom});
    j["flip_texture"] = mesh.flip_texture();
    j["counts"] = {
        {"front", mesh.front_count()},
        {"back", mesh.back_count()},
        {"back_strip_start", mesh.back_strip_start()},
        {"back_strip_count", mesh.back_strip_count()},
        {"drop_shadow", mesh.drop_shadow_count()},
        {"self_shadow", mesh.self_shadow_count()},
        {"max_vertices", mesh.max_vertex_count()},
        {"degenerate_clips", mesh.degenerate_clip_count()}
    };
    j["vertices"] = detail::float_slice(mesh.vertices(), vertex_count, 3);
    j["colors"] = detail::float_slice(mesh.colors(), vertex_count, 4);
    j["tex_coords"] = detail::float_slice(mesh.tex_coords(), vertex_count, 2);
    j["shadow_vertices"] = detail::float_slice(mesh.shadow_vertices(), shadow_count, 3);
    j["shadow_colors"] = detail::float_slice(mesh.shadow_colors(), shadow_count, 4);
    if (mesh.curl_position_lines_count() > 0) {
        j["curl_position_lines"] = detail::float_slice(
            mesh.curl_position_lines(), mesh.curl_position_lines_count() * 2, 2);
    }
    return j;
}

}  // namespace pagecurl

#endif // PAGECURL_SERIALIZATION_MESH_JSON_HPP
