#ifndef PAGECURL_MESH_PAGE_MESH_HPP
#define PAGECURL_MESH_PAGE_MESH_HPP

#include "page_content.hpp"
#include <geometry/color.hpp>
#include <geometry/rect.hpp>
#include <math/vec2.hpp>
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pagecurl {

// Configuration for a page mesh
struct MeshConfig {
    int max_curl_splits = 10;               // Scan lines across the curl (values < 1 become 1)
    bool draw_curl_position = false;        // Debug lines at the curl position
    bool draw_polygon_outlines = false;     // Debug outline of the front strip
    bool draw_shadow = true;
    bool draw_texture = true;
    ShadowColor shadow_inner_color = {0.0f, 0.0f, 0.0f, 0.5f};
    ShadowColor shadow_outer_color = {0.0f, 0.0f, 0.0f, 0.0f};
    float color_factor_offset = 0.3f;       // Darkest shading on the curl, [0, 1]

    // Throws std::invalid_argument on out of range values
    void validate() const;
};

// Images handed to a rendering backend after the page content changed.
// back is null when the page uses the front image on both sides.
struct TextureUpload {
    ImagePtr front;
    ImagePtr back;
    RectF front_rect;
    RectF back_rect;
};

// Curl geometry of one page rectangle.
//
// curl() rebuilds every buffer from the rectangle and the curl pose. All
// buffers are allocated once at construction and sized from max_curl_splits;
// counts tell how much of each buffer is in use.
//
// Buffer layout:
//   vertices()        xyz per vertex, [0, front_count()) is the front strip and
//                     [back_strip_start(), front_count() + back_count()) the back strip
//   colors()          rgba per vertex
//   tex_coords()      uv per vertex
//   shadow_vertices() xyz, drop shadow pairs first, then self shadow pairs
//   shadow_colors()   rgba per shadow vertex
class PageMesh {
public:
    explicit PageMesh(const MeshConfig& config = MeshConfig{});

    // Rebuild geometry for a curl at position heading along direction (unit
    // length) with the given cylinder radius
    void curl(const Vec2& position, const Vec2& direction, double radius);

    // Flat quad covering the rectangle
    void reset();

    void set_rect(const RectF& rect);
    const RectF& rect() const { return rect_; }

    // Flipped meshes show their back side when flat
    void set_flip_texture(bool flip);
    bool flip_texture() const { return flip_texture_; }

    // Pads the content images for upload when they changed since the last
    // call. Recycles the content and resets the mesh.
    std::optional<TextureUpload> take_texture_upload();

    PageContent& content() { return content_; }
    const PageContent& content() const { return content_; }

    const MeshConfig& config() const { return config_; }

    const std::vector<float>& vertices() const { return vertices_; }
    const std::vector<float>& colors() const { return colors_; }
    const std::vector<float>& tex_coords() const { return tex_coords_; }
    const std::vector<float>& shadow_vertices() const { return shadow_vertices_; }
    const std::vector<float>& shadow_colors() const { return shadow_colors_; }
    const std::vector<float>& curl_position_lines() const { return curl_position_lines_; }

    int front_count() const { return front_count_; }
    int back_count() const { return back_count_; }
    int back_strip_start() const;
    int back_strip_count() const;
    int drop_shadow_count() const { return drop_shadow_count_; }
    int self_shadow_count() const { return self_shadow_count_; }
    int curl_position_lines_count() const { return curl_position_lines_count_; }
    int max_vertex_count() const { return max_vertex_count_; }
    int max_curl_splits() const { return max_curl_splits_; }

    bool has_back_texture() const { return has_back_texture_; }
    const RectF& front_texture_rect() const { return front_texture_rect_; }
    const RectF& back_texture_rect() const { return back_texture_rect_; }

    // Unique per instance, for backends that bind resources to a mesh
    uint64_t id() const { return id_; }

    // Clip results and vertices discarded since construction
    uint64_t degenerate_clip_count() const { return degenerate_clip_count_; }

    // Front and back strips as OBJ triangles
    std::string to_obj() const;

private:
    struct Vertex {
        double x = 0.0, y = 0.0, z = 0.0;
        double u = 0.0, v = 0.0;
        double penumbra_x = 0.0, penumbra_y = 0.0;
        float color_factor = 1.0f;
        Argb color = color::WHITE;

        void translate(double dx, double dy) { x += dx; y += dy; }
        void rotate_z(double theta);
    };

    struct ShadowVertex {
        double x = 0.0, y = 0.0, z = 0.0;
        double penumbra_x = 0.0, penumbra_y = 0.0;
        double factor = 0.0;
    };

    void set_tex_coords(double left, double right);
    void collect_intersections(double scan_x);
    bool add_vertex(const Vertex& v);
    void add_shadow_vertex(const Vertex& v, const Vec2& direction, double radius);
    void write_shadow_buffers();
    void write_shadow_pair(const ShadowVertex& sv, int index);

    MeshConfig config_;
    int max_curl_splits_ = 1;
    int max_vertex_count_ = 0;
    int shadow_capacity_ = 0;
    uint64_t id_ = 0;

    PageContent content_;
    RectF rect_;
    std::array<Vertex, 4> rectangle_;
    bool flip_texture_ = false;
    bool has_back_texture_ = false;
    RectF front_texture_rect_{0.0f, 0.0f, 1.0f, 1.0f};
    RectF back_texture_rect_{0.0f, 0.0f, 1.0f, 1.0f};

    // Edges of the rotated rectangle as index pairs, larger x first
    std::array<std::array<int, 2>, 4> lines_{};

    // Scratch storage, reserved once
    std::vector<Vertex> rotated_;
    std::vector<Vertex> intersections_;
    std::vector<Vertex> output_;
    std::vector<double> scan_lines_;
    std::vector<ShadowVertex> drop_shadow_;
    std::vector<ShadowVertex> self_shadow_;

    std::vector<float> vertices_;
    std::vector<float> colors_;
    std::vector<float> tex_coords_;
    std::vector<float> shadow_vertices_;
    std::vector<float> shadow_colors_;
    std::vector<float> curl_position_lines_;

    int written_ = 0;
    int front_count_ = 0;
    int back_count_ = 0;
    int drop_shadow_count_ = 0;
    int self_shadow_count_ = 0;
    int curl_position_lines_count_ = 0;
    uint64_t degenerate_clip_count_ = 0;
};

}  // namespace pagecurl

#endif // PAGECURL_MESH_PAGE_MESH_HPP
