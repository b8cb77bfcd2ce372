#include "page_mesh.hpp"
#include "logging.hpp"
#include <algorithm>
#include <atomic>
#include <cmath>
#include <iomanip>
#include <numbers>
#include <sstream>
#include <utility>
#include <stdexcept>

namespace pagecurl {

namespace {

std::atomic<uint64_t> next_mesh_id{1};

constexpr double PI = std::numbers::pi;

}  // anonymous namespace

void MeshConfig::validate() const {
    if (!(color_factor_offset >= 0.0f && color_factor_offset <= 1.0f)) {
        throw std::invalid_argument("color_factor_offset must be within [0, 1]");
    }
    if (!color::in_unit_range(shadow_inner_color)) {
        throw std::invalid_argument("shadow_inner_color channels must be within [0, 1]");
    }
    if (!color::in_unit_range(shadow_outer_color)) {
        throw std::invalid_argument("shadow_outer_color channels must be within [0, 1]");
    }
}

void PageMesh::Vertex::rotate_z(double theta) {
    double c = std::cos(theta);
    double s = std::sin(theta);

    double rx = x * c + y * s;
    double ry = -x * s + y * c;
    x = rx;
    y = ry;

    double px = penumbra_x * c + penumbra_y * s;
    double py = -penumbra_x * s + penumbra_y * c;
    penumbra_x = px;
    penumbra_y = py;
}

PageMesh::PageMesh(const MeshConfig& config)
    : config_(config) {
    config_.validate();

    max_curl_splits_ = std::max(1, config_.max_curl_splits);
    config_.max_curl_splits = max_curl_splits_;

    // 4 rectangle corners, 2 where a scan line meets two corners, and two
    // vertices per scan line across the curl
    max_vertex_count_ = 6 + 2 * max_curl_splits_;
    shadow_capacity_ = (max_curl_splits_ + 2) * 2;
    id_ = next_mesh_id.fetch_add(1);

    rotated_.reserve(4);
    intersections_.reserve(4);
    output_.reserve(12);
    scan_lines_.reserve(static_cast<size_t>(max_curl_splits_) + 2);

    vertices_.assign(static_cast<size_t>(max_vertex_count_) * 3, 0.0f);
    colors_.assign(static_cast<size_t>(max_vertex_count_) * 4, 0.0f);
    tex_coords_.assign(static_cast<size_t>(max_vertex_count_) * 2, 0.0f);

    if (config_.draw_shadow) {
        drop_shadow_.reserve(static_cast<size_t>(shadow_capacity_));
        self_shadow_.reserve(static_cast<size_t>(shadow_capacity_));
        shadow_vertices_.assign(static_cast<size_t>(shadow_capacity_) * 2 * 3, 0.0f);
        shadow_colors_.assign(static_cast<size_t>(shadow_capacity_) * 2 * 4, 0.0f);
    }

    if (config_.draw_curl_position) {
        curl_position_lines_count_ = 3;
        curl_position_lines_.assign(static_cast<size_t>(curl_position_lines_count_) * 4, 0.0f);
    }

    // Corners: 0 = top-left, 1 = bottom-left, 2 = top-right, 3 = bottom-right.
    // Penumbra seeds point away from the rectangle at each corner.
    rectangle_[0].penumbra_x = -1.0;
    rectangle_[0].penumbra_y = 1.0;
    rectangle_[1].penumbra_x = -1.0;
    rectangle_[1].penumbra_y = -1.0;
    rectangle_[2].penumbra_x = 1.0;
    rectangle_[2].penumbra_y = 1.0;
    rectangle_[3].penumbra_x = 1.0;
    rectangle_[3].penumbra_y = -1.0;

    set_flip_texture(false);
}

void PageMesh::curl(const Vec2& position, const Vec2& direction, double radius) {
    if (config_.draw_curl_position) {
        float* l = curl_position_lines_.data();
        // Cross at the curl position
        l[0] = position.x;          l[1] = position.y - 1.0f;
        l[2] = position.x;          l[3] = position.y + 1.0f;
        l[4] = position.x - 1.0f;   l[5] = position.y;
        l[6] = position.x + 1.0f;   l[7] = position.y;
        // Curl direction
        l[8] = position.x;          l[9] = position.y;
        l[10] = position.x + direction.x * 2.0f;
        l[11] = position.y + direction.y * 2.0f;
    }

    radius = std::max(radius, 0.0);

    // Rotate the rectangle so that the curl direction points along +X, with
    // the curl position at the origin. Corners are kept ordered by x,
    // largest first, then by y for equal x.
    double curl_angle = -std::atan2(static_cast<double>(direction.y),
                                    static_cast<double>(direction.x));
    rotated_.clear();
    for (const auto& corner : rectangle_) {
        Vertex v = corner;
        v.translate(-position.x, -position.y);
        v.rotate_z(-curl_angle);

        auto it = rotated_.begin();
        for (; it != rotated_.end(); ++it) {
            if (v.x > it->x || (v.x == it->x && v.y > it->y)) {
                break;
            }
        }
        rotated_.insert(it, v);
    }

    // Edges as (larger x, smaller x) index pairs. Corner 3 is normally
    // opposite corner 0, unless rounding ordered them differently.
    lines_ = {{{0, 1}, {0, 2}, {1, 3}, {2, 3}}};
    double dx02 = rotated_[0].x - rotated_[2].x;
    double dy02 = rotated_[0].y - rotated_[2].y;
    double dx03 = rotated_[0].x - rotated_[3].x;
    double dy03 = rotated_[0].y - rotated_[3].y;
    if (dx02 * dx02 + dy02 * dy02 > dx03 * dx03 + dy03 * dy03) {
        lines_[1][1] = 3;
        lines_[2][1] = 2;
    }

    written_ = 0;
    front_count_ = 0;
    back_count_ = 0;
    drop_shadow_count_ = 0;
    self_shadow_count_ = 0;
    drop_shadow_.clear();
    self_shadow_.clear();

    double curl_length = PI * radius;

    scan_lines_.clear();
    scan_lines_.push_back(0.0);
    for (int i = 1; i < max_curl_splits_; ++i) {
        scan_lines_.push_back((-curl_length * i) / static_cast<double>(max_curl_splits_ - 1));
    }
    // Last band picks up everything rolled fully over
    scan_lines_.push_back(rotated_[3].x - 1.0);

    double scan_max = rotated_[0].x + 1.0;
    int last_band = static_cast<int>(scan_lines_.size()) - 1;

    for (int i = 0; i <= last_band; ++i) {
        double scan_min = scan_lines_[static_cast<size_t>(i)];
        output_.clear();

        for (const auto& corner : rotated_) {
            if (corner.x < scan_min || corner.x > scan_max) {
                continue;
            }

            collect_intersections(corner.x);
            if (intersections_.size() == 1 && intersections_[0].y > corner.y) {
                output_.push_back(intersections_[0]);
                output_.push_back(corner);
            } else if (intersections_.size() <= 1) {
                output_.push_back(corner);
                output_.insert(output_.end(), intersections_.begin(), intersections_.end());
            } else {
                ++degenerate_clip_count_;
                logging::get_logger()->debug(
                    "PageMesh {}: corner at x={} has {} intersections, skipped",
                    id_, corner.x, intersections_.size());
            }
        }

        collect_intersections(scan_min);
        if (intersections_.size() == 2) {
            // Higher y first
            if (intersections_[0].y < intersections_[1].y) {
                output_.push_back(intersections_[1]);
                output_.push_back(intersections_[0]);
            } else {
                output_.push_back(intersections_[0]);
                output_.push_back(intersections_[1]);
            }
        } else if (intersections_.size() > 2) {
            ++degenerate_clip_count_;
            logging::get_logger()->debug(
                "PageMesh {}: scan line x={} has {} intersections, skipped",
                id_, scan_min, intersections_.size());
        }

        for (auto& v : output_) {
            bool texture_front;
            if (i == 0) {
                texture_front = true;
            } else if (i == last_band || curl_length == 0.0) {
                // Rolled completely over
                v.x = -(curl_length + v.x);
                v.z = 2.0 * radius;
                v.penumbra_x = -v.penumbra_x;
                texture_front = false;
            } else {
                // On the cylinder, v.x within [-curl_length, 0]
                double rot_y = PI * (v.x / curl_length);
                double sin_rot_y = std::sin(rot_y);
                double cos_rot_y = std::cos(rot_y);
                v.x = radius * sin_rot_y;
                v.z = radius - (radius * cos_rot_y);
                v.penumbra_x *= cos_rot_y;
                v.color_factor = static_cast<float>(
                    config_.color_factor_offset +
                    (1.0 - config_.color_factor_offset) * std::sqrt(sin_rot_y + 1.0));
                texture_front = v.z < radius;
            }

            if (texture_front != flip_texture_) {
                v.u *= front_texture_rect_.right;
                v.v *= front_texture_rect_.bottom;
                v.color = content_.color(PageSide::Front);
            } else {
                v.u *= back_texture_rect_.right;
                v.v *= back_texture_rect_.bottom;
                v.color = content_.color(PageSide::Back);
            }

            v.rotate_z(curl_angle);
            v.translate(position.x, position.y);

            if (!add_vertex(v)) {
                continue;
            }
            if (texture_front) {
                ++front_count_;
            } else {
                ++back_count_;
            }

            if (config_.draw_shadow) {
                add_shadow_vertex(v, direction, radius);
            }
        }

        scan_max = scan_min;
    }

    if (config_.draw_shadow) {
        write_shadow_buffers();
    }
}

void PageMesh::reset() {
    written_ = 0;
    for (const auto& corner : rectangle_) {
        Vertex v = corner;
        if (flip_texture_) {
            v.u *= back_texture_rect_.right;
            v.v *= back_texture_rect_.bottom;
            v.color = content_.color(PageSide::Back);
        } else {
            v.u *= front_texture_rect_.right;
            v.v *= front_texture_rect_.bottom;
            v.color = content_.color(PageSide::Front);
        }
        add_vertex(v);
    }

    front_count_ = 4;
    back_count_ = 0;
    drop_shadow_count_ = 0;
    self_shadow_count_ = 0;
}

void PageMesh::set_rect(const RectF& rect) {
    rect_ = rect;
    rectangle_[0].x = rect.left;
    rectangle_[0].y = rect.top;
    rectangle_[1].x = rect.left;
    rectangle_[1].y = rect.bottom;
    rectangle_[2].x = rect.right;
    rectangle_[2].y = rect.top;
    rectangle_[3].x = rect.right;
    rectangle_[3].y = rect.bottom;
}

void PageMesh::set_flip_texture(bool flip) {
    flip_texture_ = flip;
    if (flip) {
        set_tex_coords(1.0, 0.0);
    } else {
        set_tex_coords(0.0, 1.0);
    }
}

void PageMesh::set_tex_coords(double left, double right) {
    rectangle_[0].u = left;
    rectangle_[0].v = 0.0;
    rectangle_[1].u = left;
    rectangle_[1].v = 1.0;
    rectangle_[2].u = right;
    rectangle_[2].v = 0.0;
    rectangle_[3].u = right;
    rectangle_[3].v = 1.0;
}

std::optional<TextureUpload> PageMesh::take_texture_upload() {
    if (!config_.draw_texture || !content_.textures_changed()) {
        return std::nullopt;
    }

    TextureUpload upload;
    upload.front = content_.texture(front_texture_rect_, PageSide::Front);
    has_back_texture_ = content_.has_back_texture();
    if (has_back_texture_) {
        upload.back = content_.texture(back_texture_rect_, PageSide::Back);
    } else {
        back_texture_rect_ = front_texture_rect_;
    }
    upload.front_rect = front_texture_rect_;
    upload.back_rect = back_texture_rect_;

    content_.recycle();
    reset();
    return upload;
}

int PageMesh::back_strip_start() const {
    return std::max(0, front_count_ - 2);
}

int PageMesh::back_strip_count() const {
    return front_count_ + back_count_ - back_strip_start();
}

void PageMesh::collect_intersections(double scan_x) {
    intersections_.clear();
    for (const auto& line : lines_) {
        const Vertex& v1 = rotated_[static_cast<size_t>(line[0])];
        const Vertex& v2 = rotated_[static_cast<size_t>(line[1])];
        if (v1.x > scan_x && v2.x < scan_x) {
            double c = (scan_x - v2.x) / (v1.x - v2.x);
            Vertex n = v2;
            n.x = scan_x;
            n.y += (v1.y - v2.y) * c;
            n.u += (v1.u - v2.u) * c;
            n.v += (v1.v - v2.v) * c;
            n.penumbra_x += (v1.penumbra_x - v2.penumbra_x) * c;
            n.penumbra_y += (v1.penumbra_y - v2.penumbra_y) * c;
            intersections_.push_back(n);
        }
    }
}

bool PageMesh::add_vertex(const Vertex& v) {
    if (written_ >= max_vertex_count_) {
        ++degenerate_clip_count_;
        logging::get_logger()->debug("PageMesh {}: vertex buffer full, vertex dropped", id_);
        return false;
    }

    auto i = static_cast<size_t>(written_);
    vertices_[i * 3 + 0] = static_cast<float>(v.x);
    vertices_[i * 3 + 1] = static_cast<float>(v.y);
    vertices_[i * 3 + 2] = static_cast<float>(v.z);

    colors_[i * 4 + 0] = v.color_factor * static_cast<float>(color::red(v.color)) / 255.0f;
    colors_[i * 4 + 1] = v.color_factor * static_cast<float>(color::green(v.color)) / 255.0f;
    colors_[i * 4 + 2] = v.color_factor * static_cast<float>(color::blue(v.color)) / 255.0f;
    colors_[i * 4 + 3] = static_cast<float>(color::alpha(v.color)) / 255.0f;

    tex_coords_[i * 2 + 0] = static_cast<float>(v.u);
    tex_coords_[i * 2 + 1] = static_cast<float>(v.v);

    ++written_;
    return true;
}

void PageMesh::add_shadow_vertex(const Vertex& v, const Vec2& direction, double radius) {
    auto full = [this]() {
        return static_cast<int>(drop_shadow_.size() + self_shadow_.size()) >= shadow_capacity_;
    };

    if (v.z > 0.0 && v.z <= radius) {
        // Drop shadow, cast behind the curl
        if (full()) {
            ++degenerate_clip_count_;
        } else {
            ShadowVertex sv;
            sv.x = v.x;
            sv.y = v.y;
            sv.z = v.z;
            double tmp = v.z / 2.0;
            sv.penumbra_x = -direction.x * tmp;
            sv.penumbra_y = -direction.y * tmp;
            sv.factor = v.z / radius;
            auto idx = static_cast<std::ptrdiff_t>((drop_shadow_.size() + 1) / 2);
            drop_shadow_.insert(drop_shadow_.begin() + idx, sv);
        }
    }

    if (v.z > radius) {
        // Self shadow, cast over the page itself
        if (full()) {
            ++degenerate_clip_count_;
        } else {
            ShadowVertex sv;
            sv.x = v.x;
            sv.y = v.y;
            sv.z = v.z;
            double tmp = (v.z - radius) / 3.0;
            sv.penumbra_x = v.penumbra_x * tmp;
            sv.penumbra_y = v.penumbra_y * tmp;
            sv.factor = (v.z - radius) / (2.0 * radius);
            auto idx = static_cast<std::ptrdiff_t>((self_shadow_.size() + 1) / 2);
            self_shadow_.insert(self_shadow_.begin() + idx, sv);
        }
    }
}

void PageMesh::write_shadow_buffers() {
    int index = 0;

    drop_shadow_count_ = 0;
    for (const auto& sv : drop_shadow_) {
        write_shadow_pair(sv, index);
        index += 2;
        drop_shadow_count_ += 2;
    }

    self_shadow_count_ = 0;
    for (const auto& sv : self_shadow_) {
        write_shadow_pair(sv, index);
        index += 2;
        self_shadow_count_ += 2;
    }
}

void PageMesh::write_shadow_pair(const ShadowVertex& sv, int index) {
    auto i = static_cast<size_t>(index);

    float* p = &shadow_vertices_[i * 3];
    p[0] = static_cast<float>(sv.x);
    p[1] = static_cast<float>(sv.y);
    p[2] = static_cast<float>(sv.z);
    p[3] = static_cast<float>(sv.x + sv.penumbra_x);
    p[4] = static_cast<float>(sv.y + sv.penumbra_y);
    p[5] = static_cast<float>(sv.z);

    const auto& inner = config_.shadow_inner_color;
    const auto& outer = config_.shadow_outer_color;
    float* c = &shadow_colors_[i * 4];
    for (size_t j = 0; j < 4; ++j) {
        c[j] = static_cast<float>(outer[j] + (inner[j] - outer[j]) * sv.factor);
        c[4 + j] = outer[j];
    }
}

std::string PageMesh::to_obj() const {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(6);

    int total = front_count_ + back_count_;
    ss << "# PageCurl OBJ Export\n";
    ss << "# Front vertices: " << front_count_ << "\n";
    ss << "# Back vertices: " << back_count_ << "\n\n";

    for (int i = 0; i < total; ++i) {
        auto k = static_cast<size_t>(i);
        ss << "v " << vertices_[k * 3] << " " << vertices_[k * 3 + 1] << " "
           << vertices_[k * 3 + 2] << "\n";
    }
    for (int i = 0; i < total; ++i) {
        auto k = static_cast<size_t>(i);
        ss << "vt " << tex_coords_[k * 2] << " " << tex_coords_[k * 2 + 1] << "\n";
    }

    // Triangle strip to triangles, alternating winding. OBJ indices are 1-based.
    auto write_strip = [&ss](const char* name, int start, int count) {
        if (count < 3) {
            return;
        }
        ss << "\ng " << name << "\n";
        for (int i = 0; i + 2 < count; ++i) {
            int a = start + i + 1;
            int b = start + i + 2;
            int c = start + i + 3;
            if (i % 2 == 1) {
                std::swap(a, b);
            }
            ss << "f " << a << "/" << a << " " << b << "/" << b << " " << c << "/" << c << "\n";
        }
    };

    write_strip("front", 0, front_count_);
    write_strip("back", back_strip_start(), back_strip_count());

    return ss.str();
}

}  // namespace pagecurl
