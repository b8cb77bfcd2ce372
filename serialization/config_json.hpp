#ifndef PAGECURL_SERIALIZATION_CONFIG_JSON_HPP
#define PAGECURL_SERIALIZATION_CONFIG_JSON_HPP

#include <nlohmann/json.hpp>
#include <math/vec2.hpp>
#include <geometry/color.hpp>
#include <geometry/rect.hpp>
#include <layout/page_layout.hpp>
#include <mesh/page_mesh.hpp>
#include <controller/curl_controller.hpp>
#include <stdexcept>
#include <string>

namespace pagecurl {

// Vec2 serialization
inline void to_json(nlohmann::json& j, const Vec2& v) {
    j = nlohmann::json::array({v.x, v.y});
}

inline void from_json(const nlohmann::json& j, Vec2& v) {
    if (!j.is_array() || j.size() != 2) {
        throw std::invalid_argument("Vec2 must be an array of 2 numbers");
    }
    v.x = j[0].get<float>();
    v.y = j[1].get<float>();
}

// RectF serialization, [left, top, right, bottom]
inline void to_json(nlohmann::json& j, const RectF& r) {
    j = nlohmann::json::array({r.left, r.top, r.right, r.bottom});
}

inline void from_json(const nlohmann::json& j, RectF& r) {
    if (!j.is_array() || j.size() != 4) {
        throw std::invalid_argument("rectangle must be an array of 4 numbers");
    }
    r.left = j[0].get<float>();
    r.top = j[1].get<float>();
    r.right = j[2].get<float>();
    r.bottom = j[3].get<float>();
}

// ShadowColor is a std::array, so read it explicitly to validate shape and range
inline ShadowColor shadow_color_from_json(const nlohmann::json& j, const char* name) {
    if (!j.is_array() || j.size() != 4) {
        throw std::invalid_argument(std::string(name) + " must be an array of 4 numbers");
    }
    ShadowColor c{};
    for (size_t i = 0; i < 4; ++i) {
        c[i] = j[i].get<float>();
    }
    if (!color::in_unit_range(c)) {
        throw std::invalid_argument(std::string(name) + " channels must be within [0, 1]");
    }
    return c;
}

// ViewMode serialization
inline void to_json(nlohmann::json& j, const ViewMode& mode) {
    j = mode == ViewMode::TwoPages ? "two_pages" : "one_page";
}

inline void from_json(const nlohmann::json& j, ViewMode& mode) {
    auto s = j.get<std::string>();
    if (s == "one_page") {
        mode = ViewMode::OnePage;
    } else if (s == "two_pages") {
        mode = ViewMode::TwoPages;
    } else {
        throw std::invalid_argument("Unknown view mode: " + s);
    }
}

// LayoutMargins serialization
inline void to_json(nlohmann::json& j, const LayoutMargins& m) {
    j = {
        {"left", m.left},
        {"top", m.top},
        {"right", m.right},
        {"bottom", m.bottom}
    };
}

inline void from_json(const nlohmann::json& j, LayoutMargins& m) {
    m.left = j.value("left", 0.0f);
    m.top = j.value("top", 0.0f);
    m.right = j.value("right", 0.0f);
    m.bottom = j.value("bottom", 0.0f);
}

// MeshConfig serialization
inline void to_json(nlohmann::json& j, const MeshConfig& config) {
    j = {
        {"max_curl_splits", config.max_curl_splits},
        {"draw_curl_position", config.draw_curl_position},
        {"draw_polygon_outlines", config.draw_polygon_outlines},
        {"draw_shadow", config.draw_shadow},
        {"draw_texture", config.draw_texture},
        {"shadow_inner_color", config.shadow_inner_color},
        {"shadow_outer_color", config.shadow_outer_color},
        {"color_factor_offset", config.color_factor_offset}
    };
}

inline void from_json(const nlohmann::json& j, MeshConfig& config) {
    MeshConfig defaults;
    config.max_curl_splits = j.value("max_curl_splits", defaults.max_curl_splits);
    config.draw_curl_position = j.value("draw_curl_position", defaults.draw_curl_position);
    config.draw_polygon_outlines = j.value("draw_polygon_outlines", defaults.draw_polygon_outlines);
    config.draw_shadow = j.value("draw_shadow", defaults.draw_shadow);
    config.draw_texture = j.value("draw_texture", defaults.draw_texture);
    config.shadow_inner_color = j.contains("shadow_inner_color")
        ? shadow_color_from_json(j["shadow_inner_color"], "shadow_inner_color")
        : defaults.shadow_inner_color;
    config.shadow_outer_color = j.contains("shadow_outer_color")
        ? shadow_color_from_json(j["shadow_outer_color"], "shadow_outer_color")
        : defaults.shadow_outer_color;
    config.color_factor_offset = j.value("color_factor_offset", defaults.color_factor_offset);
    config.validate();
}

// ControllerConfig serialization, mesh settings nested under "mesh"
inline void to_json(nlohmann::json& j, const ControllerConfig& config) {
    j = {
        {"mesh", config.mesh},
        {"allow_last_page_curl", config.allow_last_page_curl},
        {"animation_duration_ms", config.animation_duration_ms},
        {"page_jump_duration_ms", config.page_jump_duration_ms},
        {"enable_touch_pressure", config.enable_touch_pressure},
        {"render_left_page", config.render_left_page},
        {"view_mode", config.view_mode}
    };
}

inline void from_json(const nlohmann::json& j, ControllerConfig& config) {
    ControllerConfig defaults;
    if (j.contains("mesh")) {
        config.mesh = j["mesh"].get<MeshConfig>();
    } else {
        config.mesh = defaults.mesh;
    }
    config.allow_last_page_curl = j.value("allow_last_page_curl", defaults.allow_last_page_curl);
    config.animation_duration_ms = j.value("animation_duration_ms", defaults.animation_duration_ms);
    config.page_jump_duration_ms = j.value("page_jump_duration_ms", defaults.page_jump_duration_ms);
    config.enable_touch_pressure = j.value("enable_touch_pressure", defaults.enable_touch_pressure);
    config.render_left_page = j.value("render_left_page", defaults.render_left_page);
    config.view_mode = j.contains("view_mode") ? j["view_mode"].get<ViewMode>() : defaults.view_mode;
    config.validate();
}

}  // namespace pagecurl

#endif // PAGECURL_SERIALIZATION_CONFIG_JSON_HPP
