#include <toolbar_loaders/json_loader.hpp>
#include <toolbar_layout/log.hpp>
#include <toolbar_model/alignment.hpp>
#include <nlohmann/json.hpp>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <utility>

namespace toolbar_loaders {

namespace {

using toolbar_layout::layout_logger;
using toolbar_model::kInfinity;

// Pixel count in [0, kInfinity). Checked as a double so oversized or
// fractional JSON numbers never reach an int conversion out of range.
std::optional<int> parse_pixels(const nlohmann::json& v) {
    if (!v.is_number()) return std::nullopt;
    const double d = v.get<double>();
    if (!std::isfinite(d) || d < 0.0 || d >= static_cast<double>(kInfinity)) return std::nullopt;
    return static_cast<int>(d);
}

// Pixel count, or "fill" for kInfinity.
std::optional<int> parse_extent(const nlohmann::json& v) {
    if (v.is_string() && v.get<std::string>() == "fill") return kInfinity;
    return parse_pixels(v);
}

// A missing axis keeps the Alignment default of -1 (start).
std::optional<toolbar_model::Alignment> parse_alignment(const nlohmann::json& v) {
    if (v.is_string()) return toolbar_model::alignment_from_string(v.get<std::string>());
    if (!v.is_object()) return std::nullopt;

    toolbar_model::Alignment a;
    if (v.contains("horizontal")) {
        if (!v["horizontal"].is_number()) return std::nullopt;
        a.horizontal_bias = v["horizontal"].get<float>();
    }
    if (v.contains("vertical")) {
        if (!v["vertical"].is_number()) return std::nullopt;
        a.vertical_bias = v["vertical"].get<float>();
    }
    return a;
}

std::optional<toolbar_model::PlacementStrategy> parse_strategy(const nlohmann::json& c, const std::string& id) {
    const std::string kind = c.contains("strategy") && c["strategy"].is_string()
        ? c["strategy"].get<std::string>() : "none";
    if (kind == "none") return toolbar_model::PlacementNone{};
    if (kind == "pin") return toolbar_model::Pin{};
    if (kind == "parallax") return toolbar_model::Parallax{};
    if (kind == "road") {
        if (!c.contains("collapsed") || !c.contains("expanded")) {
            layout_logger()->error("Toolbar child '{}': road needs 'collapsed' and 'expanded'", id);
            return std::nullopt;
        }
        auto collapsed = parse_alignment(c["collapsed"]);
        auto expanded = parse_alignment(c["expanded"]);
        if (!collapsed || !expanded) {
            layout_logger()->error("Toolbar child '{}': unknown road alignment", id);
            return std::nullopt;
        }
        return toolbar_model::Road{*collapsed, *expanded};
    }
    layout_logger()->error("Toolbar child '{}': unknown strategy '{}'", id, kind);
    return std::nullopt;
}

std::optional<toolbar_model::ToolbarDescription> parse_json(const nlohmann::json& j) {
    toolbar_model::ToolbarDescription d;
    if (!j.contains("children") || !j["children"].is_array()) {
        layout_logger()->error("Toolbar description has no 'children' array");
        return std::nullopt;
    }

    for (const auto& c : j["children"]) {
        toolbar_model::ChildDescription child;
        if (!c.contains("id") || !c["id"].is_string()) {
            layout_logger()->error("Toolbar child without string 'id'");
            return std::nullopt;
        }
        child.id = c["id"].get<std::string>();
        child.label = c.contains("label") && c["label"].is_string() ? c["label"].get<std::string>() : "";

        if (c.contains("width")) {
            auto w = parse_extent(c["width"]);
            if (!w) {
                layout_logger()->error("Toolbar child '{}': bad 'width'", child.id);
                return std::nullopt;
            }
            child.width = *w;
        }
        std::optional<int> h;
        if (c.contains("height")) h = parse_extent(c["height"]);
        if (!h) {
            layout_logger()->error("Toolbar child '{}': missing or bad 'height'", child.id);
            return std::nullopt;
        }
        child.height = *h;

        auto strategy = parse_strategy(c, child.id);
        if (!strategy) return std::nullopt;
        child.strategy = *strategy;

        if (c.contains("color")) {
            const auto& color = c["color"];
            bool ok = color.is_array() && color.size() == 3;
            for (std::size_t i = 0; ok && i < 3; ++i) {
                ok = color[i].is_number_integer() && color[i].get<std::int64_t>() >= 0
                    && color[i].get<std::int64_t>() <= 255;
                if (ok) child.color[i] = static_cast<unsigned char>(color[i].get<std::int64_t>());
            }
            if (!ok) {
                layout_logger()->error("Toolbar child '{}': 'color' must be three integers in 0..255", child.id);
                return std::nullopt;
            }
        }
        d.children.push_back(std::move(child));
    }

    if (j.contains("name") && j["name"].is_string()) d.name = j["name"].get<std::string>();
    if (j.contains("width")) {
        auto w = parse_pixels(j["width"]);
        if (!w) {
            layout_logger()->error("Toolbar description: 'width' must be a pixel count");
            return std::nullopt;
        }
        d.width = *w;
    }

    return d;
}

} // namespace

std::optional<toolbar_model::ToolbarDescription> load_toolbar_from_json(std::istream& in) {
    try {
        nlohmann::json j = nlohmann::json::parse(in);
        return parse_json(j);
    } catch (const nlohmann::json::exception& ex) {
        layout_logger()->error("Toolbar description is not valid JSON: {}", ex.what());
        return std::nullopt;
    }
}

std::optional<toolbar_model::ToolbarDescription> load_toolbar_from_json_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) return std::nullopt;
    auto loaded = load_toolbar_from_json(f);
    if (loaded) layout_logger()->info("Loaded toolbar '{}' ({} children) from {}", loaded->name, loaded->children.size(), path);
    return loaded;
}

} // namespace toolbar_loaders
