#include <toolbar_model/alignment.hpp>
#include <utility>

namespace toolbar_model {

IntOffset Alignment::align(const IntSize& size, const IntSize& space) const {
    const float center_x = static_cast<float>(space.width - size.width) / 2.0f;
    const float center_y = static_cast<float>(space.height - size.height) / 2.0f;
    // TODO: mirror horizontal_bias once layout direction reaches the measure pass.
    const float x = center_x * (1.0f + horizontal_bias);
    const float y = center_y * (1.0f + vertical_bias);
    return IntOffset{round_to_int(x), round_to_int(y)};
}

std::optional<Alignment> alignment_from_string(const std::string& name) {
    static const std::pair<const char*, Alignment> named[] = {
        {"top_start", alignment::top_start},
        {"top_center", alignment::top_center},
        {"top_end", alignment::top_end},
        {"center_start", alignment::center_start},
        {"center", alignment::center},
        {"center_end", alignment::center_end},
        {"bottom_start", alignment::bottom_start},
        {"bottom_center", alignment::bottom_center},
        {"bottom_end", alignment::bottom_end},
    };
    for (const auto& [key, value] : named) {
        if (name == key) return value;
    }
    return std::nullopt;
}

} // namespace toolbar_model
