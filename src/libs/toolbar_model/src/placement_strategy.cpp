#include <toolbar_model/placement_strategy.hpp>
#include <type_traits>

namespace toolbar_model {

const char* strategy_name(const PlacementStrategy& strategy) {
    return std::visit([](const auto& s) -> const char* {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, Road>) return "road";
        else if constexpr (std::is_same_v<T, Parallax>) return "parallax";
        else if constexpr (std::is_same_v<T, Pin>) return "pin";
        else return "none";
    }, strategy);
}

} // namespace toolbar_model
