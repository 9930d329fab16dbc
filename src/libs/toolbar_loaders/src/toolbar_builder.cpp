#include <toolbar_loaders/toolbar_builder.hpp>
#include <toolbar_layout/modifier.hpp>
#include <type_traits>
#include <utility>
#include <variant>

namespace toolbar_loaders {

toolbar_layout::ToolbarContent toolbar_content(const toolbar_model::ToolbarDescription& description) {
    return [children = description.children](toolbar_layout::CollapsingToolbarScope& scope) {
        for (const auto& c : children) {
            toolbar_layout::Modifier modifier = std::visit([&](const auto& strategy) {
                using T = std::decay_t<decltype(strategy)>;
                const toolbar_layout::Modifier none;
                if constexpr (std::is_same_v<T, toolbar_model::Road>)
                    return scope.road(none, strategy.when_collapsed, strategy.when_expanded);
                else if constexpr (std::is_same_v<T, toolbar_model::Parallax>)
                    return scope.parallax(none);
                else if constexpr (std::is_same_v<T, toolbar_model::Pin>)
                    return scope.pin(none);
                else
                    return none;
            }, c.strategy);
            scope.box(c.id, toolbar_model::IntSize{c.width, c.height}, std::move(modifier));
        }
    };
}

} // namespace toolbar_loaders
