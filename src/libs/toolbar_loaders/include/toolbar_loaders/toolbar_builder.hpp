#pragma once

#include <toolbar_layout/collapsing_toolbar.hpp>
#include <toolbar_model/toolbar_description.hpp>

namespace toolbar_loaders {

// Content block declaring one BoxNode per described child, in order, each
// carrying the child's placement annotation. The description is copied.
toolbar_layout::ToolbarContent toolbar_content(const toolbar_model::ToolbarDescription& description);

} // namespace toolbar_loaders
