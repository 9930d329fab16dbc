#pragma once

#include <toolbar_model/toolbar_description.hpp>
#include <istream>
#include <optional>
#include <string>

namespace toolbar_loaders {

std::optional<toolbar_model::ToolbarDescription> load_toolbar_from_json(std::istream& in);
std::optional<toolbar_model::ToolbarDescription> load_toolbar_from_json_file(const std::string& path);

// Profile-header style toolbar used when no description file is found.
toolbar_model::ToolbarDescription generate_demo_toolbar();

} // namespace toolbar_loaders
