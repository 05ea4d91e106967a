#pragma once

#include <string>
#include <vector>
#include "model/Snapshot.hpp"
#include "ui/Config.hpp"
#include "ui/Navigation.hpp"

namespace nettui::ui {

// Pure frame builder: one string per terminal row, each clipped and padded to
// the viewport width. Returns {"loading..."} until the viewport is known.
std::vector<std::string> render_frame(const NavState& s, const model::Snapshot& data,
                                      const Theme& theme, const std::string& clock);

// Write a frame to stdout in a single write (cursor home, at most `rows` lines).
void present(const std::vector<std::string>& frame, int cols, int rows);

} // namespace nettui::ui
