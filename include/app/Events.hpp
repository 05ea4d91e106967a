#pragma once
#include <variant>
#include "model/Snapshot.hpp"
#include "ui/Navigation.hpp"

namespace nettui::app {

struct CommandEvent { ui::Command cmd; };
struct ResizeEvent  { int cols{}; int rows{}; };
struct TickEvent    {};                      // clock redraw
struct DataEvent    { model::Snapshot snap; };
struct QuitEvent    {};                      // signal or input shutdown

using Event = std::variant<CommandEvent, ResizeEvent, TickEvent, DataEvent, QuitEvent>;

} // namespace nettui::app
