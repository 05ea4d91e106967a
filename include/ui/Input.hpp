#pragma once

#include <optional>
#include <string_view>
#include <vector>
#include "ui/Navigation.hpp"

namespace nettui::ui {

enum class KeyCode { Char, Tab, BackTab, Up, Down, Left, Right, Home, End, Interrupt, Escape, Unknown };

struct Key {
  KeyCode code{KeyCode::Unknown};
  char ch{0}; // set for KeyCode::Char
};

// Decode a chunk of raw terminal input (plain bytes and CSI/SS3 sequences).
std::vector<Key> decode_keys(std::string_view bytes);

// Keymap lookup; unbound keys yield std::nullopt.
std::optional<Command> command_for(const Key& key);

} // namespace nettui::ui
