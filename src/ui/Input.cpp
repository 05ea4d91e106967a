#include "ui/Input.hpp"

namespace nettui::ui {

// Default keybind table for printable keys
struct KeybindDef { const char* name; char key; Command action; };
static constexpr KeybindDef default_keybinds[] = {
  {"quit",            'q', Command::Quit},
  {"next_tab",        'l', Command::NextTab},
  {"prev_tab",        'h', Command::PrevTab},
  {"down",            'j', Command::Down},
  {"up",              'k', Command::Up},
  {"top",             'g', Command::Top},
  {"bottom",          'G', Command::Bottom},
  {"show_connections",'1', Command::ShowConnections},
  {"show_ports",      '2', Command::ShowPorts},
  {"show_interfaces", '3', Command::ShowInterfaces},
  {"refresh",         'r', Command::Refresh},
};

std::optional<Command> command_for(const Key& key) {
  switch (key.code) {
    case KeyCode::Char:
      for (const auto& kb : default_keybinds)
        if (kb.key == key.ch) return kb.action;
      return std::nullopt;
    case KeyCode::Tab:       return Command::NextTab;
    case KeyCode::BackTab:   return Command::PrevTab;
    case KeyCode::Right:     return Command::NextTab;
    case KeyCode::Left:      return Command::PrevTab;
    case KeyCode::Down:      return Command::Down;
    case KeyCode::Up:        return Command::Up;
    case KeyCode::Home:      return Command::Top;
    case KeyCode::End:       return Command::Bottom;
    case KeyCode::Interrupt: return Command::Quit;
    case KeyCode::Escape:    return std::nullopt;
    case KeyCode::Unknown:   return std::nullopt;
  }
  return std::nullopt;
}

static KeyCode csi_final(char f) {
  switch (f) {
    case 'A': return KeyCode::Up;
    case 'B': return KeyCode::Down;
    case 'C': return KeyCode::Right;
    case 'D': return KeyCode::Left;
    case 'H': return KeyCode::Home;
    case 'F': return KeyCode::End;
    case 'Z': return KeyCode::BackTab;
    default:  return KeyCode::Unknown;
  }
}

// ESC [ <n> ~ forms: 1/7 Home, 4/8 End
static KeyCode csi_tilde(std::string_view params) {
  if (params == "1" || params == "7") return KeyCode::Home;
  if (params == "4" || params == "8") return KeyCode::End;
  return KeyCode::Unknown;
}

std::vector<Key> decode_keys(std::string_view bytes) {
  std::vector<Key> out;
  size_t k = 0;
  while (k < bytes.size()) {
    unsigned char c = static_cast<unsigned char>(bytes[k++]);
    if (c == 0x03) { out.push_back({KeyCode::Interrupt}); continue; }
    if (c == '\t') { out.push_back({KeyCode::Tab}); continue; }
    if (c != 0x1B) {
      if (c >= 0x20 && c < 0x7F) out.push_back({KeyCode::Char, static_cast<char>(c)});
      else out.push_back({KeyCode::Unknown});
      continue;
    }
    // ESC alone (or at the end of the chunk)
    if (k >= bytes.size() || (bytes[k] != '[' && bytes[k] != 'O')) {
      out.push_back({KeyCode::Escape});
      continue;
    }
    char intro = bytes[k++];
    if (intro == 'O') {
      // SS3: application cursor mode arrows and Home/End
      if (k >= bytes.size()) { out.push_back({KeyCode::Unknown}); break; }
      out.push_back({csi_final(bytes[k++])});
      continue;
    }
    // CSI: parameter bytes then one final byte in '@'..'~'
    size_t start = k;
    while (k < bytes.size() && (bytes[k] < '@' || bytes[k] > '~')) ++k;
    if (k >= bytes.size()) { out.push_back({KeyCode::Unknown}); break; }
    std::string_view params = bytes.substr(start, k - start);
    char fin = bytes[k++];
    if (fin == '~') out.push_back({csi_tilde(params)});
    else if (params.empty()) out.push_back({csi_final(fin)});
    else out.push_back({KeyCode::Unknown}); // modified keys (e.g. ESC[1;5A)
  }
  return out;
}

} // namespace nettui::ui
