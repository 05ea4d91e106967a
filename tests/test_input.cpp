#include "minitest.hpp"
#include "ui/Input.hpp"

using namespace nettui::ui;

static std::optional<Command> first_command(std::string_view bytes) {
  auto keys = decode_keys(bytes);
  if (keys.size() != 1) return std::nullopt;
  return command_for(keys.front());
}

TEST(input_letter_keys_map_to_commands) {
  ASSERT_TRUE(first_command("q") == Command::Quit);
  ASSERT_TRUE(first_command("l") == Command::NextTab);
  ASSERT_TRUE(first_command("h") == Command::PrevTab);
  ASSERT_TRUE(first_command("j") == Command::Down);
  ASSERT_TRUE(first_command("k") == Command::Up);
  ASSERT_TRUE(first_command("g") == Command::Top);
  ASSERT_TRUE(first_command("G") == Command::Bottom);
  ASSERT_TRUE(first_command("1") == Command::ShowConnections);
  ASSERT_TRUE(first_command("2") == Command::ShowPorts);
  ASSERT_TRUE(first_command("3") == Command::ShowInterfaces);
  ASSERT_TRUE(first_command("r") == Command::Refresh);
}

TEST(input_control_and_escape_sequences) {
  ASSERT_TRUE(first_command("\x03") == Command::Quit);
  ASSERT_TRUE(first_command("\t") == Command::NextTab);
  ASSERT_TRUE(first_command("\x1B[Z") == Command::PrevTab);
  ASSERT_TRUE(first_command("\x1B[A") == Command::Up);
  ASSERT_TRUE(first_command("\x1B[B") == Command::Down);
  ASSERT_TRUE(first_command("\x1B[C") == Command::NextTab);
  ASSERT_TRUE(first_command("\x1B[D") == Command::PrevTab);
  ASSERT_TRUE(first_command("\x1B[H") == Command::Top);
  ASSERT_TRUE(first_command("\x1B[F") == Command::Bottom);
  ASSERT_TRUE(first_command("\x1B[1~") == Command::Top);
  ASSERT_TRUE(first_command("\x1B[4~") == Command::Bottom);
  ASSERT_TRUE(first_command("\x1BOA") == Command::Up);
  ASSERT_TRUE(first_command("\x1BOH") == Command::Top);
}

TEST(input_unbound_keys_are_ignored) {
  ASSERT_TRUE(!first_command("x").has_value());
  ASSERT_TRUE(!first_command("\x1B").has_value());
  ASSERT_TRUE(!first_command("\x1B[1;5A").has_value());
  ASSERT_TRUE(!first_command("\x1B[5~").has_value());
}

TEST(input_chunk_with_several_keys) {
  auto keys = decode_keys("jj\x1B[Bq");
  ASSERT_EQ(keys.size(), (size_t)4);
  ASSERT_TRUE(keys[2].code == KeyCode::Down);
  ASSERT_TRUE(keys[3].code == KeyCode::Char && keys[3].ch == 'q');
}
