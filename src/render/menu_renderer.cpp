#include "render/menu_renderer.hpp"
#include "ftxui/screen/screen.hpp"
#include <algorithm>
#include <utility>

using namespace ftxui;

namespace term_launcher {

MenuRenderer::MenuRenderer(const MenuModel &menu, std::string title)
    : menu_(menu), title_(std::move(title)) {}

Element MenuRenderer::render_list() const {
  const auto &apps = menu_.apps();
  if (apps.empty()) {
    return vbox({
        text("No applications configured.") | bold,
        text("Add entries to the 'apps' list of the config file.") | dim,
    });
  }

  Elements rows;
  rows.reserve(apps.size());
  for (size_t i = 0; i < apps.size(); ++i) {
    const auto &app = apps[i];
    const bool is_selected = i == menu_.selected_index();

    Element key_label = text(" (" + app.key + ")");
    if (!menu_.hotkey_active(i))
      key_label = key_label | dim;

    Element row = hbox({
        text(is_selected ? "> " : "  "),
        text(app.name),
        key_label,
        filler(),
    });
    if (is_selected)
      row = row | inverted | focus;
    rows.push_back(row);
  }
  return vbox(std::move(rows)) | vscroll_indicator | frame;
}

Element MenuRenderer::render_status() const {
  if (menu_.status().empty())
    return text(" ");
  Element status = text(menu_.status());
  if (menu_.status_is_error())
    return status | color(Color::Red) | bold;
  return status | color(Color::Green);
}

Element MenuRenderer::document() const {
  Element guide = hbox({
      text("↑/↓") | bold,
      text(" move  "),
      text("Enter") | bold,
      text(" launch  "),
      text("key") | bold,
      text(" hotkey  "),
      text("q/Esc") | bold,
      text(" quit"),
  });

  return vbox({
             text(title_) | bold | color(Color::Cyan) | center,
             separator(),
             render_list() | yflex,
             separator(),
             render_status(),
             guide | color(Color::GrayLight),
         }) |
         border;
}

std::string MenuRenderer::render_frame(int cols, int rows) const {
  auto screen = Screen::Create(Dimension::Fixed(std::max(cols, 1)),
                               Dimension::Fixed(std::max(rows, 1)));
  Render(screen, document());
  return screen.ToString();
}

size_t MenuRenderer::visible_rows(int rows) {
  return static_cast<size_t>(std::max(rows - CHROME_ROWS, 1));
}

} // namespace term_launcher
