#include "tui_logic.hpp"
#include "trace.hpp"
#include <stdexcept>

namespace term_launcher {

UILogic::UILogic(MenuModel &menu, TerminalGuard &guard,
                 LaunchOrchestrator &orchestrator)
    : menu_(menu), guard_(guard), orchestrator_(orchestrator),
      renderer_(menu) {}

int UILogic::run() {
  if (!guard_.enter_ui())
    throw std::runtime_error("cannot switch the terminal to raw mode");

  if (!menu_.warnings().empty())
    menu_.set_status(menu_.warnings().front(), true);

  refresh_size();
  redraw();

  auto next_byte = [this](int timeout_ms) {
    return guard_.device().read_byte(timeout_ms);
  };

  for (;;) {
    const KeyEvent key = KeyDecoder::read_key(next_byte, RESIZE_POLL_MS);
    if (key.type == KeyType::NONE) {
      if (refresh_size())
        redraw();
      continue;
    }
    if (!handle_key(key))
      break;
    redraw();
  }

  guard_.leave_ui();
  return 0;
}

bool UILogic::handle_key(const KeyEvent &key) {
  const size_t page = MenuRenderer::visible_rows(size_.dimy);
  switch (key.type) {
  case KeyType::UP:
    menu_.move_up();
    break;
  case KeyType::DOWN:
    menu_.move_down();
    break;
  case KeyType::HOME:
    menu_.move_home();
    break;
  case KeyType::END:
    menu_.move_end();
    break;
  case KeyType::PAGE_UP:
    menu_.page_up(page);
    break;
  case KeyType::PAGE_DOWN:
    menu_.page_down(page);
    break;
  case KeyType::ENTER:
    if (!menu_.empty())
      launch(menu_.selected_index());
    break;
  case KeyType::ESCAPE:
  case KeyType::CTRL_C:
  case KeyType::END_OF_INPUT:
    return false;
  case KeyType::CHARACTER: {
    if (key.ch == MenuModel::QUIT_KEY)
      return false;
    const int index = menu_.find_hotkey(key.ch);
    if (index >= 0) {
      menu_.select(static_cast<size_t>(index));
      launch(static_cast<size_t>(index));
    }
    break;
  }
  case KeyType::NONE:
    break;
  }
  return true;
}

void UILogic::launch(size_t index) {
  // 拷贝一份：启动期间菜单数据不变，但不依赖这一点
  const AppEntry entry = menu_.apps().at(index);
  TRACE_DEBUG("UI", "launching entry #" + std::to_string(index));

  const auto result = orchestrator_.launch(entry);

  if (!guard_.ui_active() && !guard_.enter_ui())
    throw std::runtime_error("cannot restore the launcher UI after '" +
                             entry.name + "'");

  if (!result.ok()) {
    menu_.set_status(result.refusal->message(), true);
    return;
  }
  const ExitStatus &status = *result.value;
  menu_.set_status(entry.name + " exited with " + status.describe(),
                   !status.success());

  // 子进程可能改变了终端尺寸
  refresh_size();
}

bool UILogic::refresh_size() {
  const ftxui::Dimensions size = ftxui::Terminal::Size();
  if (size.dimx == size_.dimx && size.dimy == size_.dimy)
    return false;
  size_ = size;
  return true;
}

void UILogic::redraw() {
  if (!guard_.draw(renderer_.render_frame(size_.dimx, size_.dimy)))
    TRACE_WARN("UI", "failed to draw frame");
}

} // namespace term_launcher
