#include "tui_menu.hpp"
#include "trace.hpp"
#include <algorithm>
#include <utility>

namespace term_launcher {

MenuModel::MenuModel(std::vector<AppEntry> apps) : apps_(std::move(apps)) {
  build_hotkeys();
}

void MenuModel::build_hotkeys() {
  hotkey_active_.assign(apps_.size(), false);
  bool used[128] = {};
  for (size_t i = 0; i < apps_.size(); ++i) {
    const auto &app = apps_[i];
    if (!app.has_hotkey())
      continue;
    const char key = app.hotkey();
    if (key == QUIT_KEY) {
      warnings_.push_back("'" + app.name + "': key 'q' is reserved for quit");
      continue;
    }
    if (used[static_cast<unsigned char>(key)]) {
      warnings_.push_back("'" + app.name + "': key '" + std::string(1, key) +
                          "' is already bound to an earlier entry");
      continue;
    }
    used[static_cast<unsigned char>(key)] = true;
    hotkey_active_[i] = true;
  }
  for (const auto &warning : warnings_)
    TRACE_WARN("CONFIG", warning);
}

const AppEntry *MenuModel::selected() const {
  return apps_.empty() ? nullptr : &apps_[selected_];
}

void MenuModel::move_up() {
  if (selected_ > 0)
    --selected_;
}

void MenuModel::move_down() {
  if (selected_ + 1 < apps_.size())
    ++selected_;
}

void MenuModel::move_home() { selected_ = 0; }

void MenuModel::move_end() { selected_ = apps_.empty() ? 0 : apps_.size() - 1; }

void MenuModel::page_up(size_t page) {
  page = std::max<size_t>(page, 1);
  selected_ = selected_ > page ? selected_ - page : 0;
}

void MenuModel::page_down(size_t page) {
  if (apps_.empty())
    return;
  page = std::max<size_t>(page, 1);
  selected_ = std::min(selected_ + page, apps_.size() - 1);
}

bool MenuModel::select(size_t index) {
  if (index >= apps_.size())
    return false;
  selected_ = index;
  return true;
}

int MenuModel::find_hotkey(char key) const {
  for (size_t i = 0; i < apps_.size(); ++i)
    if (hotkey_active_[i] && apps_[i].hotkey() == key)
      return static_cast<int>(i);
  return -1;
}

bool MenuModel::hotkey_active(size_t index) const {
  return index < hotkey_active_.size() && hotkey_active_[index];
}

void MenuModel::set_status(const std::string &text, bool is_error) {
  status_ = text;
  status_error_ = is_error;
}

void MenuModel::clear_status() {
  status_.clear();
  status_error_ = false;
}

} // namespace term_launcher
