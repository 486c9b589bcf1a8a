#pragma once

#include "core/process_spawner.hpp"
#include "terminal_device.hpp"
#include "terminal_guard.hpp"

#include <cstdlib>
#include <deque>
#include <filesystem>
#include <fstream>
#include <functional>
#include <stdexcept>
#include <string>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

namespace test_support {

// 测试用临时目录，析构时删除
class TempDir {
public:
  TempDir() {
    std::string pattern =
        (std::filesystem::temp_directory_path() / "term_launcher_XXXXXX")
            .string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');
    if (!mkdtemp(buffer.data()))
      throw std::runtime_error("mkdtemp failed");
    path_ = std::filesystem::canonical(buffer.data()).string();
    ::chmod(path_.c_str(), 0755);
  }

  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  TempDir(const TempDir &) = delete;
  TempDir &operator=(const TempDir &) = delete;

  const std::string &path() const { return path_; }

  std::string make_dir(const std::string &name, mode_t mode = 0755) const {
    const std::string dir = path_ + "/" + name;
    std::filesystem::create_directories(dir);
    // umask不影响chmod
    ::chmod(dir.c_str(), mode);
    return dir;
  }

  std::string write_file(const std::string &name, const std::string &content,
                         mode_t mode = 0755) const {
    const std::string file = path_ + "/" + name;
    {
      std::ofstream out(file, std::ios::binary | std::ios::trunc);
      out << content;
    }
    ::chmod(file.c_str(), mode);
    return file;
  }

  std::string make_script(const std::string &name,
                          const std::string &body = "exit 0\n") const {
    return write_file(name, "#!/bin/sh\n" + body, 0755);
  }

  std::string make_symlink(const std::string &target,
                           const std::string &name) const {
    const std::string link = path_ + "/" + name;
    std::filesystem::create_symlink(target, link);
    return link;
  }

private:
  std::string path_;
};

// 记录终端状态变化的假设备
class FakeTerminal : public term_launcher::TerminalDevice {
public:
  bool raw = false;
  bool alternate_screen = false;
  bool refuse_raw = false;
  int raw_enables = 0;
  int restores = 0;
  int emergency_restores = 0;
  std::string output;
  std::deque<int> input;

  bool enable_raw_mode() override {
    if (refuse_raw)
      return false;
    raw = true;
    ++raw_enables;
    return true;
  }

  bool restore_mode() override {
    raw = false;
    ++restores;
    return true;
  }

  bool write(const std::string &data) override {
    output += data;
    if (data.find("\033[?1049h") != std::string::npos)
      alternate_screen = true;
    if (data.find("\033[?1049l") != std::string::npos)
      alternate_screen = false;
    return true;
  }

  int read_byte(int) override {
    if (input.empty())
      return READ_EOF;
    const int byte = input.front();
    input.pop_front();
    return byte;
  }

  void emergency_restore() noexcept override {
    raw = false;
    alternate_screen = false;
    ++emergency_restores;
  }

  void queue(const std::string &bytes) {
    for (unsigned char c : bytes)
      input.push_back(c);
  }

  bool in_normal_mode() const { return !raw && !alternate_screen; }
};

// 记录调用参数、不真正创建进程
class FakeSpawner : public term_launcher::ProcessSpawner {
public:
  term_launcher::SpawnOutcome outcome;
  std::vector<term_launcher::ResolvedCommand> commands;
  std::vector<std::string> argv0s;
  std::vector<term_launcher::TerminalMode> modes_during_run;
  term_launcher::TerminalGuard *observed_guard = nullptr;
  bool throw_on_run = false;
  std::function<void()> on_run; // 模拟子进程运行期间的副作用

  FakeSpawner() { outcome.started = true; }

  term_launcher::SpawnOutcome run(const term_launcher::ResolvedCommand &command,
                                  const std::string &argv0) override {
    commands.push_back(command);
    argv0s.push_back(argv0);
    if (observed_guard)
      modes_during_run.push_back(observed_guard->mode());
    if (on_run)
      on_run();
    if (throw_on_run)
      throw std::runtime_error("spawner failure");
    return outcome;
  }
};

} // namespace test_support
