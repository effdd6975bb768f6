#include "window_launcher.h"

#include <fmt/core.h>
#include <fmt/format.h>
#include <spawn.h>
#include <sys/wait.h>

#include <cerrno>
#include <cstring>
#include <iostream>

extern char** environ;

ProcessWindowLauncher::~ProcessWindowLauncher() {
  // reap without waiting; the window may outlive us
  if (child_ > 0) {
    int status = 0;
    waitpid(child_, &status, WNOHANG);
  }
}

std::string ProcessWindowLauncher::make_command(
    const std::string& endpoint) const {
  return fmt::format(fmt::runtime(command_template_),
                     fmt::arg("exe", executable_),
                     fmt::arg("endpoint", endpoint));
}

bool ProcessWindowLauncher::launch(const std::string& endpoint,
                                   std::string& error) {
  if (child_ > 0) {
    error = "A console window is already running.";
    return false;
  }

  std::string command;
  try {
    command = make_command(endpoint);
  } catch (const fmt::format_error& e) {
    error = fmt::format("Invalid console window command \"{}\": {}",
                        command_template_, e.what());
    return false;
  }

  std::clog << fmt::format("Launching console window: {}", command)
            << std::endl;

  char sh[] = "/bin/sh";
  char dash_c[] = "-c";
  char* argv[] = {sh, dash_c, command.data(), nullptr};
  pid_t pid = -1;
  int rc = posix_spawn(&pid, "/bin/sh", nullptr, nullptr, argv, environ);
  if (rc != 0) {
    error = fmt::format("Cannot start console window: {}", std::strerror(rc));
    return false;
  }
  child_ = pid;
  return true;
}

std::optional<int> ProcessWindowLauncher::poll_exit() {
  if (child_ <= 0) {
    return std::nullopt;
  }
  int status = 0;
  pid_t result = waitpid(child_, &status, WNOHANG);
  if (result == 0) {
    return std::nullopt;
  }
  child_ = -1;
  if (result < 0) {
    std::cerr << fmt::format("Lost track of console window: {}",
                             std::strerror(errno))
              << std::endl;
    return -1;
  }
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  // killed by a signal
  return 128 + (WIFSIGNALED(status) ? WTERMSIG(status) : 0);
}
