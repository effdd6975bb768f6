#include "sys_utils.h"

#include <linux/limits.h>
#include <pwd.h>
#include <signal.h>
#include <sys/utsname.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <string>

#include "fmt/core.h"

int SysUtils::exec_command(const std::string& cmd) {
  std::string silent_cmd = cmd + " > /dev/null 2>&1";
  return std::system(silent_cmd.c_str());
}

std::string SysUtils::get_user_name() {
  // environment variables are the only reliable way to get real user when
  // running under sudo or pkexec.
  char* env_user = std::getenv("USER");
  char* env_sudo_uid = std::getenv("SUDO_UID");

  std::string ret;
  struct passwd* pw = nullptr;
  if (env_sudo_uid != nullptr) {
    pw = getpwuid(std::stoul(env_sudo_uid));
  } else if (env_user != nullptr) {
    ret = env_user;
  } else {
    pw = getpwuid(geteuid());
  }

  if (pw != nullptr) {
    ret = pw->pw_name;
  }
  return ret;
}

std::string SysUtils::get_executable_path() {
  char result[PATH_MAX];
  ssize_t count = readlink("/proc/self/exe", result, PATH_MAX);
  if (count < 0) {
    return "";
  }
  return std::string(result, count);
}

std::filesystem::path SysUtils::get_user_config_path() {
  const char* xdg_config = std::getenv("XDG_CONFIG_HOME");
  if (xdg_config != nullptr && xdg_config[0] != '\0') {
    return std::filesystem::path(xdg_config) / "logdock";
  }
  std::string user_name = get_user_name();
  struct passwd* pw = getpwnam(user_name.c_str());
  if (pw == nullptr) {
    return std::filesystem::path();
  }
  return std::filesystem::path(pw->pw_dir) / ".config" / "logdock";
}

std::filesystem::path SysUtils::get_runtime_dir() {
  const char* runtime_dir = std::getenv("XDG_RUNTIME_DIR");
  if (runtime_dir != nullptr && runtime_dir[0] != '\0') {
    return std::filesystem::path(runtime_dir);
  }
  std::error_code ec;
  std::filesystem::path tmp = std::filesystem::temp_directory_path(ec);
  return ec ? std::filesystem::path("/tmp") : tmp;
}

std::string SysUtils::get_platform_name() {
  struct utsname info;
  if (uname(&info) != 0) {
    return "Linux";
  }
  return fmt::format("{} {}", info.sysname, info.machine);
}

SysUtils::path_string_t SysUtils::make_path_string(
    const std::string& utf8_path) {
  return utf8_path;
}

std::string SysUtils::shell_quote(const std::string& text) {
  std::string quoted = "'";
  for (char c : text) {
    if (c == '\'') {
      quoted += "'\\''";
    } else {
      quoted += c;
    }
  }
  quoted += "'";
  return quoted;
}

bool SysUtils::open_external(const std::string& url_or_path) {
  return exec_command(fmt::format("xdg-open {}", shell_quote(url_or_path))) ==
         0;
}

std::string SysUtils::find_in_path(const std::string& program) {
  const char* env_path = std::getenv("PATH");
  if (env_path == nullptr) {
    return "";
  }
  std::string paths = env_path;
  size_t begin = 0;
  while (begin <= paths.size()) {
    size_t end = paths.find(':', begin);
    if (end == std::string::npos) end = paths.size();
    std::string dir = paths.substr(begin, end - begin);
    if (dir.empty()) dir = ".";
    std::string candidate = dir + "/" + program;
    if (access(candidate.c_str(), X_OK) == 0) {
      return candidate;
    }
    begin = end + 1;
  }
  return "";
}

bool SysUtils::copy_to_clipboard(const std::string& text) {
  const char* wayland = std::getenv("WAYLAND_DISPLAY");
  bool use_wayland = wayland != nullptr && wayland[0] != '\0';
  std::string program = use_wayland ? "wl-copy" : "xclip";
  if (find_in_path(program).empty()) {
    return false;
  }
  std::string command = use_wayland ? "wl-copy 2> /dev/null"
                                    : "xclip -selection clipboard 2> /dev/null";

  // the tool may exit before reading everything; keep SIGPIPE from killing us
  // and report the write as failed instead.
  sigset_t sigpipe_set;
  sigset_t old_set;
  sigemptyset(&sigpipe_set);
  sigaddset(&sigpipe_set, SIGPIPE);
  if (pthread_sigmask(SIG_BLOCK, &sigpipe_set, &old_set) != 0) {
    return false;
  }
  bool was_pending = false;
  {
    sigset_t pending;
    sigpending(&pending);
    was_pending = sigismember(&pending, SIGPIPE) == 1;
  }

  bool ok = false;
  FILE* pipe = popen(command.c_str(), "w");
  if (pipe != nullptr) {
    size_t written = std::fwrite(text.data(), 1, text.size(), pipe);
    bool flushed = std::fflush(pipe) == 0;
    int status = pclose(pipe);
    ok = written == text.size() && flushed && status == 0;
  }

  if (!was_pending) {
    // consume the SIGPIPE raised by our own write, if any
    struct timespec no_wait = {0, 0};
    while (sigtimedwait(&sigpipe_set, nullptr, &no_wait) == -1 &&
           errno == EINTR) {
    }
  }
  pthread_sigmask(SIG_SETMASK, &old_set, nullptr);
  return ok;
}
