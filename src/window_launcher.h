#pragma once

#include <sys/types.h>

#include <optional>
#include <string>

// Starts the standalone console window for a port endpoint.
class WindowLauncher {
 public:
  virtual ~WindowLauncher() = default;

  /**
   * @return false with `error` set if the window could not be started.
   */
  virtual bool launch(const std::string& endpoint, std::string& error) = 0;

  /**
   * @return the exit status once the launched window has exited; reported
   * once.
   */
  virtual std::optional<int> poll_exit() = 0;
};

/**
 * @brief Runs a shell command template in a new process. "{exe}" is replaced
 * by this executable and "{endpoint}" by the port endpoint.
 */
class ProcessWindowLauncher : public WindowLauncher {
 public:
  static inline const std::string DEFAULT_COMMAND =
      "x-terminal-emulator -e \"{exe}\" --console-window \"{endpoint}\"";

  ProcessWindowLauncher(std::string command_template, std::string executable)
      : command_template_(std::move(command_template)),
        executable_(std::move(executable)) {}
  ~ProcessWindowLauncher() override;

  bool launch(const std::string& endpoint, std::string& error) override;
  std::optional<int> poll_exit() override;

  /**
   * @throws fmt::format_error on a malformed template.
   */
  std::string make_command(const std::string& endpoint) const;

 private:
  std::string command_template_;
  std::string executable_;
  pid_t child_ = -1;
};
