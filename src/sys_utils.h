#pragma once
#include <filesystem>
#include <string>

namespace SysUtils {

using path_string_t = std::string;

int exec_command(const std::string& utf8_cmd);

std::string get_user_name();
std::string get_executable_path();
std::filesystem::path get_user_config_path();

/**
 * @brief Directory for sockets and other per-session files:
 * $XDG_RUNTIME_DIR, falling back to the system temp directory.
 */
std::filesystem::path get_runtime_dir();

/**
 * @return e.g. "Linux x86_64".
 */
std::string get_platform_name();

/**
 * @brief Use this to convert utf8 paths to OS specific paths.
 *
 * @see SysUtils::get_executable_path()
 */
path_string_t make_path_string(const std::string& utf8_path);

/**
 * @brief Opens a URL or a path with the desktop's default handler.
 * @return true on success.
 */
bool open_external(const std::string& url_or_path);

/**
 * @return the full path of `program` found on $PATH, or "" if none.
 */
std::string find_in_path(const std::string& program);

/**
 * @brief Puts `text` on the clipboard through wl-copy or xclip.
 * @return true on success; false if the tool is missing or exits early.
 */
bool copy_to_clipboard(const std::string& text);

/**
 * @brief Quotes `text` for /bin/sh.
 */
std::string shell_quote(const std::string& text);
}  // namespace SysUtils
