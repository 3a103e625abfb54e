#pragma once

#include <string>

namespace relay_feed::platform {

/**
 * @brief Returns the user's home directory path.
 *
 * @return Home directory path, empty if it cannot be determined
 */
[[nodiscard]] auto get_home_directory() -> std::string;

/**
 * @brief Expands a leading tilde (~/) to the home directory.
 *
 * @param path Path possibly starting with ~/
 * @return Expanded path, or the input when no expansion applies
 */
[[nodiscard]] auto expand_tilde_path(const std::string &path) -> std::string;

/**
 * @brief Default location of the relay-feed configuration file.
 *
 * @return Expanded path of ~/.config/relay-feed/config.toml
 */
[[nodiscard]] auto default_config_path() -> std::string;

}// namespace relay_feed::platform
