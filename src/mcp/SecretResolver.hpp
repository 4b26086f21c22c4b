// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <chrono>
#include <map>
#include <string>
#include <vector>

namespace mcpgate
{

/// @brief Runs a secret-producing command and returns its trimmed standard output.
///
/// The command is executed directly (no shell). Its stderr is inherited.
/// @param argv The command and its arguments.
/// @param timeout Time after which the command is killed.
/// @return The output, or SecretResolutionError on spawn failure, non-zero exit or timeout.
[[nodiscard]] auto runSecretCommand(const std::vector<std::string>& argv, std::chrono::milliseconds timeout)
    -> Result<std::string>;

/// @brief Resolves every secret command of a backend into environment variables.
///
/// Fails on the first command that fails; the error names the variable.
/// @param secretCommands Environment variable name -> command.
/// @param timeout Per-command timeout.
[[nodiscard]] auto resolveSecrets(const std::map<std::string, std::vector<std::string>>& secretCommands,
                                  std::chrono::milliseconds timeout) -> Result<std::map<std::string, std::string>>;

} // namespace mcpgate
