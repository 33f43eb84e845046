#pragma once

#include <expected>
#include <optional>
#include <string>
#include <vector>

namespace platform {

// Exit code execvp() failures are reported with (the shell's "not found").
inline constexpr int kCommandNotFound = 127;

// Runs argv[0] from PATH, optionally feeding `input` to its stdin, and waits
// for it. Returns the exit code; errors are for fork/pipe/wait failures only.
std::expected<int, std::string> run_command(const std::vector<std::string>& argv,
                                            const std::optional<std::string>& input = std::nullopt);

} // namespace platform
