#pragma once

#include <expected>
#include <string>
#include <vector>

// fork/exec argv[0] from PATH, optionally feeding stdin_text, and wait for it.
// Non-zero exit is an error carrying the tool name and code.
std::expected<void, std::string> run_tool(const std::vector<std::string>& argv,
                                          const std::string* stdin_text = nullptr);

enum class DisplayServer { Wayland, X11 };

DisplayServer detect_display_server();
