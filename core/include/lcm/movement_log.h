#pragma once

#include <cstddef>
#include <filesystem>
#include <string_view>

// Per-frame locomotion trace (step events, terrain changes, frame summaries).
// Off unless a host opens a file; writers check enabled() before formatting.
namespace lcm::movement_log {

// Truncates `path` and writes `header` as the first line when non-empty.
void open(const std::filesystem::path& path, std::string_view header = {});
// Returns the number of lines written since open, header excluded.
size_t close();
bool enabled();
void write(std::string_view line);
size_t lines_written();

} // namespace lcm::movement_log
