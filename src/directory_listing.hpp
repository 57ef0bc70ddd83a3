#pragma once

#include "filesystem.hpp"
#include <string>
#include <vector>

namespace serveit {

// Byte-wise ascending by name (case-sensitive)
void sort_entries(std::vector<DirEntry>& entries);

// Render the HTML index for already sorted entries. The "../" link is
// emitted only when include_parent is set.
std::string render_directory_listing(const std::vector<DirEntry>& entries, bool include_parent);

} // namespace serveit
