#pragma once

#include <string>
#include <string_view>
#include <vector>

// the .ttf files shipped with the consumer, directly in folder_path (not recursive).
// sorted. missing folder yields an empty list (and a warning unless quiet)
std::vector<std::string> listBundledFonts(std::string_view folder_path, bool quiet = false);

