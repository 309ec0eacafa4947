#include "./bundled_fonts.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <system_error>

std::vector<std::string> listBundledFonts(std::string_view folder_path, bool quiet) {
	std::vector<std::string> files;

	std::filesystem::path dir{folder_path};
	std::error_code ec;
	if (folder_path.empty() || !std::filesystem::is_directory(dir, ec)) {
		if (!quiet) {
			std::cerr << "FS warning: bundled font dir '" << folder_path << "' is not a directory\n";
		}
		return files;
	}

	for (const auto& dir_entry : std::filesystem::directory_iterator(dir)) {
		if (!dir_entry.is_regular_file()) {
			continue;
		}

		std::string extension = dir_entry.path().extension().generic_u8string();
		std::transform(extension.begin(), extension.end(), extension.begin(), [](unsigned char c) { return std::tolower(c); });
		if (extension != ".ttf") {
			continue;
		}

		// fc-query wants something it can open regardless of cwd
		files.push_back(std::filesystem::absolute(dir_entry.path()).generic_u8string());
	}

	std::sort(files.begin(), files.end());

	return files;
}

