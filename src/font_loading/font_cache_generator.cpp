#include "./font_cache_generator.hpp"

#include <iostream>

NormalizeResult generateFontEntries(
	FontQueryInterface& query,
	const std::vector<std::string>& bundled_files,
	bool quiet
) {
	std::string raw = query.queryFiles(bundled_files);
	if (!raw.empty() && raw.back() != '\n') {
		raw.push_back('\n');
	}
	raw += query.queryAll();

	if (!quiet) {
		std::cerr << "FC: queried " << bundled_files.size() << " bundled files and the system catalog using " << query.name() << "\n";
	}

	return normalizeFontEntries(raw, quiet);
}

