#pragma once

#include "./font_entry.hpp"

#include <string>
#include <string_view>
#include <vector>

struct NormalizeResult {
	// sorted by file, stable
	std::vector<FontEntry> entries;

	// files of records that were dropped (variable weight or width, no family)
	std::vector<std::string> skipped;
};

// turns raw fc-query/fc-list output (see fc_record_scanner.hpp) into
// font entries, one per (file, family).
// throws MalformedRecord or UnknownStyleCode, nothing is returned partially.
// skipped records are reported to stderr unless quiet is set.
NormalizeResult normalizeFontEntries(std::string_view raw_text, bool quiet = false);

