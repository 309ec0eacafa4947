#pragma once

#include "./font_query_i.hpp"
#include "./font_entry_normalizer.hpp"

#include <string>
#include <vector>

// queries the bundled files and the whole system, then normalizes both
// result sets together.
// any FontCacheError aborts the run, there is no partial result.
NormalizeResult generateFontEntries(
	FontQueryInterface& query,
	const std::vector<std::string>& bundled_files,
	bool quiet = false
);

