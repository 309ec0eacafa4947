#pragma once

#include "./font_entry.hpp"

#include <nlohmann/json.hpp>

#include <ostream>
#include <string>
#include <string_view>
#include <vector>

// the immutable result of a generation run.
// metadata is whatever the consumer expects next to the entries
// (default families, version ...), it is passed through unchanged.
struct FontCache {
	std::vector<FontEntry> entries;
	nlohmann::json metadata;
};

// version 390 of the consumer's cache layout
nlohmann::json getDefaultFontCacheMetadata(void);

// {"ttflist": [...], "metadata": {...}}
nlohmann::json fontCacheToJson(const FontCache& cache);

// FontEntry(file='...', family='...', style='normal', ...)
std::string formatFontEntry(const FontEntry& entry);

// one entry per line
void printFontCache(const FontCache& cache, std::ostream& out);

// replaces the file at path only after the new document is fully written.
// throws CacheWriteError
void writeFontCacheAtomic(const FontCache& cache, std::string_view path);

// where the consumer looks for its cache on this platform
std::string getPlatformDefaultCachePath(void);

