#pragma once

#include "./fontcache_options.hpp"

#include <ostream>

// fwd
struct FontQueryInterface;

// generates the cache and prints it to out or writes it to opts.cache_path.
// returns the exit code, 0 on success, 1 on any FontCacheError
int runFontCache(const FontCacheOptions& opts, FontQueryInterface& query, std::ostream& out);

