#include "./fontcache_run.hpp"

#include "./font_loading/bundled_fonts.hpp"
#include "./font_loading/font_cache.hpp"
#include "./font_loading/font_cache_generator.hpp"
#include "./font_loading/font_errors.hpp"
#include "./font_loading/font_query_i.hpp"

#include <exception>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

int runFontCache(const FontCacheOptions& opts, FontQueryInterface& query, std::ostream& out) {
	try {
		const std::vector<std::string> bundled_files = listBundledFonts(opts.bundled_dir, opts.quiet);

		auto res = generateFontEntries(query, bundled_files, opts.quiet);

		const FontCache cache{
			std::move(res.entries),
			opts.cache_metadata,
		};

		if (opts.action == "print") {
			printFontCache(cache, out);
		} else {
			writeFontCacheAtomic(cache, opts.cache_path);
			out << "Font cache written to " << opts.cache_path << "\n";
		}
	} catch (const FontCacheError& e) {
		std::cerr << "FONTCACHE error (" << e.stage() << "): " << e.what() << "\n";
		return 1;
	} catch (const std::exception& e) {
		std::cerr << "FONTCACHE error: " << e.what() << "\n";
		return 1;
	}

	return 0;
}

