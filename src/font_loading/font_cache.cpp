#include "./font_cache.hpp"

#include "./font_errors.hpp"
#include "../json/font_entry.hpp"

#include <SDL3/SDL.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

static constexpr const char* cache_file_name {"fontlist-v390.json"};

nlohmann::json getDefaultFontCacheMetadata(void) {
	return {
		{"_version", 390},
		{"defaultFamily", {
			{"ttf", "DejaVu Sans"},
			{"afm", "Helvetica"},
		}},
		{"default_size", nullptr},
		{"afmlist", nlohmann::json::array()},
	};
}

nlohmann::json fontCacheToJson(const FontCache& cache) {
	nlohmann::json j = nlohmann::json::object();
	j["ttflist"] = cache.entries;
	j["metadata"] = cache.metadata.is_null() ? nlohmann::json::object() : cache.metadata;
	return j;
}

std::string formatFontEntry(const FontEntry& entry) {
	std::ostringstream ss;
	ss << "FontEntry("
		<< "file='" << entry.file << "', "
		<< "family='" << entry.family << "', "
		<< "style='" << to_string(entry.style) << "', "
		<< "variant='" << entry.variant << "', "
		<< "weight=" << entry.weight << ", "
		<< "stretch='" << to_string(entry.stretch) << "', "
		<< "size='" << entry.size << "')"
	;
	return ss.str();
}

void printFontCache(const FontCache& cache, std::ostream& out) {
	for (const auto& entry : cache.entries) {
		out << formatFontEntry(entry) << "\n";
	}
}

void writeFontCacheAtomic(const FontCache& cache, std::string_view path) {
	const std::filesystem::path target_path{path};
	if (target_path.filename().empty()) {
		throw CacheWriteError("invalid cache path '" + std::string{path} + "'");
	}

	std::string json_str;
	try {
		json_str = fontCacheToJson(cache).dump(2, ' ', true);
	} catch (const nlohmann::json::type_error& e) {
		// eg. paths that are not valid utf-8
		throw CacheWriteError("failed to serialize font cache (" + std::string{e.what()} + ")");
	}

	std::error_code ec;
	if (target_path.has_parent_path()) {
		std::filesystem::create_directories(target_path.parent_path(), ec);
		if (ec) {
			throw CacheWriteError("failed to create '" + target_path.parent_path().generic_u8string() + "' (" + ec.message() + ")");
		}
	}

	std::filesystem::path tmp_path = target_path;
	tmp_path += ".tmp";
	tmp_path.replace_filename("." + tmp_path.filename().generic_u8string());

	{
		std::ofstream ofile{tmp_path, std::ios::binary | std::ios::trunc};
		ofile.write(json_str.data(), json_str.size());
		ofile.flush();
		if (!ofile.good()) {
			ofile.close();
			std::filesystem::remove(tmp_path, ec);
			throw CacheWriteError("failed to write '" + tmp_path.generic_u8string() + "'");
		}
	}

	std::filesystem::rename(tmp_path, target_path, ec);
	if (ec) {
		const std::string reason = ec.message();
		std::filesystem::remove(tmp_path, ec);
		throw CacheWriteError("failed to replace '" + target_path.generic_u8string() + "' (" + reason + ")");
	}
}

std::string getPlatformDefaultCachePath(void) {
	std::filesystem::path home{"."};
	if (const char* home_str = SDL_GetUserFolder(SDL_FOLDER_HOME); home_str != nullptr) {
		home = home_str;
	}

#if defined(_WIN32) || defined(WIN32) || __APPLE__
	return (home / ".matplotlib" / cache_file_name).generic_u8string();
#else // assume linux/xdg
	std::filesystem::path cache_dir = home / ".cache";
	if (const char* xdg_cache = SDL_getenv("XDG_CACHE_HOME"); xdg_cache != nullptr && xdg_cache[0] != '\0') {
		cache_dir = xdg_cache;
	}
	return (cache_dir / "matplotlib" / cache_file_name).generic_u8string();
#endif
}

