#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <vector>

// fwd
struct SimpleConfigModel;

struct FontCacheCliArgs {
	std::string config_path;
	std::string bundled_dir;
	std::string output;
	bool quiet {false};
	bool help {false};
	std::string action; // "print" or "write"
};

// everything a run needs, after cli > config > default
struct FontCacheOptions {
	std::string action;
	std::string bundled_dir;
	std::string cache_path;
	std::string fc_query_bin {"fc-query"};
	std::string fc_list_bin {"fc-list"};
	bool quiet {false};
	nlohmann::json cache_metadata;
};

// args includes the program name at [0].
// returns false on usage errors (reason on stderr)
bool parseCliArgs(const std::vector<std::string_view>& args, FontCacheCliArgs& cli);

// "cache_metadata" is not a config module, it is moved out of config_json
// into cache_metadata_out as is. the rest goes into conf.
bool loadConfigJson(nlohmann::ordered_json& config_json, SimpleConfigModel& conf, nlohmann::json& cache_metadata_out);

// opens and parses the file, then loadConfigJson()
bool loadConfigFile(const std::string& config_path, SimpleConfigModel& conf, nlohmann::json& cache_metadata_out);

// returns false if no bundled font dir is given by cli or config,
// the consumer's bundled fonts would be missing from the cache otherwise
bool resolveOptions(SimpleConfigModel& conf, const FontCacheCliArgs& cli, nlohmann::json cache_metadata, FontCacheOptions& out);

