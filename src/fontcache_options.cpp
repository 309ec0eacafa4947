#include "./fontcache_options.hpp"

#include "./json_to_config.hpp"
#include "./font_loading/font_cache.hpp"

#include <solanaceae/util/simple_config_model.hpp>

#include <fstream>
#include <iostream>
#include <utility>

bool parseCliArgs(const std::vector<std::string_view>& args, FontCacheCliArgs& cli) {
	for (size_t ai = 1; ai < args.size(); ai++) {
		if (args.at(ai) == "--help" || args.at(ai) == "-h") {
			cli.help = true;
		} else if (args.at(ai) == "--quiet" || args.at(ai) == "-q") {
			cli.quiet = true;
		} else if (
			args.at(ai) == "--config" || args.at(ai) == "-c"
			|| args.at(ai) == "--bundled-dir" || args.at(ai) == "-b"
			|| args.at(ai) == "--output" || args.at(ai) == "-o"
		) {
			if (args.size() == ai+1) {
				std::cerr << "FONTCACHE error: argument '" << args.at(ai) << "' missing parameter!\n";
				return false;
			}
			const auto opt = args.at(ai);
			ai++;

			if (opt == "--config" || opt == "-c") {
				if (!cli.config_path.empty()) {
					std::cerr << "FONTCACHE error: config specified more than once!\n";
					return false;
				}
				cli.config_path = args.at(ai);
			} else if (opt == "--bundled-dir" || opt == "-b") {
				cli.bundled_dir = args.at(ai);
			} else {
				cli.output = args.at(ai);
			}
		} else if (cli.action.empty() && (args.at(ai) == "print" || args.at(ai) == "write")) {
			cli.action = args.at(ai);
		} else {
			std::cerr << "FONTCACHE error: unknown cli arg: '" << args.at(ai) << "'\n";
			return false;
		}
	}

	if (!cli.help && cli.action.empty()) {
		std::cerr << "FONTCACHE error: missing action, one of 'print' or 'write'\n";
		return false;
	}

	return true;
}

bool loadConfigJson(nlohmann::ordered_json& config_json, SimpleConfigModel& conf, nlohmann::json& cache_metadata_out) {
	if (config_json.is_object() && config_json.contains("cache_metadata")) {
		// ordered -> sorted keys
		cache_metadata_out = nlohmann::json::parse(config_json["cache_metadata"].dump());
		config_json.erase("cache_metadata");
	}

	return load_json_into_config(config_json, conf);
}

bool loadConfigFile(const std::string& config_path, SimpleConfigModel& conf, nlohmann::json& cache_metadata_out) {
	auto config_file = std::ifstream(config_path);
	if (!config_file.is_open()) {
		std::cerr << "FONTCACHE error: failed to open config file '" << config_path << "'\n";
		return false;
	}

	nlohmann::ordered_json config_json;
	try {
		config_json = nlohmann::ordered_json::parse(config_file);
	} catch (const nlohmann::json::parse_error& e) {
		std::cerr << "FONTCACHE error: config file '" << config_path << "' is not valid json (" << e.what() << ")\n";
		return false;
	}

	if (!loadConfigJson(config_json, conf, cache_metadata_out)) {
		std::cerr << "FONTCACHE error in config json '" << config_path << "'\n";
		return false;
	}

	return true;
}

bool resolveOptions(SimpleConfigModel& conf, const FontCacheCliArgs& cli, nlohmann::json cache_metadata, FontCacheOptions& out) {
	out.action = cli.action;
	out.quiet = cli.quiet || conf.get_bool("fontcache", "quiet").value_or(false);

	const std::string conf_bundled_dir = conf.get_string("fontcache", "bundled_fonts_dir").value_or("");
	out.bundled_dir = cli.bundled_dir.empty() ? conf_bundled_dir : cli.bundled_dir;

	const std::string conf_cache_path = conf.get_string("fontcache", "cache_path").value_or("");
	out.cache_path = cli.output.empty() ? conf_cache_path : cli.output;
	if (out.cache_path.empty()) {
		out.cache_path = getPlatformDefaultCachePath();
	}

	const std::string fc_query_bin = conf.get_string("fontcache", "fc_query").value_or("fc-query");
	out.fc_query_bin = fc_query_bin;
	const std::string fc_list_bin = conf.get_string("fontcache", "fc_list").value_or("fc-list");
	out.fc_list_bin = fc_list_bin;

	out.cache_metadata = std::move(cache_metadata);

	if (out.bundled_dir.empty()) {
		std::cerr << "FONTCACHE error: no bundled font dir, use --bundled-dir or fontcache::bundled_fonts_dir in the config\n";
		return false;
	}

	return true;
}

