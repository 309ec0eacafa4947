#include "version.hpp"

#include "./fontcache_options.hpp"
#include "./fontcache_run.hpp"
#include "./font_loading/font_cache.hpp"
#include "./font_loading/font_query_fc_sdl.hpp"

#include <solanaceae/util/simple_config_model.hpp>

#include <nlohmann/json.hpp>

#include <iostream>
#include <string_view>
#include <vector>

static void printUsage(std::string_view self) {
	std::cerr
		<< "fontcache " FONTCACHE_VERSION_STR "\n"
		<< "usage: " << self << " [--config <file>] [--bundled-dir <dir>] [--output <file>] [--quiet] print|write\n"
		<< "  print   print entries of generated font cache\n"
		<< "  write   write updated font cache to disk\n"
		<< "the bundled font dir is required, from --bundled-dir or the config\n"
	;
}

int main(int argc, char** argv) {
	// better args
	std::vector<std::string_view> args;
	for (int i = 0; i < argc; i++) {
		args.push_back(argv[i]);
	}

	const std::string_view self = args.empty() ? std::string_view{"fontcache"} : args.front();

	FontCacheCliArgs cli;
	if (!parseCliArgs(args, cli)) {
		printUsage(self);
		return 2;
	}
	if (cli.help) {
		printUsage(self);
		return 0;
	}

	SimpleConfigModel conf;
	nlohmann::json cache_metadata = getDefaultFontCacheMetadata();
	if (!cli.config_path.empty() && !loadConfigFile(cli.config_path, conf, cache_metadata)) {
		return 2;
	}

	FontCacheOptions opts;
	if (!resolveOptions(conf, cli, cache_metadata, opts)) {
		printUsage(self);
		return 2;
	}

	FontQuery_FontConfigSDL query{opts.fc_query_bin, opts.fc_list_bin};

	return runFontCache(opts, query, std::cout);
}

