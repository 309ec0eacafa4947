#include "./fontcache_options.hpp"
#include "./fontcache_run.hpp"
#include "./font_loading/font_cache.hpp"
#include "./font_loading/font_errors.hpp"
#include "./font_loading/font_query_i.hpp"

#include <solanaceae/util/simple_config_model.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>
#include <cassert>

struct FontQuery_Fixed : public FontQueryInterface {
	std::string _system_text;
	bool _fail {false};

	const char* name(void) const override { return "Fixed"; }

	std::string queryFiles(const std::vector<std::string>&) override {
		return {};
	}

	std::string queryAll(void) override {
		if (_fail) {
			throw ServiceUnavailable("fc-list exit code 1");
		}
		return _system_text;
	}
};

int main(void) {
	{ // cli parsing
		FontCacheCliArgs cli;
		assert(parseCliArgs({"fontcache", "-c", "conf.json", "--bundled-dir", "/b", "-o", "/out.json", "-q", "write"}, cli));
		assert(cli.config_path == "conf.json");
		assert(cli.bundled_dir == "/b");
		assert(cli.output == "/out.json");
		assert(cli.quiet);
		assert(cli.action == "write");
		assert(!cli.help);

		FontCacheCliArgs cli_help;
		assert(parseCliArgs({"fontcache", "--help"}, cli_help));
		assert(cli_help.help);
	}

	{ // cli usage errors
		FontCacheCliArgs cli1;
		assert(!parseCliArgs({"fontcache"}, cli1)); // no action
		FontCacheCliArgs cli2;
		assert(!parseCliArgs({"fontcache", "print", "write"}, cli2));
		FontCacheCliArgs cli3;
		assert(!parseCliArgs({"fontcache", "print", "--output"}, cli3));
		FontCacheCliArgs cli4;
		assert(!parseCliArgs({"fontcache", "-c", "a.json", "-c", "b.json", "print"}, cli4));
		FontCacheCliArgs cli5;
		assert(!parseCliArgs({"fontcache", "--frobnicate", "print"}, cli5));
	}

	{ // cache_metadata replaces the defaults verbatim and is not a config module
		SimpleConfigModel conf;
		auto config_json = nlohmann::ordered_json::parse(R"({
			"fontcache": {"bundled_fonts_dir": "/conf/fonts"},
			"cache_metadata": {"_version": 7, "defaultFamily": {"ttf": "Foo"}, "extra": [1, null]}
		})");

		nlohmann::json metadata = getDefaultFontCacheMetadata();
		assert(loadConfigJson(config_json, conf, metadata));
		assert(!config_json.contains("cache_metadata"));
		assert(config_json.contains("fontcache"));

		assert(metadata == nlohmann::json::parse(R"({"_version": 7, "defaultFamily": {"ttf": "Foo"}, "extra": [1, null]})"));
		assert(!metadata.contains("afmlist"));

		const std::string bundled = conf.get_string("fontcache", "bundled_fonts_dir").value_or("");
		assert(bundled == "/conf/fonts");
	}

	{ // without cache_metadata the defaults stay
		SimpleConfigModel conf;
		auto config_json = nlohmann::ordered_json::parse(R"({"fontcache": {"quiet": true}})");
		nlohmann::json metadata = getDefaultFontCacheMetadata();
		assert(loadConfigJson(config_json, conf, metadata));
		assert(metadata == getDefaultFontCacheMetadata());
	}

	{ // cli > config
		SimpleConfigModel conf;
		auto config_json = nlohmann::ordered_json::parse(R"({"fontcache": {
			"bundled_fonts_dir": "/conf/fonts",
			"cache_path": "/conf/cache.json",
			"fc_query": "/opt/fc-query",
			"fc_list": "/opt/fc-list",
			"quiet": true
		}})");
		nlohmann::json metadata = getDefaultFontCacheMetadata();
		assert(loadConfigJson(config_json, conf, metadata));

		FontCacheCliArgs cli;
		cli.action = "write";
		cli.bundled_dir = "/cli/fonts";
		cli.output = "/cli/cache.json";

		FontCacheOptions opts;
		assert(resolveOptions(conf, cli, metadata, opts));
		assert(opts.action == "write");
		assert(opts.bundled_dir == "/cli/fonts");
		assert(opts.cache_path == "/cli/cache.json");
		assert(opts.fc_query_bin == "/opt/fc-query");
		assert(opts.fc_list_bin == "/opt/fc-list");
		assert(opts.quiet);
		assert(opts.cache_metadata == getDefaultFontCacheMetadata());

		// config > default
		FontCacheCliArgs cli_bare;
		cli_bare.action = "print";
		FontCacheOptions opts_conf;
		assert(resolveOptions(conf, cli_bare, metadata, opts_conf));
		assert(opts_conf.bundled_dir == "/conf/fonts");
		assert(opts_conf.cache_path == "/conf/cache.json");
	}

	{ // defaults, the bundled font dir has none
		SimpleConfigModel conf;
		FontCacheCliArgs cli;
		cli.action = "print";

		FontCacheOptions opts;
		assert(!resolveOptions(conf, cli, getDefaultFontCacheMetadata(), opts));

		cli.bundled_dir = "/cli/fonts";
		FontCacheOptions opts2;
		assert(resolveOptions(conf, cli, getDefaultFontCacheMetadata(), opts2));
		assert(opts2.fc_query_bin == "fc-query");
		assert(opts2.fc_list_bin == "fc-list");
		assert(!opts2.quiet);
		assert(opts2.cache_path == getPlatformDefaultCachePath());
	}

	const auto temp_dir = std::filesystem::temp_directory_path() / "fontcache_options_tests";
	std::filesystem::remove_all(temp_dir);
	std::filesystem::create_directories(temp_dir);

	{ // config file
		const auto config_path = temp_dir / "config.json";
		std::ofstream{config_path} << R"({"fontcache": {"cache_path": "/f/cache.json"}, "cache_metadata": {"a": 1}})";

		SimpleConfigModel conf;
		nlohmann::json metadata = getDefaultFontCacheMetadata();
		assert(loadConfigFile(config_path.generic_u8string(), conf, metadata));
		assert(metadata == nlohmann::json::parse(R"({"a": 1})"));

		const auto broken_path = temp_dir / "broken.json";
		std::ofstream{broken_path} << "{not json";
		SimpleConfigModel conf2;
		assert(!loadConfigFile(broken_path.generic_u8string(), conf2, metadata));
		assert(!loadConfigFile((temp_dir / "missing.json").generic_u8string(), conf2, metadata));
	}

	FontCacheOptions base_opts;
	base_opts.bundled_dir = (temp_dir / "no_bundled").generic_u8string();
	base_opts.quiet = true;
	base_opts.cache_metadata = getDefaultFontCacheMetadata();

	{ // print run
		FontQuery_Fixed q;
		q._system_text = "/usr/share/fonts/a.ttf A 0 80 100\n";

		FontCacheOptions opts = base_opts;
		opts.action = "print";

		std::ostringstream out;
		assert(runFontCache(opts, q, out) == 0);
		assert(out.str() == "FontEntry(file='/usr/share/fonts/a.ttf', family='A', style='normal', variant='normal', weight=400, stretch='normal', size='scalable')\n");
	}

	{ // write run
		FontQuery_Fixed q;
		q._system_text = "/usr/share/fonts/a.ttf A 0 80 100\n";

		FontCacheOptions opts = base_opts;
		opts.action = "write";
		opts.cache_path = (temp_dir / "out" / "fontlist.json").generic_u8string();

		std::ostringstream out;
		assert(runFontCache(opts, q, out) == 0);
		assert(std::filesystem::exists(opts.cache_path));
		assert(out.str().find("Font cache written to") != std::string::npos);
	}

	{ // fatal errors exit with 1 and write nothing
		FontQuery_Fixed q_fail;
		q_fail._fail = true;

		FontCacheOptions opts = base_opts;
		opts.action = "write";
		opts.cache_path = (temp_dir / "fail" / "fontlist.json").generic_u8string();

		std::ostringstream out;
		assert(runFontCache(opts, q_fail, out) == 1);
		assert(!std::filesystem::exists(opts.cache_path));

		FontQuery_Fixed q_bad;
		q_bad._system_text = "/usr/share/fonts/a.ttf A 55 80 100\n";
		assert(runFontCache(opts, q_bad, out) == 1);
		assert(!std::filesystem::exists(opts.cache_path));
	}

	std::filesystem::remove_all(temp_dir);

	std::cout << "fontcache options tests passed\n";

	return 0;
}

