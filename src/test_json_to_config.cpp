#include "./json_to_config.hpp"

#include <solanaceae/util/simple_config_model.hpp>

#include <nlohmann/json.hpp>

#include <iostream>
#include <string>
#include <cassert>

int main(void) {
	{ // flat and "default" values
		SimpleConfigModel conf;
		const auto j = nlohmann::ordered_json::parse(R"({
			"fontcache": {
				"cache_path": "/tmp/fontlist.json",
				"quiet": true,
				"fc_list": {"default": "/opt/fc/bin/fc-list"}
			}
		})");
		assert(load_json_into_config(j, conf));

		const std::string cache_path = conf.get_string("fontcache", "cache_path").value_or("");
		assert(cache_path == "/tmp/fontlist.json");

		const std::string fc_list = conf.get_string("fontcache", "fc_list").value_or("fc-list");
		assert(fc_list == "/opt/fc/bin/fc-list");

		const std::string fc_query = conf.get_string("fontcache", "fc_query").value_or("fc-query");
		assert(fc_query == "fc-query");

		assert(conf.get_bool("fontcache", "quiet").value_or(false));
	}

	{ // rejected layouts
		SimpleConfigModel conf;
		assert(!load_json_into_config(nlohmann::ordered_json::parse("[1, 2]"), conf));
		assert(!load_json_into_config(nlohmann::ordered_json::parse(R"({"fontcache": 1})"), conf));
		assert(!load_json_into_config(nlohmann::ordered_json::parse(R"({"fontcache": {"cache_path": [1]}})"), conf));
	}

	std::cout << "json to config tests passed\n";

	return 0;
}

