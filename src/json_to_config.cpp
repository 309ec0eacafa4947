#include "./json_to_config.hpp"

#include <solanaceae/util/simple_config_model.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <iostream>
#include <string>

// sets one scalar, FN is called with the typed value
template<typename FN>
static bool visit_config_value(const nlohmann::ordered_json& value, FN&& fn) {
	if (value.is_string()) {
		fn(value.get_ref<const std::string&>());
	} else if (value.is_boolean()) {
		fn(value.get_ref<const bool&>());
	} else if (value.is_number_float()) {
		fn(value.get_ref<const double&>());
	} else if (value.is_number_integer()) {
		fn(value.get<int64_t>());
	} else {
		return false;
	}
	return true;
}

bool load_json_into_config(const nlohmann::ordered_json& config_json, SimpleConfigModel& conf) {
	if (!config_json.is_object()) {
		std::cerr << "FONTCACHE error: config file is not an json object!!!\n";
		return false;
	}

	for (const auto& [mod, cats] : config_json.items()) {
		if (!cats.is_object()) {
			std::cerr << "JSON error: module '" << mod << "' is not an object\n";
			return false;
		}

		for (const auto& [cat, cat_v] : cats.items()) {
			if (!cat_v.is_object()) {
				const bool ok = visit_config_value(cat_v, [&, &mod = mod, &cat = cat](const auto& v) {
					conf.set(mod, cat, v);
				});
				if (!ok) {
					std::cerr << "JSON error: wrong value type in " << mod << "::" << cat << " = " << cat_v << "\n";
					return false;
				}
				continue;
			}

			if (cat_v.contains("default")) {
				const bool ok = visit_config_value(cat_v["default"], [&, &mod = mod, &cat = cat](const auto& v) {
					conf.set(mod, cat, v);
				});
				if (!ok) {
					std::cerr << "JSON error: wrong value type in " << mod << "::" << cat << " = " << cat_v["default"] << "\n";
					return false;
				}
			}

			if (cat_v.contains("entries")) {
				for (const auto& [ent, ent_v] : cat_v["entries"].items()) {
					const bool ok = visit_config_value(ent_v, [&, &mod = mod, &cat = cat, &ent = ent](const auto& v) {
						conf.set(mod, cat, ent, v);
					});
					if (!ok) {
						std::cerr << "JSON error: wrong value type in " << mod << "::" << cat << "::" << ent << " = " << ent_v << "\n";
						return false;
					}
				}
			}
		}
	}

	return true;
}

