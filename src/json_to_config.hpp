#pragma once

#include <nlohmann/json_fwd.hpp>

// fwd
struct SimpleConfigModel;

// {"module": {"category": value, "category2": {"default": value, "entries": {"entry": value}}}}
// values are strings, bools, ints or floats.
// returns false on anything else, conf might be partially filled then
bool load_json_into_config(const nlohmann::ordered_json& config_json, SimpleConfigModel& conf);

