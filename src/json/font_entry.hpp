#pragma once

#include "../font_loading/font_entry.hpp"

#include <nlohmann/json.hpp>

NLOHMANN_JSON_SERIALIZE_ENUM(FontStyle, {
	{FontStyle::normal, "normal"},
	{FontStyle::italic, "italic"},
	{FontStyle::oblique, "oblique"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(FontStretch, {
	{FontStretch::ultra_condensed, "ultra-condensed"},
	{FontStretch::extra_condensed, "extra-condensed"},
	{FontStretch::condensed, "condensed"},
	{FontStretch::semi_condensed, "semi-condensed"},
	{FontStretch::normal, "normal"},
	{FontStretch::semi_expanded, "semi-expanded"},
	{FontStretch::expanded, "expanded"},
	{FontStretch::extra_expanded, "extra-expanded"},
	{FontStretch::ultra_expanded, "ultra-expanded"},
})

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(FontEntry, file, family, style, variant, weight, stretch, size)

