#include "./font_entry.hpp"

#include "./font_errors.hpp"

#include <array>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <string>
#include <system_error>
#include <utility>

bool operator==(const FontEntry& lhs, const FontEntry& rhs) {
	return lhs.file == rhs.file
		&& lhs.family == rhs.family
		&& lhs.style == rhs.style
		&& lhs.variant == rhs.variant
		&& lhs.weight == rhs.weight
		&& lhs.stretch == rhs.stretch
		&& lhs.size == rhs.size
	;
}

const char* to_string(FontStyle style) {
	switch (style) {
		case FontStyle::normal: return "normal";
		case FontStyle::italic: return "italic";
		case FontStyle::oblique: return "oblique";
	}
	return "normal";
}

const char* to_string(FontStretch stretch) {
	switch (stretch) {
		case FontStretch::ultra_condensed: return "ultra-condensed";
		case FontStretch::extra_condensed: return "extra-condensed";
		case FontStretch::condensed: return "condensed";
		case FontStretch::semi_condensed: return "semi-condensed";
		case FontStretch::normal: return "normal";
		case FontStretch::semi_expanded: return "semi-expanded";
		case FontStretch::expanded: return "expanded";
		case FontStretch::extra_expanded: return "extra-expanded";
		case FontStretch::ultra_expanded: return "ultra-expanded";
	}
	return "normal";
}

// strict base 10, the whole view has to be consumed
static bool parseCode(std::string_view code, int& value_out) {
	if (code.empty()) {
		return false;
	}
	const auto res = std::from_chars(code.data(), code.data() + code.size(), value_out);
	return res.ec == std::errc{} && res.ptr == code.data() + code.size();
}

FontStyle slantCodeToStyle(std::string_view code) {
	int value {0};
	if (parseCode(code, value)) {
		switch (value) {
			case 0: return FontStyle::normal;
			case 100: return FontStyle::italic;
			case 110: return FontStyle::oblique;
		}
	}
	throw UnknownStyleCode("unknown slant code '" + std::string{code} + "'");
}

FontStretch widthCodeToStretch(std::string_view code) {
	static constexpr std::array<std::pair<int, FontStretch>, 9> width_table {{
		{50, FontStretch::ultra_condensed},
		{63, FontStretch::extra_condensed},
		{75, FontStretch::condensed},
		{87, FontStretch::semi_condensed},
		{100, FontStretch::normal},
		{113, FontStretch::semi_expanded},
		{125, FontStretch::expanded},
		{150, FontStretch::extra_expanded},
		{200, FontStretch::ultra_expanded},
	}};

	int value {0};
	if (parseCode(code, value)) {
		for (const auto& [fc_width, stretch] : width_table) {
			if (fc_width == value) {
				return stretch;
			}
		}
	}
	throw UnknownStyleCode("unknown width code '" + std::string{code} + "'");
}

int fcWeightToCSS(double fc_weight) {
	// 215 (EXTRABLACK) is not in the fontconfig docs, but in the header
	static constexpr std::array<double, 12> fc_weights {
		0, 40, 50, 55, 75, 80, 100, 180, 200, 205, 210, 215
	};
	static constexpr std::array<double, 12> css_weights {
		100, 200, 300, 350, 380, 400, 500, 600, 700, 800, 900, 1000
	};

	double css {css_weights.front()};
	if (fc_weight <= fc_weights.front()) {
		css = css_weights.front();
	} else if (fc_weight >= fc_weights.back()) {
		css = css_weights.back();
	} else {
		for (size_t i = 1; i < fc_weights.size(); i++) {
			if (fc_weight <= fc_weights[i]) {
				const double lo = fc_weights[i-1];
				const double hi = fc_weights[i];
				css = css_weights[i-1] + (fc_weight - lo) * (css_weights[i] - css_weights[i-1]) / (hi - lo);
				break;
			}
		}
	}

	return static_cast<int>(std::floor(css + 0.5));
}

bool isVariableRange(std::string_view value) {
	return value.size() >= 2 && value.front() == '[' && value.back() == ']';
}

double parseFcWeight(std::string_view weight) {
	const std::string weight_str{weight};
	if (weight_str.empty()) {
		throw MalformedRecord("empty weight field");
	}

	// strtod is too lenient
	const unsigned char first = static_cast<unsigned char>(weight_str.front());
	if (std::isspace(first) || first == '+' || weight_str.find_first_of("xX") != std::string::npos) {
		throw MalformedRecord("weight field '" + weight_str + "' is not a number");
	}

	char* end {nullptr};
	const double value = std::strtod(weight_str.c_str(), &end);
	if (end != weight_str.c_str() + weight_str.size() || !std::isfinite(value)) {
		throw MalformedRecord("weight field '" + weight_str + "' is not a number");
	}
	return value;
}

