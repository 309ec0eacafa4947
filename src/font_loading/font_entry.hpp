#pragma once

#include <string>
#include <string_view>

enum class FontStyle {
	normal,
	italic,
	oblique,
};

enum class FontStretch {
	ultra_condensed,
	extra_condensed,
	condensed,
	semi_condensed,
	normal,
	semi_expanded,
	expanded,
	extra_expanded,
	ultra_expanded,
};

// one (file, family) combination of the font cache
struct FontEntry {
	std::string file;
	std::string family;
	FontStyle style {FontStyle::normal};
	std::string variant {"normal"}; // small caps not supported
	int weight {400}; // css scale, 100-1000
	FontStretch stretch {FontStretch::normal};
	std::string size {"scalable"}; // outline fonts only
};

bool operator==(const FontEntry& lhs, const FontEntry& rhs);

const char* to_string(FontStyle style);
const char* to_string(FontStretch stretch);

// FC_SLANT: 0 roman, 100 italic, 110 oblique
// throws UnknownStyleCode
FontStyle slantCodeToStyle(std::string_view code);

// FC_WIDTH, the 9 named widths only
// throws UnknownStyleCode
FontStretch widthCodeToStretch(std::string_view code);

// see FcWeightToOpenType.
// piecewise linear over the fontconfig named weights, clamped, rounded half up
int fcWeightToCSS(double fc_weight);

// "[100 200]" style ranges, as printed for variable weight or width fonts
bool isVariableRange(std::string_view value);

// plain decimal number, no leading whitespace, sign or hex.
// throws MalformedRecord otherwise
double parseFcWeight(std::string_view weight);

