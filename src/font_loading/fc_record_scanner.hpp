#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

// scanner for the single line fc-query/fc-list format requested by
// FontQuery_FontConfigSDL:
//   <file> <family,family,...> <slant> <weight> <width>\n
//
// escaping:
// - "\x" always means the literal x (space, comma, newline, backslash, ...)
// - an unescaped space separates fields, an unescaped newline ends the record
// - an unescaped '[' at the start of a field groups until the matching ']',
//   so variable weights like "[100 200]" stay one field
// - the family field is a list, separated by unescaped commas
// - a backslash as the last char of the input is malformed
//
// empty lines are ignored.

enum class FcField : size_t {
	file = 0,
	family,
	slant,
	weight,
	width,

	count
};

struct FcRawRecord {
	size_t line {0}; // 1 based
	// views into the scanned text, still escaped
	std::array<std::string_view, static_cast<size_t>(FcField::count)> fields;

	std::string_view get(FcField f) const { return fields[static_cast<size_t>(f)]; }
};

// throws MalformedRecord if a record does not have exactly 5 fields
std::vector<FcRawRecord> scanFcRecords(std::string_view text);

// splits on unescaped commas and unescapes each name.
// empty names are dropped
std::vector<std::string> splitFcFamilies(std::string_view raw_family);

std::string unescapeFc(std::string_view raw);

