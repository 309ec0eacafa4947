#include "./fc_record_scanner.hpp"

#include "./font_errors.hpp"

#include <string>
#include <utility>

// like the plain for_each_split, but skips over escaped chars
// and optionally over [] groups
template<typename FN>
static void forEachUnescapedSplit(std::string_view input, const char sep, const bool group_brackets, FN&& fn) {
	size_t seg_start {0};
	bool in_group {false};

	for (size_t i = 0; i < input.size(); i++) {
		const char c = input[i];
		if (c == '\\') {
			if (i+1 >= input.size()) {
				throw MalformedRecord("dangling escape character at end of input");
			}
			i++; // skip escaped char
			continue;
		}

		if (group_brackets) {
			if (c == '[' && i == seg_start) {
				in_group = true;
				continue;
			} else if (c == ']' && in_group) {
				in_group = false;
				continue;
			}
		}

		if (c == sep && !in_group) {
			fn(input.substr(seg_start, i - seg_start));
			seg_start = i+1;
			in_group = false;
		}
	}

	fn(input.substr(seg_start));
}

std::vector<FcRawRecord> scanFcRecords(std::string_view text) {
	std::vector<FcRawRecord> records;

	// cached outside
	std::vector<std::string_view> segment_splits;
	size_t line_nr {0};

	forEachUnescapedSplit(text, '\n', false, [&](std::string_view line) {
		line_nr++;
		if (line.empty()) {
			return;
		}

		segment_splits.clear(); // preserves cap
		forEachUnescapedSplit(line, ' ', true, [&segment_splits](std::string_view segment) {
			segment_splits.push_back(segment);
		});

		if (segment_splits.size() != static_cast<size_t>(FcField::count)) {
			throw MalformedRecord(
				"line " + std::to_string(line_nr)
				+ ": expected " + std::to_string(static_cast<size_t>(FcField::count))
				+ " fields, got " + std::to_string(segment_splits.size())
				+ " in '" + std::string{line} + "'"
			);
		}

		FcRawRecord rec;
		rec.line = line_nr;
		for (size_t i = 0; i < segment_splits.size(); i++) {
			rec.fields[i] = segment_splits[i];
		}
		records.push_back(rec);
	});

	return records;
}

std::vector<std::string> splitFcFamilies(std::string_view raw_family) {
	std::vector<std::string> families;
	forEachUnescapedSplit(raw_family, ',', false, [&families](std::string_view segment) {
		auto name = unescapeFc(segment);
		if (!name.empty()) {
			families.push_back(std::move(name));
		}
	});
	return families;
}

std::string unescapeFc(std::string_view raw) {
	std::string res;
	res.reserve(raw.size());
	for (size_t i = 0; i < raw.size(); i++) {
		if (raw[i] == '\\' && i+1 < raw.size()) {
			i++;
		}
		res.push_back(raw[i]);
	}
	return res;
}

