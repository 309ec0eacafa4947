#include "./font_entry_normalizer.hpp"

#include "./fc_record_scanner.hpp"
#include "./font_errors.hpp"

#include <algorithm>
#include <iostream>
#include <string>
#include <utility>

NormalizeResult normalizeFontEntries(std::string_view raw_text, bool quiet) {
	NormalizeResult res;

	for (const auto& rec : scanFcRecords(raw_text)) {
		std::string file = unescapeFc(rec.get(FcField::file));
		if (file.empty()) {
			throw MalformedRecord("line " + std::to_string(rec.line) + ": empty file field");
		}

		const std::string weight_field = unescapeFc(rec.get(FcField::weight));
		if (isVariableRange(weight_field)) {
			if (!quiet) {
				std::cerr << "FC warning: skipping '" << file << "' (unsupported variable weight)\n";
			}
			res.skipped.push_back(std::move(file));
			continue;
		}

		const std::string width_field = unescapeFc(rec.get(FcField::width));
		if (isVariableRange(width_field)) {
			if (!quiet) {
				std::cerr << "FC warning: skipping '" << file << "' (unsupported variable width)\n";
			}
			res.skipped.push_back(std::move(file));
			continue;
		}

		auto families = splitFcFamilies(rec.get(FcField::family));
		if (families.empty()) {
			if (!quiet) {
				std::cerr << "FC warning: skipping '" << file << "' (no family name)\n";
			}
			res.skipped.push_back(std::move(file));
			continue;
		}

		FontEntry base;
		base.file = std::move(file);
		base.style = slantCodeToStyle(unescapeFc(rec.get(FcField::slant)));
		base.weight = fcWeightToCSS(parseFcWeight(weight_field));
		base.stretch = widthCodeToStretch(width_field);

		for (auto& family : families) {
			FontEntry& e = res.entries.emplace_back(base);
			e.family = std::move(family);
		}
	}

	std::stable_sort(res.entries.begin(), res.entries.end(), [](const FontEntry& lhs, const FontEntry& rhs) {
		return lhs.file < rhs.file;
	});

	return res;
}

