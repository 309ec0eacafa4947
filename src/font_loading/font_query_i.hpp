#pragma once

#include <string>
#include <vector>

// source of raw font attribute records, in the format described in fc_record_scanner.hpp.
// the real one talks to fontconfig, tests use canned text.
struct FontQueryInterface {
	virtual ~FontQueryInterface(void) {}

	virtual const char* name(void) const = 0;

	// one record per (file x face) of the given font files.
	// no files means no records, not an error.
	// throws ServiceUnavailable
	virtual std::string queryFiles(const std::vector<std::string>& files) = 0;

	// every font known to the system
	// throws ServiceUnavailable
	virtual std::string queryAll(void) = 0;
};

