#pragma once

#include "./font_query_i.hpp"

#include <string>
#include <vector>

// provides a fontconfig (typically linux/unix) implementation
// using commandline tools using sdl process management
struct FontQuery_FontConfigSDL : public FontQueryInterface {
	// the record format requested from fc-query and fc-list
	static const char* const fc_format;

	std::string _fc_query_bin {"fc-query"};
	std::string _fc_list_bin {"fc-list"};

	FontQuery_FontConfigSDL(void);
	FontQuery_FontConfigSDL(std::string fc_query_bin, std::string fc_list_bin);

	const char* name(void) const override;

	std::string queryFiles(const std::vector<std::string>& files) override;
	std::string queryAll(void) override;

	// runs args and returns stdout, throws ServiceUnavailable on failure
	static std::string runProcess(const std::vector<std::string>& args);
};

