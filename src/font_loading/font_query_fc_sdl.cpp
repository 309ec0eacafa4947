#include "./font_query_fc_sdl.hpp"

#include "./font_errors.hpp"

#include <SDL3/SDL.h>

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// fontconfig format, "\\\\" reaches fc as "\\" which is its escaped backslash.
// escape() uses the first char as the escape char
const char* const FontQuery_FontConfigSDL::fc_format {
	"--format="
	"%{file|escape(\\\\ ,)} "
	"%{family|escape(\\\\ )} "
	"%{slant|escape(\\\\ )} "
	"%{weight|escape(\\\\ )} "
	"%{width|escape(\\\\ )}\n"
};

FontQuery_FontConfigSDL::FontQuery_FontConfigSDL(void) {
}

FontQuery_FontConfigSDL::FontQuery_FontConfigSDL(std::string fc_query_bin, std::string fc_list_bin) :
	_fc_query_bin(std::move(fc_query_bin)),
	_fc_list_bin(std::move(fc_list_bin))
{
}

const char* FontQuery_FontConfigSDL::name(void) const {
	return "FontConfigSDL";
}

std::string FontQuery_FontConfigSDL::queryFiles(const std::vector<std::string>& files) {
	if (files.empty()) {
		return {};
	}

	std::vector<std::string> args;
	args.reserve(files.size() + 2);
	args.push_back(_fc_query_bin);
	args.push_back(fc_format);
	args.insert(args.end(), files.cbegin(), files.cend());

	return runProcess(args);
}

std::string FontQuery_FontConfigSDL::queryAll(void) {
	return runProcess({_fc_list_bin, fc_format});
}

std::string FontQuery_FontConfigSDL::runProcess(const std::vector<std::string>& args) {
	if (args.empty()) {
		throw ServiceUnavailable("no command given");
	}

	std::vector<const char*> c_args;
	c_args.reserve(args.size() + 1);
	for (const auto& arg : args) {
		c_args.push_back(arg.c_str());
	}
	c_args.push_back(nullptr);

	// more RAII
	std::unique_ptr<SDL_Process, decltype(&SDL_DestroyProcess)> proc {
		SDL_CreateProcess(c_args.data(), true),
		&SDL_DestroyProcess
	};
	if (!proc) {
		throw ServiceUnavailable("failed to create process '" + args.front() + "' (" + SDL_GetError() + ")");
	}

	size_t data_size {0};
	int exit_code {0};
	std::unique_ptr<char, decltype(&SDL_free)> data {
		static_cast<char*>(SDL_ReadProcess(proc.get(), &data_size, &exit_code)),
		&SDL_free
	};
	if (!data) {
		throw ServiceUnavailable("process '" + args.front() + "' returned no data (" + SDL_GetError() + ")");
	}
	if (exit_code != 0) {
		throw ServiceUnavailable("process '" + args.front() + "' exit code " + std::to_string(exit_code));
	}

	return std::string{data.get(), data_size};
}

