#pragma once

#include <stdexcept>
#include <string>

// all fatal conditions of a cache generation run derive from this.
// stage is one of "query", "parse", "mapping" or "write"
struct FontCacheError : public std::runtime_error {
	const char* _stage {"unknown"};

	FontCacheError(const char* stage, const std::string& what) : std::runtime_error(what), _stage(stage) {}

	const char* stage(void) const noexcept { return _stage; }
};

// fc-query/fc-list could not be run or exited with failure
struct ServiceUnavailable : public FontCacheError {
	explicit ServiceUnavailable(const std::string& what) : FontCacheError("query", what) {}
};

// a record did not split into the expected fields
struct MalformedRecord : public FontCacheError {
	explicit MalformedRecord(const std::string& what) : FontCacheError("parse", what) {}
};

// slant or width code without table entry
struct UnknownStyleCode : public FontCacheError {
	explicit UnknownStyleCode(const std::string& what) : FontCacheError("mapping", what) {}
};

struct CacheWriteError : public FontCacheError {
	explicit CacheWriteError(const std::string& what) : FontCacheError("write", what) {}
};

