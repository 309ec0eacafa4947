#pragma once

#define FONTCACHE_VERSION_MAJOR 0
#define FONTCACHE_VERSION_MINOR 3
#define FONTCACHE_VERSION_PATCH 0

#define FONTCACHE_STRINGIFY_(x) #x
#define FONTCACHE_STRINGIFY(x) FONTCACHE_STRINGIFY_(x)

#define FONTCACHE_VERSION_STR \
	FONTCACHE_STRINGIFY(FONTCACHE_VERSION_MAJOR) "." \
	FONTCACHE_STRINGIFY(FONTCACHE_VERSION_MINOR) "." \
	FONTCACHE_STRINGIFY(FONTCACHE_VERSION_PATCH)

