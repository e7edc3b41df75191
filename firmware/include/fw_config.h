#pragma once

// ============================
// Version Definition
// ============================

// Major version number (increment on breaking changes)
#define LEDANIM_VERSION_MAJOR 1

// Minor version (add new animations)
#define LEDANIM_VERSION_MINOR 0

// Patch version (bug fixes)
#define LEDANIM_VERSION_PATCH 0

// String form
#define STR_HELPER(x) #x
#define STR(x) STR_HELPER(x)

#define LEDANIM_VERSION_STRING  \
    STR(LEDANIM_VERSION_MAJOR) "." STR(LEDANIM_VERSION_MINOR) "." STR(LEDANIM_VERSION_PATCH)


// ============================
// Build Metadata
// ============================

// Auto-insert build date/time (gcc predefined macros)
#define LEDANIM_BUILD_DATE __DATE__
#define LEDANIM_BUILD_TIME __TIME__

// Optional git hash, injected with -DLEDANIM_BUILD_HASH=...
#ifndef LEDANIM_BUILD_HASH
#define LEDANIM_BUILD_HASH "dev"
#endif
