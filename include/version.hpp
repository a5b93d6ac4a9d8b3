#ifndef GITMIGRATE_VERSION_HPP
#define GITMIGRATE_VERSION_HPP

/* ------------------------------------------------------------------
   Public numeric version macros                                    */
#define GITMIGRATE_VERSION_MAJOR 0
#define GITMIGRATE_VERSION_MINOR 3
#define GITMIGRATE_VERSION_PATCH 0

/*
 * Release tag injected by the CI workflow.
 * Example format: "2025.07.31-1".
 */
#define GITMIGRATE_VERSION_STR "rolling"
/* ------------------------------------------------------------------ */

/* Human-friendly version string for the C++ codebase */
constexpr const char* GITMIGRATE_VERSION = GITMIGRATE_VERSION_STR;

#endif /* GITMIGRATE_VERSION_HPP */
