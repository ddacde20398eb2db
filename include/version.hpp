#ifndef GHOSTSCRUB_VERSION_HPP
#define GHOSTSCRUB_VERSION_HPP

/* ------------------------------------------------------------------
   Public numeric version macros (safe for .rc files)               */
#define GHOSTSCRUB_VERSION_MAJOR 0
#define GHOSTSCRUB_VERSION_MINOR 1
#define GHOSTSCRUB_VERSION_PATCH 0

/*
 * Release tag injected by the CI workflow.
 * Example format: "0.1.0".
 */
#define GHOSTSCRUB_VERSION_STR "0.1.0"
#define GHOSTSCRUB_VERSION_RC                                                                      \
    GHOSTSCRUB_VERSION_MAJOR, GHOSTSCRUB_VERSION_MINOR, GHOSTSCRUB_VERSION_PATCH, 0
/* ------------------------------------------------------------------ */

/* Everything below is **C++-only**.  Keep it out of windres runs.   */
#ifndef RC_INVOKED
/* Human-friendly version string for the C++ codebase */
constexpr const char* GHOSTSCRUB_VERSION = GHOSTSCRUB_VERSION_STR;
#endif /* RC_INVOKED */

#endif /* GHOSTSCRUB_VERSION_HPP */
