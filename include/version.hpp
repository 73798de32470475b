#ifndef REPOBOOTSTRAP_VERSION_HPP
#define REPOBOOTSTRAP_VERSION_HPP

/* ------------------------------------------------------------------
   Public numeric version macros                                     */
#define REPOBOOTSTRAP_VERSION_MAJOR 0
#define REPOBOOTSTRAP_VERSION_MINOR 3
#define REPOBOOTSTRAP_VERSION_PATCH 0

/*
 * Release tag injected by the CI workflow.
 * Example format: "2025.07.31-1".
 */
#define REPOBOOTSTRAP_VERSION_STR "0.3.0"
/* ------------------------------------------------------------------ */

/* Human-friendly version string for the C++ codebase */
constexpr const char* REPOBOOTSTRAP_VERSION = REPOBOOTSTRAP_VERSION_STR;

/* User-Agent sent with every REST request */
constexpr const char* REPOBOOTSTRAP_USER_AGENT = "repo-bootstrap/" REPOBOOTSTRAP_VERSION_STR;

#endif /* REPOBOOTSTRAP_VERSION_HPP */
