#ifndef REPOMIGRATOR_VERSION_HPP
#define REPOMIGRATOR_VERSION_HPP

#define REPOMIGRATOR_VERSION_MAJOR 0
#define REPOMIGRATOR_VERSION_MINOR 3
#define REPOMIGRATOR_VERSION_PATCH 0

/* Overridden by the build when REPOMIGRATOR_VERSION_STR is defined. */
#ifndef REPOMIGRATOR_VERSION_STR
#define REPOMIGRATOR_VERSION_STR "0.3.0"
#endif

constexpr const char* REPOMIGRATOR_VERSION = REPOMIGRATOR_VERSION_STR;

#endif /* REPOMIGRATOR_VERSION_HPP */
