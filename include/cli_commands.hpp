#pragma once

#include <iosfwd>
#include <memory>
#include <optional>

#include "mirror_transport.hpp"
#include "options.hpp"

namespace cli {

/**
 * @brief Open the log file and apply level, format and rotation settings.
 *
 * Does nothing when no log file was requested.
 */
void setup_logging(const Options& opts);

/**
 * @brief Print the migration plan when `--dry-run` was given.
 *
 * Returns `0` after printing or `std::nullopt` if no dry run was requested.
 */
std::optional<int> handle_dry_run(const Options& opts, std::ostream& out);

/** @brief Transport selected by `--git-cli`. */
std::unique_ptr<MirrorTransport> make_transport(const Options& opts);

/**
 * @brief Migrate every repository with @p transport.
 *
 * Writes progress and per-repository results to @p out unless `--silent`,
 * logs each step and writes the `--report-json` file.
 *
 * @return Process exit code: `0` when every repository succeeded or was
 *         cloned only, `1` otherwise.
 */
int run_migration(const Options& opts, MirrorTransport& transport, std::ostream& out);

/**
 * @brief Execute the migration with the transport selected in @a opts.
 */
int handle_migration_run(const Options& opts);

} // namespace cli
