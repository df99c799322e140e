/**
 * @file repomigrator.cpp
 * @brief CLI entry point migrating repositories between git hosts.
 *
 * Mirrors each requested repository from the origin host into a local bare
 * clone, points it at the destination host and pushes every ref there.
 */

#include <iostream>

#include "cli_commands.hpp"
#include "git_utils.hpp"
#include "help_text.hpp"
#include "options.hpp"
#include "version.hpp"

/**
 * @brief Application entry point.
 *
 * @return int Zero when every repository succeeded or when printing
 *             help/version; 1 on failed repositories or invalid options.
 */
#ifndef REPOMIGRATOR_NO_MAIN
int main(int argc, char* argv[]) {
    git::GitInitGuard git_guard;
    try {
        Options opts = parse_options(argc, argv);
        if (opts.show_help) {
            print_help(argv[0]);
            return 0;
        }
        if (opts.print_version) {
            std::cout << REPOMIGRATOR_VERSION << "\n";
            return 0;
        }
        cli::setup_logging(opts);
        git::set_proxy(opts.proxy_url);
        if (opts.timeout.count() > 0)
            git::set_libgit_timeout(static_cast<unsigned int>(opts.timeout.count()));
        auto dry = cli::handle_dry_run(opts, std::cout);
        int rc = dry ? *dry : cli::handle_migration_run(opts);
        shutdown_logger();
        return rc;
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        shutdown_logger();
        return 1;
    }
}
#endif // REPOMIGRATOR_NO_MAIN
