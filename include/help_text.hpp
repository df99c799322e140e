#ifndef HELP_TEXT_HPP
#define HELP_TEXT_HPP

/** Print usage and the option list grouped by category. */
void print_help(const char* prog);

#endif // HELP_TEXT_HPP
