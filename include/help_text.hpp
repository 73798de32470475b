#ifndef HELP_TEXT_HPP
#define HELP_TEXT_HPP

#include <ostream>

/**
 * @brief Print usage and the grouped option table to @p os.
 *
 * @param prog Program name shown in the usage line.
 */
void print_help(const char* prog, std::ostream& os);

#endif // HELP_TEXT_HPP
