#ifndef TIME_UTILS_HPP
#define TIME_UTILS_HPP

#include <chrono>
#include <string>

/**
 * @brief Get the current local time formatted as YYYY-MM-DD HH:MM:SS.
 */
std::string timestamp();

/**
 * @brief Format an elapsed time as a short string like 850ms, 4.2s or 1m05s.
 */
std::string format_elapsed(std::chrono::milliseconds dur);

#endif // TIME_UTILS_HPP
