#ifndef PARSE_UTILS_HPP
#define PARSE_UTILS_HPP

#include <chrono>
#include <cstddef>
#include <string>

// Parse a size_t from a string.
// Format: decimal digits only.
// Bounds: inclusive [min, max].
// Invalid input: conversion failure, trailing characters or out-of-range sets ok=false and
// returns 0.
size_t parse_size_t(const std::string& value, size_t min, size_t max, bool& ok);

// Parse byte size from a string with optional unit suffix.
// Format: unsigned integer followed by optional units B, K/KB, M/MB or G/GB (case-insensitive).
// Bounds: inclusive [min, max] bytes.
// Invalid input: bad unit, parse failure, or out-of-range sets ok=false and returns 0.
size_t parse_bytes(const std::string& value, size_t min, size_t max, bool& ok);

// Parse a duration string like "30", "45s", "2m" or "1h".
// Format: non-negative integer optionally followed by s (default), m or h.
// Bounds: inclusive [0, max_seconds].
// Invalid input: parse failure or out-of-range sets ok=false and returns 0s.
std::chrono::seconds parse_duration(const std::string& value, long long max_seconds, bool& ok);

// Parse a boolean config value.
// Format: true/false, yes/no, on/off, 1/0 (case-insensitive); empty means true.
// Invalid input: anything else sets ok=false and returns false.
bool parse_bool(const std::string& value, bool& ok);

#endif // PARSE_UTILS_HPP
