#pragma once
#include <string>
#include <vector>

// Whole file as text, "" when unreadable.
std::string read_file(const std::string &path);

// First line of a file with surrounding whitespace removed.
std::string read_line(const std::string &path);

bool path_exists(const std::string &path);

// Sorted glob(3) matches, empty on no match.
std::vector<std::string> glob_paths(const std::string &pattern);

// Runs `cmd` through /bin/sh with a time limit and returns stdout.
// Missing tools, non-zero exit and timeouts all give "".
std::string run_command(const std::string &cmd, double timeout_s = 0.7);

std::string trim(const std::string &s);

// Parses a leading integer; false when `s` has none.
bool parse_int(const std::string &s, long long &out);
