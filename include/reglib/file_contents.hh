#pragma once

#include <string>

// Reads whole file @p path, throws std::runtime_error on error
std::string get_file_contents(const char* path);
