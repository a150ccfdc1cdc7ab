#pragma once
#include <string>

/** Lower-case hex SHA-256 of a byte string. */
std::string sha256Hex(const std::string& data);

/** SHA-256 of a file's content. Throws std::runtime_error if unreadable. */
std::string sha256File(const std::string& path);
