#pragma once
#include <filesystem>
#include <string>
#include <vector>

std::string hex_from_bytes(const std::vector<unsigned char>&);

// Streams the file through SHA-256. Throws std::runtime_error if it cannot be read.
std::string sha256_file_hex(const std::filesystem::path& path);

// Random RFC 4122 version 4 identifier, e.g. "3f2b0c1e-9a4d-4c6e-8f10-2b7d5e9a0c41".
std::string random_uuid();

// "~/x" -> "$HOME/x". Anything else is returned unchanged.
std::string expand_tilde(const std::string& path);
