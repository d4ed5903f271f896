#pragma once
/*
 * File I/O
 *
 * Purpose: read files via mmap (whole text or split into lines, CRLF
 * normalized) and write them safely (.tmp -> fdatasync -> atomic rename).
 * Usage: functions return false and fill `msg` on failure.
 */
#include <filesystem>
#include <string>
#include <vector>

bool mmap_read_file(const std::filesystem::path& path, std::string& out, std::string& msg);
bool mmap_readlines(const std::filesystem::path& path,
                    std::vector<std::string>& out_lines,
                    std::string& msg);
bool write_file_atomic(const std::filesystem::path& path, const std::string& data, std::string& msg);
