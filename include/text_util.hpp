#pragma once

#include <string>
#include <vector>

std::string trim(const std::string& s);

// Trims and collapses every run of whitespace (including line breaks inside
// table cells) into a single space.
std::string collapseWhitespace(const std::string& s);

std::string toUpper(std::string s);

// Trimmed, whitespace-collapsed, upper-cased form used for every identity key.
std::string normalizeName(const std::string& s);

std::vector<std::string> splitWords(const std::string& s);

// Splits on '\n', dropping a trailing '\r' from each line. Empty lines are kept.
std::vector<std::string> splitLines(const std::string& text);

bool isAllDigits(const std::string& s);
