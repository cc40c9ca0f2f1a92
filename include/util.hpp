#pragma once
#include <string>
#include <cstring>
#include <cstdint>
#include <sys/stat.h>
#include <defs.h>

void mkdirR(std::string filename);

std::string unescapeString(std::string thing); // drop the backslash from every backslash-escaped character

bool isNumber(const char* data); // does this read entirely as a decimal number (optional sign, optional point)?

std::string formatNumber(double number); // shortest text that reads back as the same double, laid out the way javascript prints numbers

bool isWhitespace(char thing);

bool isBlank(const std::string& thing);

std::string stripComments(std::string text); // drop everything from // to the end of each line

std::string replaceAt(const std::string& text, const std::string& with, size_t start, size_t end); // returns a new string, [start, end) swapped out for `with`
