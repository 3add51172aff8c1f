#ifndef REDLINE_UTILS_H
#define REDLINE_UTILS_H
#include <string>
#include <vector>
#include <ctime>

namespace redline {

typedef std::vector<std::string> Words;

std::string to_lowercase(const std::string& s);

std::string normalize_white_spaces(const std::string& s, char sep = ' ');

size_t is_wspace(const std::string& s, size_t i);

bool is_blank(const std::string& s);

std::string trim(const std::string& s);

// Splits on runs of whitespace, dropping empty parts
Words split_words(const std::string& s);

// Splits into alternating word and whitespace parts; concatenating the parts gives back s
Words split_keep_whitespace(const std::string& s);

bool ends_with_word_char(const std::string& s);

// True for a non-empty string made only of , . : ; ! ? ' " ) ] } >
bool is_punctuation_only(const std::string& s);

std::string truncate_text(const std::string& s, size_t max_length);

// ISO 8601 in UTC without fractional seconds, e.g. 2024-01-31T10:00:00Z
std::string timestampToIso(time_t time);

} // namespace redline

#endif // REDLINE_UTILS_H
