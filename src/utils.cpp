#include "redline/utils.h"
#include "redline/errors.h"
#include <cctype>
#include <cstring>

using namespace std;

namespace redline {

string to_lowercase(const string& s)
{
    string res = s;
    for (size_t i=0;i<s.length();i++) {
        char c = s[i];
        if (c>='A' && c<='Z')
            res[i]=c+'a'-'A';
    }
    return res;
}

string normalize_white_spaces(const string& s, char sep)
{
    string res;
    bool whitespace = false;
    for (char c: s) {
        if (c==' ' || c=='\n' || c=='\t' || c=='\r') {
            whitespace = true;
        } else {
            if (whitespace && !res.empty()) {
                res+=sep;
            }
            whitespace = false;
            res+=c;
        }
    }
    return res;
}

size_t is_wspace(const string& s, size_t i)
{
    char c = s[i];
    if (isspace(static_cast<unsigned char>(c))) {
        return 1;
    }
    if ((c&0xc0)==0xc0) {
        // U+00A0 and U+202F
        if (s.compare(i, 2, "\u00A0")==0) {
            return 2;
        }
        if (s.compare(i, 3, "\u202F")==0) {
            return 3;
        }
    }
    return 0;
}

bool is_blank(const string& s)
{
    size_t i = 0;
    while (i<s.size()) {
        size_t n = is_wspace(s, i);
        if (!n) {
            return false;
        }
        i+=n;
    }
    return true;
}

string trim(const string& s)
{
    size_t start = 0;
    while (start<s.size() && isspace(static_cast<unsigned char>(s[start]))) {
        start++;
    }
    size_t end = s.size();
    while (end>start && isspace(static_cast<unsigned char>(s[end-1]))) {
        end--;
    }
    return s.substr(start, end-start);
}

Words split_words(const string& s)
{
    Words res;
    string word;
    size_t i = 0;
    while (i<s.size()) {
        size_t n = is_wspace(s, i);
        if (n) {
            if (!word.empty()) {
                res.push_back(word);
                word.clear();
            }
            i+=n;
        } else {
            word+=s[i++];
        }
    }
    if (!word.empty()) {
        res.push_back(word);
    }
    return res;
}

Words split_keep_whitespace(const string& s)
{
    Words res;
    string part;
    bool in_space = false;
    size_t i = 0;
    while (i<s.size()) {
        size_t n = is_wspace(s, i);
        bool space = n>0;
        if (!part.empty() && space!=in_space) {
            res.push_back(part);
            part.clear();
        }
        in_space = space;
        size_t len = space?n:1;
        part+=s.substr(i, len);
        i+=len;
    }
    if (!part.empty()) {
        res.push_back(part);
    }
    return res;
}

bool ends_with_word_char(const string& s)
{
    if (s.empty()) {
        return false;
    }
    unsigned char c = s[s.size()-1];
    return isalnum(c) || c=='_';
}

bool is_punctuation_only(const string& s)
{
    if (s.empty()) {
        return false;
    }
    for (char c: s) {
        if (!strchr(",.:;!?'\")]}>", c)) {
            return false;
        }
    }
    return true;
}

string truncate_text(const string& s, size_t max_length)
{
    if (s.size()<=max_length) {
        return s;
    }
    return s.substr(0, max_length)+"...";
}

string timestampToIso(time_t time)
{
    struct tm * dt;
    char buffer [30];
    dt = gmtime(&time);
    if (!dt) {
        throw RedlineException(ErrorKind::Config, ErrorType::BadConfig, "Date "+to_string(static_cast<long long>(time))+" is out of range");
    }
    strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", dt);
    return std::string(buffer);
}

} // namespace redline
