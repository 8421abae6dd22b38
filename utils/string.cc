// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#include <defs.hh>

#include <cctype>

#include <string>
#include <vector>

#include <utils/string.hh>

namespace glyphtext {

std::vector< std::string > tokenize(const std::string &s)
{
    std::vector< std::string > xs;

    auto iter = s.begin(), last = s.end();

    while (iter != last) {
        for (; iter != last && isspace((unsigned char)*iter); ++iter) ;

        if (iter == last)
            break;

        auto next = iter;

        if (*iter == '"' || *iter == '\'') {
            const char quote = *iter++;
            for (next = iter; next != last && *next != quote; ++next) ;
        } else {
            for (++next; next != last && !isspace((unsigned char)*next); ++next) ;
        }

        xs.emplace_back(iter, next);
        iter = next == last ? next : next + 1;
    }

    return xs;
}

size_t utf8_length(const std::string &s)
{
    size_t n = 0;

    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80)
            ++n;
    }

    return n;
}

std::string unescape(const std::string &s)
{
    std::string str;
    str.reserve(s.size());

    for (auto iter = s.begin(); iter != s.end(); ++iter) {
        if (*iter != '\\' || iter + 1 == s.end()) {
            str += *iter;
            continue;
        }

        switch (*++iter) {
        case 'n': str += '\n'; break;
        case 't': str += '\t'; break;
        case 'r': str += '\r'; break;
        case '\\': str += '\\'; break;

        default:
            str += '\\';
            str += *iter;
            break;
        }
    }

    return str;
}

} // namespace glyphtext
