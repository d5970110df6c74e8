#include "core/coordinate_parser.h"
#include "core/errors.h"
#include <cctype>
#include <cerrno>
#include <cstdlib>

namespace gridq {

namespace {

std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

int parse_int(const std::string& field, const std::string& literal) {
    std::string t = trim(field);
    if (t.empty()) {
        throw ConfigurationError("Malformed coordinate literal '" + literal + "': empty component");
    }
    errno = 0;
    char* end = nullptr;
    long v = std::strtol(t.c_str(), &end, 10);
    if (*end != '\0' || errno == ERANGE || v < -1000000 || v > 1000000) {
        throw ConfigurationError("Malformed coordinate literal '" + literal + "': '" + t +
                                 "' is not an integer");
    }
    return static_cast<int>(v);
}

// Splits on whitespace and ';', keeping "(r, c)" groups together.
std::vector<std::string> split_tokens(const std::string& text) {
    std::vector<std::string> tokens;
    std::string cur;
    int depth = 0;
    for (char ch : text) {
        if (ch == '(') depth++;
        if (ch == ')') depth--;
        bool sep = (ch == ';') || (std::isspace(static_cast<unsigned char>(ch)) && depth == 0);
        if (sep) {
            if (!cur.empty()) tokens.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(ch);
        }
    }
    if (depth != 0) {
        throw ConfigurationError("Malformed coordinate list '" + text + "': unbalanced parentheses");
    }
    if (!cur.empty()) tokens.push_back(cur);
    return tokens;
}

} // namespace

Coordinate parse_coordinate(const std::string& text) {
    std::string t = trim(text);
    if (t.size() >= 2 && t.front() == '(' && t.back() == ')') {
        t = t.substr(1, t.size() - 2);
    }
    size_t comma = t.find(',');
    if (comma == std::string::npos || t.find(',', comma + 1) != std::string::npos) {
        throw ConfigurationError("Malformed coordinate literal '" + text + "': expected 'row,col'");
    }
    Coordinate c;
    c.row    = parse_int(t.substr(0, comma), text);
    c.column = parse_int(t.substr(comma + 1), text);
    return c;
}

std::vector<Coordinate> parse_coordinate_list(const std::string& text) {
    std::vector<Coordinate> out;
    for (const auto& tok : split_tokens(text)) {
        out.push_back(parse_coordinate(tok));
    }
    return out;
}

std::vector<PortalSpec> parse_portal_list(const std::string& text) {
    std::vector<PortalSpec> out;
    for (const auto& tok : split_tokens(text)) {
        size_t colon = tok.find(':');
        if (colon == std::string::npos || tok.find(':', colon + 1) != std::string::npos) {
            throw ConfigurationError("Malformed portal literal '" + tok + "': expected 'r,c:r,c'");
        }
        PortalSpec p;
        p.entry = parse_coordinate(tok.substr(0, colon));
        p.exit  = parse_coordinate(tok.substr(colon + 1));
        out.push_back(p);
    }
    return out;
}

} // namespace gridq
