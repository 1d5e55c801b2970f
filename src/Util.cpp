#include "maxify/Util.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <random>
#include <regex>
#if defined(_WIN32)
  #include <windows.h>
  #include <cstring>
#else
  #include <unistd.h>
  extern char **environ;
#endif

namespace maxify {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
    return s;
}

std::string trim(const std::string& s) {
    size_t i = 0, j = s.size();
    while (i < j && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
    while (j > i && std::isspace(static_cast<unsigned char>(s[j-1]))) --j;
    return s.substr(i, j - i);
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool glob_match(const std::string& pattern, const std::string& text) {
    if (pattern.empty()) return true;

    // translate glob to regex, case-insensitive
    std::string rx = "^";
    for (size_t i = 0; i < pattern.size(); ++i) {
        char c = pattern[i];
        switch (c) {
            case '*': rx += ".*"; break;
            case '?': rx += "."; break;
            case '[': {
                auto close = pattern.find(']', i + 1);
                if (close == std::string::npos || close == i + 1) {
                    rx += "\\[";
                    break;
                }
                std::string cls = pattern.substr(i + 1, close - i - 1);
                rx += '[';
                size_t k = 0;
                if (cls[0] == '!' || cls[0] == '^') { rx += '^'; k = 1; }
                for (; k < cls.size(); ++k) {
                    char cc = static_cast<char>(std::tolower(static_cast<unsigned char>(cls[k])));
                    if (cc == '\\' || cc == '[' || cc == '^') rx += '\\';
                    rx += cc;
                }
                rx += ']';
                i = close;
                break;
            }
            case '.': case '+': case '^': case '$': case '(': case ')':
            case '{': case '}': case '|': case '\\': case ']':
                rx += '\\'; rx += c; break;
            default: rx += static_cast<char>(std::tolower(static_cast<unsigned char>(c))); break;
        }
    }
    rx += "$";
    try {
        return std::regex_search(to_lower(text), std::regex(rx));
    } catch (const std::regex_error&) {
        return false;
    }
}

bool natural_less(const std::string& a, const std::string& b) {
    auto is_digit = [](char c){ return std::isdigit(static_cast<unsigned char>(c)) != 0; };
    size_t i = 0, j = 0;
    while (i < a.size() && j < b.size()) {
        if (is_digit(a[i]) && is_digit(b[j])) {
            size_t ie = i, je = j;
            while (ie < a.size() && is_digit(a[ie])) ++ie;
            while (je < b.size() && is_digit(b[je])) ++je;
            // compare digit runs by value: strip leading zeros, then length, then text
            std::string na = a.substr(i, ie - i);
            std::string nb = b.substr(j, je - j);
            na.erase(0, std::min(na.find_first_not_of('0'), na.size() - 1));
            nb.erase(0, std::min(nb.find_first_not_of('0'), nb.size() - 1));
            if (na.size() != nb.size()) return na.size() < nb.size();
            if (na != nb) return na < nb;
            i = ie;
            j = je;
            continue;
        }
        const int ca = std::tolower(static_cast<unsigned char>(a[i]));
        const int cb = std::tolower(static_cast<unsigned char>(b[j]));
        if (ca != cb) return ca < cb;
        ++i;
        ++j;
    }
    if ((a.size() - i) != (b.size() - j)) {
        return (a.size() - i) < (b.size() - j);
    }
    return a < b;
}

std::vector<std::pair<std::string, std::string>> enumerate_environment() {
    std::vector<std::pair<std::string, std::string>> envs;
#if defined(_WIN32)
    LPTCH env = GetEnvironmentStringsA();
    if (!env) return envs;
    for (LPSTR var = (LPSTR)env; *var != '\0'; var += strlen(var) + 1) {
        std::string entry(var);
        auto pos = entry.find('=');
        if (pos == std::string::npos) continue;
        envs.emplace_back(entry.substr(0,pos), entry.substr(pos+1));
    }
    FreeEnvironmentStringsA(env);
#else
    if (environ) {
        for (char **env = environ; *env; ++env) {
            std::string entry(*env);
            auto pos = entry.find('=');
            if (pos == std::string::npos) continue;
            envs.emplace_back(entry.substr(0,pos), entry.substr(pos+1));
        }
    }
#endif
    return envs;
}

std::string generate_id() {
    static std::mt19937_64 engine{std::random_device{}()};
    std::uniform_int_distribution<unsigned long long> dist;

    unsigned long long hi = dist(engine);
    unsigned long long lo = dist(engine);
    // version 4, RFC 4122 variant
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    char buf[33];
    std::snprintf(buf, sizeof(buf), "%016llx%016llx", hi, lo);
    return std::string(buf, 32);
}

} // namespace maxify
