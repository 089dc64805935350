//
// Created by Revhome on 13.10.2025.
//

#include "CookieCodec.hpp"

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
    return s;
}

}

Headers parseCookieHeader(std::string_view header) {
    Headers cookies;
    size_t start = 0;
    while (start <= header.size()) {
        size_t end = header.find(';', start);
        if (end == std::string_view::npos) end = header.size();

        const std::string_view pair = trim(header.substr(start, end - start));
        start = end + 1;
        if (pair.empty()) continue;

        // Пара без '=' считается именем с пустым значением
        const size_t eq = pair.find('=');
        const std::string name(trim(pair.substr(0, eq)));
        const std::string value = eq == std::string_view::npos ? std::string() : std::string(trim(pair.substr(eq + 1)));
        if (name.empty()) continue;

        // Повтор имени перезаписывает значение, позиция остаётся первой
        bool replaced = false;
        for (auto &c : cookies) {
            if (c.name == name) {
                c.value = value;
                replaced = true;
                break;
            }
        }
        if (!replaced) cookies.push_back({name, value});
    }
    return cookies;
}

std::string formatCookieHeader(const Headers &cookies) {
    std::string out;
    for (const auto &c : cookies) {
        if (!out.empty()) out += "; ";
        out += c.name;
        out += "=";
        out += c.value;
    }
    return out;
}
