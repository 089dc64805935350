//
// Created by Revhome on 12.10.2025.
//

#ifndef HAR_REPLAY_APP_HEADER_HPP
#define HAR_REPLAY_APP_HEADER_HPP

#include <string>
#include <string_view>
#include <vector>
#include <cctype>

// 🔑 Пара name/value. Используется и для заголовков, и для cookie
struct Header {
    std::string name;
    std::string value;
};

inline bool operator==(const Header &lhs, const Header &rhs) {
    return lhs.name == rhs.name && lhs.value == rhs.value;
}

inline bool operator!=(const Header &lhs, const Header &rhs) {
    return !(lhs == rhs);
}

// Порядок элементов значим: браузеры отправляют заголовки в фиксированном порядке
using Headers = std::vector<Header>;

// Сравнение имён без учёта регистра (имена HTTP-заголовков регистронезависимы)
inline bool iequals(std::string_view lhs, std::string_view rhs) {
    if (lhs.size() != rhs.size()) return false;
    for (size_t i = 0; i < lhs.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(lhs[i])) !=
            std::tolower(static_cast<unsigned char>(rhs[i]))) {
            return false;
        }
    }
    return true;
}

// Первый заголовок с таким именем или nullptr
inline const Header *findHeader(const Headers &headers, std::string_view name) {
    for (const auto &h : headers) {
        if (iequals(h.name, name)) return &h;
    }
    return nullptr;
}

#endif //HAR_REPLAY_APP_HEADER_HPP
