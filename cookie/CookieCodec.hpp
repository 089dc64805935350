//
// Created by Revhome on 13.10.2025.
//

#ifndef HAR_REPLAY_APP_COOKIE_CODEC_HPP
#define HAR_REPLAY_APP_COOKIE_CODEC_HPP

#include <string>
#include <string_view>
#include "../include/Header.hpp"

// 🍪 "a=1; b=2" -> [{a, 1}, {b, 2}] с сохранением порядка
Headers parseCookieHeader(std::string_view header);

// 🍪 [{a, 1}, {b, 2}] -> "a=1; b=2"
std::string formatCookieHeader(const Headers &cookies);

#endif //HAR_REPLAY_APP_COOKIE_CODEC_HPP
