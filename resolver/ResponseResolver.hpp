//
// Created by Revhome on 15.10.2025.
//

#ifndef HAR_REPLAY_APP_RESPONSE_RESOLVER_HPP
#define HAR_REPLAY_APP_RESPONSE_RESOLVER_HPP

#include <functional>
#include <string>
#include <utility>
#include "../include/Entry.hpp"

// Постобработка ответа-редиректа (например, убрать Origin). По умолчанию не задана
using RedirectHook = std::function<void(const RequestSnapshot &live, ResponseSnapshot &response)>;

// 🔹 "https://user@host.test:8443/a?b" -> {"https", "host.test:8443"}
// Для URL без схемы обе части пустые
std::pair<std::string, std::string> splitOrigin(const std::string &url);

// 🔹 Относительный редирект ("/next") переносится на origin живого запроса,
// абсолютный возвращается как есть
std::string resolveRedirect(const std::string &liveUrl, const std::string &target);

ResponseSnapshot resolveResponse(const RequestSnapshot &live, const Entry &entry, const RedirectHook &hook = {});

#endif //HAR_REPLAY_APP_RESPONSE_RESOLVER_HPP
