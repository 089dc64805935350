//
// Created by Revhome on 14.10.2025.
//

#ifndef HAR_REPLAY_APP_REQUEST_MATCHER_HPP
#define HAR_REPLAY_APP_REQUEST_MATCHER_HPP

#include "../include/Entry.hpp"
#include "../include/MatchDiagnostic.hpp"

// 🔹 Общее сравнение двух наборов name/value (заголовки или cookie).
// Для повторяющегося имени сравниваются все его значения по порядку.
DictDiff compareKeyValues(const Headers &live, const Headers &cached, bool caseInsensitiveKeys);

// 🔹 Совпадает ли живой запрос с записанным.
// strict = false: только метод и URL.
// strict = true: ещё порядок и значения заголовков, набор cookie и тело.
MatchResult matchRequests(const RequestSnapshot &live, const RequestSnapshot &cached, bool strict);

// Пишет отчёт о несовпадении в лог (DEBUG)
void logDiagnostic(const MatchDiagnostic &diagnostic, const std::string &indent);

#endif //HAR_REPLAY_APP_REQUEST_MATCHER_HPP
