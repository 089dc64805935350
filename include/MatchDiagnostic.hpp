//
// Created by Revhome on 12.10.2025.
//

#ifndef HAR_REPLAY_APP_MATCH_DIAGNOSTIC_HPP
#define HAR_REPLAY_APP_MATCH_DIAGNOSTIC_HPP

#include <string>
#include <vector>

// 🔍 Расхождение по одному ключу
struct KeyDiff {
    std::string key;
    std::string live_value;     // Значение в живом запросе (пусто для missing)
    std::string cached_value;   // Значение в записи HAR (пусто для redundant)
};

// Результат сравнения двух наборов name/value
struct DictDiff {
    std::vector<KeyDiff> missing;      // Есть в записи, нет в запросе
    std::vector<KeyDiff> redundant;    // Есть в запросе, нет в записи
    std::vector<KeyDiff> mismatching;  // Есть в обоих, значения различаются

    bool empty() const {
        return missing.empty() && redundant.empty() && mismatching.empty();
    }
};

// 🩺 Отчёт об одной попытке сопоставления. Только для логов и тестов
struct MatchDiagnostic {
    bool baseline_mismatch = false;         // Метод или URL не совпали
    bool order_mismatch = false;
    std::vector<std::string> live_order;    // Заполняются только при order_mismatch
    std::vector<std::string> cached_order;
    DictDiff headers;
    bool cookies_compared = false;
    DictDiff cookies;
    bool body_mismatch = false;

    bool matched() const {
        return !baseline_mismatch && !order_mismatch && headers.empty() && cookies.empty() && !body_mismatch;
    }
};

struct MatchResult {
    bool matched = false;
    MatchDiagnostic diagnostic;
};

#endif //HAR_REPLAY_APP_MATCH_DIAGNOSTIC_HPP
