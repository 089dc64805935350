//
// Created by Revhome on 14.10.2025.
//

#include "RequestMatcher.hpp"
#include "../cookie/CookieCodec.hpp"
#include "../logger/Logger.hpp"
#include <algorithm>

namespace {

bool sameKey(const std::string &lhs, const std::string &rhs, const bool caseInsensitive) {
    return caseInsensitive ? iequals(lhs, rhs) : lhs == rhs;
}

const Header *findKey(const Headers &pairs, const std::string &key, const bool caseInsensitive) {
    for (const auto &p : pairs) {
        if (sameKey(p.name, key, caseInsensitive)) return &p;
    }
    return nullptr;
}

// Имя уже встречалось раньше позиции index
bool seenBefore(const Headers &pairs, const size_t index, const bool caseInsensitive) {
    for (size_t i = 0; i < index; ++i) {
        if (sameKey(pairs[i].name, pairs[index].name, caseInsensitive)) return true;
    }
    return false;
}

// Все значения имени в порядке появления
std::vector<std::string> valuesOf(const Headers &pairs, const std::string &key, const bool caseInsensitive) {
    std::vector<std::string> values;
    for (const auto &p : pairs) {
        if (sameKey(p.name, key, caseInsensitive)) values.push_back(p.value);
    }
    return values;
}

std::string joinValues(const std::vector<std::string> &values) {
    std::string out;
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) out += ", ";
        out += values[i];
    }
    return out;
}

std::string joinNames(const std::vector<std::string> &names) {
    std::string out = "[";
    for (size_t i = 0; i < names.size(); ++i) {
        if (i > 0) out += ", ";
        out += "'" + names[i] + "'";
    }
    return out + "]";
}

void logDictDiff(const DictDiff &diff, const std::string &indent, const char *name, const char *singular) {
    if (!diff.missing.empty()) {
        HAR_LOG_DEBUG(indent << "Request " << name << " are missing the following entries:");
        for (const auto &k : diff.missing) {
            HAR_LOG_DEBUG(indent << "  '" << k.key << "': '" << k.cached_value << "'");
        }
    }
    if (!diff.redundant.empty()) {
        HAR_LOG_DEBUG(indent << "Request " << name << " have the following redundant entries:");
        for (const auto &k : diff.redundant) {
            HAR_LOG_DEBUG(indent << "  '" << k.key << "': '" << k.live_value << "'");
        }
    }
    if (!diff.mismatching.empty()) {
        HAR_LOG_DEBUG(indent << "Request " << name << " have the following mismatching entries:");
        for (const auto &k : diff.mismatching) {
            const std::string pad(k.key.size() + 2, ' ');
            HAR_LOG_DEBUG(indent << "  '" << k.key << "': '" << k.live_value << "'");
            HAR_LOG_DEBUG(indent << "  " << pad << "  does not equal cached " << singular << ":");
            HAR_LOG_DEBUG(indent << "  " << pad << "  '" << k.cached_value << "'");
        }
    }
}

}

DictDiff compareKeyValues(const Headers &live, const Headers &cached, const bool caseInsensitiveKeys) {
    DictDiff diff;
    for (size_t i = 0; i < cached.size(); ++i) {
        if (seenBefore(cached, i, caseInsensitiveKeys)) continue;
        const Header &c = cached[i];
        if (findKey(live, c.name, caseInsensitiveKeys) == nullptr) {
            diff.missing.push_back({c.name, "", joinValues(valuesOf(cached, c.name, caseInsensitiveKeys))});
            continue;
        }
        // Повторяющееся имя: сравниваются все значения по порядку
        const auto liveValues = valuesOf(live, c.name, caseInsensitiveKeys);
        const auto cachedValues = valuesOf(cached, c.name, caseInsensitiveKeys);
        if (liveValues != cachedValues) {
            diff.mismatching.push_back({c.name, joinValues(liveValues), joinValues(cachedValues)});
        }
    }
    for (size_t i = 0; i < live.size(); ++i) {
        if (seenBefore(live, i, caseInsensitiveKeys)) continue;
        if (findKey(cached, live[i].name, caseInsensitiveKeys) == nullptr) {
            diff.redundant.push_back({live[i].name, joinValues(valuesOf(live, live[i].name, caseInsensitiveKeys)), ""});
        }
    }
    return diff;
}

MatchResult matchRequests(const RequestSnapshot &live, const RequestSnapshot &cached, const bool strict) {
    MatchResult result;
    MatchDiagnostic &d = result.diagnostic;

    // Метод и URL сравниваются всегда, без нормализации
    if (live.method != cached.method || live.url != cached.url) {
        d.baseline_mismatch = true;
        return result;
    }
    if (!strict) {
        result.matched = true;
        return result;
    }

    const std::string indent(live.method.size(), ' ');
    HAR_LOG_DEBUG(indent << "Testing possible match strictly");

    // 🔹 Порядок и написание имён заголовков должны совпадать полностью
    bool sameOrder = live.headers.size() == cached.headers.size();
    for (size_t i = 0; sameOrder && i < live.headers.size(); ++i) {
        sameOrder = live.headers[i].name == cached.headers[i].name;
    }
    if (!sameOrder) {
        d.order_mismatch = true;
        for (const auto &h : live.headers) d.live_order.push_back(h.name);
        for (const auto &h : cached.headers) d.cached_order.push_back(h.name);
    }

    d.headers = compareKeyValues(live.headers, cached.headers, true);
    // Значение Cookie сравнивается ниже как набор, а не как строка
    auto &mismatching = d.headers.mismatching;
    mismatching.erase(std::remove_if(mismatching.begin(), mismatching.end(),
                                     [](const KeyDiff &k) { return iequals(k.key, "Cookie"); }),
                      mismatching.end());

    // При несовпадении порядка cookie и тело не проверяются
    if (!d.order_mismatch) {
        const Header *liveCookie = findHeader(live.headers, "Cookie");
        const Header *cachedCookie = findHeader(cached.headers, "Cookie");
        if (liveCookie != nullptr || cachedCookie != nullptr) {
            d.cookies_compared = true;
            d.cookies = compareKeyValues(parseCookieHeader(liveCookie ? liveCookie->value : ""),
                                         parseCookieHeader(cachedCookie ? cachedCookie->value : ""), false);
        }

        // Пустое тело в записи = "не важно"
        if (!cached.body.empty() && cached.body != live.body) {
            d.body_mismatch = true;
        }
    }

    result.matched = d.matched();
    if (!result.matched) {
        logDiagnostic(d, indent);
    }
    return result;
}

void logDiagnostic(const MatchDiagnostic &diagnostic, const std::string &indent) {
    if (!Logger::isEnabled(LogLevel::DEBUG)) return;
    if (diagnostic.baseline_mismatch) {
        HAR_LOG_DEBUG(indent << "Method or URL mismatch");
        return;
    }

    HAR_LOG_DEBUG(indent << std::string(16, '='));
    if (diagnostic.order_mismatch) {
        HAR_LOG_DEBUG(indent << "Request header order does not match:");
        HAR_LOG_DEBUG(indent << "  " << joinNames(diagnostic.live_order));
        HAR_LOG_DEBUG(indent << "  does not equal cached:");
        HAR_LOG_DEBUG(indent << "  " << joinNames(diagnostic.cached_order));
    }
    logDictDiff(diagnostic.headers, indent, "headers", "header");
    logDictDiff(diagnostic.cookies, indent, "cookies", "cookie");
    if (diagnostic.order_mismatch || !diagnostic.headers.empty() || !diagnostic.cookies.empty()) {
        HAR_LOG_DEBUG(indent << "Headers mismatch");
    }
    if (diagnostic.body_mismatch) {
        HAR_LOG_DEBUG(indent << "Post data mismatch");
    }
}
