//
// Created by Revhome on 28.09.2025.
//

#include "Parser.hpp"
#include "../include/Errors.hpp"
#include "../logger/Logger.hpp"

namespace {

using ElementResult = simdjson::simdjson_result<simdjson::dom::element>;

std::string optionalString(const ElementResult &value) {
    std::string_view text;
    if (value.get(text) != simdjson::SUCCESS) {
        return {};
    }
    return std::string(text);
}

std::string requireString(const ElementResult &value, const std::string &where) {
    std::string_view text;
    if (const auto error = value.get(text)) {
        throw MalformedCapture(where + ": " + simdjson::error_message(error));
    }
    return std::string(text);
}

int base64Value(const char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+' || c == '-') return 62;
    if (c == '/' || c == '_') return 63;
    return -1;
}

}

bool Parser::loadHarFile(const std::string &filename) {
    try {
        simdjson::dom::parser parser;
        simdjson::dom::element doc;
        if (const auto error = parser.load(filename).get(doc)) {
            HAR_LOG_ERROR("Error parsing HAR " << filename << ": " << simdjson::error_message(error));
            return false;
        }
        capture = parseCapture(doc);
    } catch (const MalformedCapture &e) {
        HAR_LOG_ERROR("Error parsing HAR " << filename << ": " << e.what());
        return false;
    }
    HAR_LOG_INFO("Loaded " << capture.entries.size() << " HAR entries from " << filename);
    return true;
}

bool Parser::loadHarString(const std::string &json) {
    try {
        capture = parseCapture(json);
    } catch (const MalformedCapture &e) {
        HAR_LOG_ERROR("Error parsing HAR: " << e.what());
        return false;
    }
    return true;
}

Capture Parser::parseCapture(const std::string &json) {
    simdjson::dom::parser parser;
    simdjson::dom::element doc;
    if (const auto error = parser.parse(json).get(doc)) {
        throw MalformedCapture(std::string("invalid JSON: ") + simdjson::error_message(error));
    }
    return parseCapture(doc);
}

Capture Parser::parseCapture(const simdjson::dom::element &doc) {
    simdjson::dom::element log;
    if (doc["log"].get(log) != simdjson::SUCCESS) {
        throw MalformedCapture("HAR has no 'log' object");
    }

    Capture result;
    result.creator_name = optionalString(log["creator"]["name"]);
    result.creator_version = optionalString(log["creator"]["version"]);

    simdjson::dom::array entriesArray;
    if (log["entries"].get(entriesArray) != simdjson::SUCCESS) {
        throw MalformedCapture("No entries found in HAR");
    }

    uint64_t id = 0;
    for (simdjson::dom::element elem : entriesArray) {
        result.entries.push_back(parseEntry(elem, id++));
    }
    return result;
}

Entry Parser::parseEntry(const simdjson::dom::element &elem, const uint64_t id) {
    const std::string where = "entries[" + std::to_string(id) + "]";
    Entry entry;
    entry.id = id;

    // Время начала запроса
    entry.startedDateTime = optionalString(elem["startedDateTime"]);

    simdjson::dom::element request;
    simdjson::dom::element response;
    if (elem["request"].get(request) != simdjson::SUCCESS) {
        throw MalformedCapture(where + " has no request");
    }
    if (elem["response"].get(response) != simdjson::SUCCESS) {
        throw MalformedCapture(where + " has no response");
    }

    // URL и метод
    entry.request.method = requireString(request["method"], where + ".request.method");
    entry.request.url = requireString(request["url"], where + ".request.url");
    entry.request.headers = parseHeaders(request, where + ".request");

    // Request body
    entry.request.body = optionalString(request["postData"]["text"]);

    // HTTP статус
    int64_t status = 0;
    if (const auto error = response["status"].get(status)) {
        throw MalformedCapture(where + ".response.status: " + simdjson::error_message(error));
    }
    entry.response.status = static_cast<int>(status);
    entry.response.status_text = optionalString(response["statusText"]);
    entry.response.headers = parseHeaders(response, where + ".response");

    // Response body
    entry.response.body = optionalString(response["content"]["text"]);
    if (optionalString(response["content"]["encoding"]) == "base64") {
        entry.response.body = decodeBase64(entry.response.body);
    }

    // Пустой redirectURL = редиректа нет
    entry.redirect_target = optionalString(response["redirectURL"]);
    return entry;
}

Headers Parser::parseHeaders(const simdjson::dom::element &elem, const std::string &where) {
    Headers headers;
    const auto field = elem["headers"];
    if (field.error() == simdjson::NO_SUCH_FIELD) {
        return headers;
    }

    simdjson::dom::array headersArray;
    if (const auto error = field.get(headersArray)) {
        throw MalformedCapture(where + ".headers: " + simdjson::error_message(error));
    }
    for (simdjson::dom::element h : headersArray) {
        headers.push_back({requireString(h["name"], where + ".headers[].name"), optionalString(h["value"])});
    }
    return headers;
}

std::string decodeBase64(const std::string &text) {
    std::string out;
    out.reserve(text.size() * 3 / 4);
    uint32_t buffer = 0;
    int bits = 0;
    bool padding = false;
    for (const char c : text) {
        if (c == '\r' || c == '\n' || c == ' ') continue;
        if (c == '=') {
            padding = true;
            continue;
        }
        const int value = base64Value(c);
        if (value < 0 || padding) {
            throw MalformedCapture("invalid base64 content");
        }
        buffer = (buffer << 6) | static_cast<uint32_t>(value);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<char>((buffer >> bits) & 0xFF));
        }
    }
    // Хвост из одного символа (6 бит) не кодирует ни одного байта
    if (bits >= 6) {
        throw MalformedCapture("truncated base64 content");
    }
    return out;
}
