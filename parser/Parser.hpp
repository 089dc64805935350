//
// Created by Revhome on 28.09.2025.
//

#ifndef HAR_REPLAY_APP_PARSER_H
#define HAR_REPLAY_APP_PARSER_H

#include <string>
#include <vector>
#include <simdjson.h>
#include "../include/Entry.hpp"

class Parser {
public:
    Parser() = default;

    // 🔹 Загружает HAR-файл в память. При ошибке пишет в лог и возвращает false
    bool loadHarFile(const std::string &filename);

    // 🔹 То же самое для HAR, уже прочитанного в строку
    bool loadHarString(const std::string &json);

    // 🔹 Результат последней успешной загрузки
    const Capture &getCapture() const { return capture; }

    const std::vector<Entry> &getEntries() const { return capture.entries; }

    // 🔹 Разбор HAR из строки. Бросает MalformedCapture
    static Capture parseCapture(const std::string &json);

    static Capture parseCapture(const simdjson::dom::element &doc);

private:
    Capture capture;

    // 🔹 Разбор одного Entry
    static Entry parseEntry(const simdjson::dom::element &elem, uint64_t id);

    // 🔹 Массив [{name, value}, ...] с сохранением порядка
    static Headers parseHeaders(const simdjson::dom::element &elem, const std::string &where);
};

// Декодирование content.text при encoding == "base64". Бросает MalformedCapture
std::string decodeBase64(const std::string &text);

#endif //HAR_REPLAY_APP_PARSER_H
