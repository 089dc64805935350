//
// Created by Revhome on 28.09.2025.
//

#ifndef HAR_REPLAY_APP_ENTRY_H
#define HAR_REPLAY_APP_ENTRY_H

#include <string>
#include <vector>
#include <cstdint>  // для uint64_t
#include "Header.hpp"

// 📤 Снимок исходящего запроса (живого или записанного в HAR)
struct RequestSnapshot {
    std::string method;           // HTTP метод (GET, POST, PUT…)
    std::string url;              // Абсолютный URL запроса
    Headers headers;              // Заголовки в порядке отправки
    std::string body;             // Тело запроса, если есть (байты)
};

// 📥 Снимок ответа
struct ResponseSnapshot {
    int status = 0;               // HTTP статус ответа (200, 404…)
    std::string status_text;      // "OK", "Found"…
    Headers headers;
    std::string body;             // Тело ответа (JSON, текст, HTML, бинарные данные)
    std::string redirect_url;     // Итоговый адрес редиректа, пусто если редиректа нет
};

// 📦 Структура, представляющая один HTTP-запрос/ответ из HAR
struct Entry {
    uint64_t id = 0;              // Позиция записи в исходном HAR
    std::string startedDateTime;  // Время начала запроса
    RequestSnapshot request;
    ResponseSnapshot response;
    std::string redirect_target;  // response.redirectURL как есть, может быть относительным
};

// 🗂 Весь HAR: метаданные создателя + записи в порядке захвата
struct Capture {
    std::string creator_name;
    std::string creator_version;
    std::vector<Entry> entries;
};

#endif //HAR_REPLAY_APP_ENTRY_H
