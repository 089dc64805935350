//
// Created by Revhome on 16.10.2025.
//

#ifndef HAR_REPLAY_APP_HAR_ADAPTER_HPP
#define HAR_REPLAY_APP_HAR_ADAPTER_HPP

#include <mutex>
#include <string>
#include "../include/Entry.hpp"
#include "../include/ReplayConfig.hpp"
#include "../resolver/ResponseResolver.hpp"
#include "../store/EntryStore.hpp"

// 🎬 Отвечает на исходящие запросы записанными ответами из HAR вместо сети.
// Один экземпляр владеет своим хранилищем; send() можно вызывать из разных потоков.
class HarAdapter {
public:
    explicit HarAdapter(Capture capture, ReplayConfig config = {});

    // 🔹 Первая подходящая запись в порядке захвата. Бросает NoMatchFound
    ResponseSnapshot send(const RequestSnapshot &request);

    bool strictMatching() const;
    void setStrictMatching(bool value);

    bool deleteAfterMatch() const;
    void setDeleteAfterMatch(bool value);

    void setRedirectHook(RedirectHook hook);

    const std::string &creator() const { return creatorName; }
    const std::string &creatorVersion() const { return creatorVer; }

    // Сколько записей ещё не использовано
    size_t remaining() const;

    // "Firefox 120.0, 12 Requests"
    std::string describe() const;

private:
    std::string describeLocked() const;

    mutable std::mutex mutex;  // Сканирование и удаление записи идут под одной блокировкой
    const std::string creatorName;
    const std::string creatorVer;
    EntryStore store;
    ReplayConfig config;
    RedirectHook redirectHook;
};

#endif //HAR_REPLAY_APP_HAR_ADAPTER_HPP
