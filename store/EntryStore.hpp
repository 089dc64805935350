//
// Created by Revhome on 14.10.2025.
//

#ifndef HAR_REPLAY_APP_ENTRY_STORE_HPP
#define HAR_REPLAY_APP_ENTRY_STORE_HPP

#include <vector>
#include "../include/Entry.hpp"

// 🗃 Записи HAR в порядке захвата. Порядок = приоритет сопоставления.
// Не потокобезопасен: вызывающий сам сериализует доступ.
class EntryStore {
public:
    EntryStore() = default;

    explicit EntryStore(std::vector<Entry> entries) : entries(std::move(entries)) {}

    const std::vector<Entry> &getEntries() const { return entries; }

    // Бросает IndexOutOfRange
    const Entry &at(size_t index) const;

    // 🔹 Удаляет ровно одну запись, порядок остальных сохраняется
    void removeAt(size_t index);

    size_t count() const { return entries.size(); }

    bool empty() const { return entries.empty(); }

private:
    std::vector<Entry> entries;
};

#endif //HAR_REPLAY_APP_ENTRY_STORE_HPP
