//
// Created by Revhome on 14.10.2025.
//

#include "EntryStore.hpp"
#include "../include/Errors.hpp"
#include <cstddef>
#include <string>

const Entry &EntryStore::at(const size_t index) const {
    if (index >= entries.size()) {
        throw IndexOutOfRange("entry index " + std::to_string(index) + " out of range (count " +
                              std::to_string(entries.size()) + ")");
    }
    return entries[index];
}

void EntryStore::removeAt(const size_t index) {
    if (index >= entries.size()) {
        throw IndexOutOfRange("cannot remove entry " + std::to_string(index) + ", store holds " +
                              std::to_string(entries.size()));
    }
    entries.erase(entries.begin() + static_cast<std::ptrdiff_t>(index));
}
