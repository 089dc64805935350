//
// Created by Revhome on 16.10.2025.
//

#include "HarAdapter.hpp"
#include "../include/Errors.hpp"
#include "../logger/Logger.hpp"
#include "../matcher/RequestMatcher.hpp"

HarAdapter::HarAdapter(Capture capture, const ReplayConfig config)
    : creatorName(std::move(capture.creator_name)),
      creatorVer(std::move(capture.creator_version)),
      store(std::move(capture.entries)),
      config(config) {
    HAR_LOG_INFO("Using HAR file from " << describe());
}

ResponseSnapshot HarAdapter::send(const RequestSnapshot &request) {
    const std::string indent(request.method.size(), ' ');
    Entry matched;
    RedirectHook hook;
    {
        std::lock_guard<std::mutex> lock(mutex);

        // Сначала ищем индекс, удаляем отдельным шагом после выхода из цикла
        bool found = false;
        size_t index = 0;
        const auto &entries = store.getEntries();
        for (; index < entries.size(); ++index) {
            if (matchRequests(request, entries[index].request, config.strict_matching).matched) {
                found = true;
                break;
            }
        }

        if (!found) {
            HAR_LOG_WARNING("No matching entry in HAR found for " << request.method << " " << request.url);
            throw NoMatchFound("No matching entry in HAR found for " + request.method + " " + request.url);
        }

        HAR_LOG_DEBUG(indent << "Request matched");
        matched = store.at(index);
        if (config.delete_after_match) {
            store.removeAt(index);
            HAR_LOG_DEBUG(indent << "Deleted matched entry from list");
        }
        hook = redirectHook;
    }

    return resolveResponse(request, matched, hook);
}

bool HarAdapter::strictMatching() const {
    std::lock_guard<std::mutex> lock(mutex);
    return config.strict_matching;
}

void HarAdapter::setStrictMatching(const bool value) {
    std::lock_guard<std::mutex> lock(mutex);
    config.strict_matching = value;
}

bool HarAdapter::deleteAfterMatch() const {
    std::lock_guard<std::mutex> lock(mutex);
    return config.delete_after_match;
}

void HarAdapter::setDeleteAfterMatch(const bool value) {
    std::lock_guard<std::mutex> lock(mutex);
    config.delete_after_match = value;
}

void HarAdapter::setRedirectHook(RedirectHook hook) {
    std::lock_guard<std::mutex> lock(mutex);
    redirectHook = std::move(hook);
}

size_t HarAdapter::remaining() const {
    std::lock_guard<std::mutex> lock(mutex);
    return store.count();
}

std::string HarAdapter::describe() const {
    std::lock_guard<std::mutex> lock(mutex);
    return describeLocked();
}

std::string HarAdapter::describeLocked() const {
    std::string out = creatorName;
    if (!creatorVer.empty()) {
        out += " " + creatorVer;
    }
    return out + ", " + std::to_string(store.count()) + " Requests";
}
