//
// Created by Revhome on 15.10.2025.
//

#include "ResponseResolver.hpp"
#include "../logger/Logger.hpp"

std::pair<std::string, std::string> splitOrigin(const std::string &url) {
    const auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos || schemeEnd == 0) {
        return {};
    }
    const auto hostStart = schemeEnd + 3;
    auto hostEnd = url.find_first_of("/?#", hostStart);
    if (hostEnd == std::string::npos) hostEnd = url.size();

    std::string authority = url.substr(hostStart, hostEnd - hostStart);
    // userinfo в редирект не переносим
    if (const auto at = authority.rfind('@'); at != std::string::npos) {
        authority.erase(0, at + 1);
    }
    return {url.substr(0, schemeEnd), authority};
}

std::string resolveRedirect(const std::string &liveUrl, const std::string &target) {
    if (target.empty() || target.front() != '/') {
        return target;
    }
    const auto [scheme, authority] = splitOrigin(liveUrl);
    if (scheme.empty() || authority.empty()) {
        HAR_LOG_WARNING("Cannot take origin from '" << liveUrl << "', keeping redirect " << target);
        return target;
    }
    return scheme + "://" + authority + target;
}

ResponseSnapshot resolveResponse(const RequestSnapshot &live, const Entry &entry, const RedirectHook &hook) {
    ResponseSnapshot response = entry.response;
    response.redirect_url.clear();
    if (entry.redirect_target.empty()) {
        return response;
    }

    response.redirect_url = resolveRedirect(live.url, entry.redirect_target);
    HAR_LOG_DEBUG(std::string(live.method.size(), ' ') << "Handling redirection to " << response.redirect_url);
    if (hook) {
        hook(live, response);
    }
    return response;
}
