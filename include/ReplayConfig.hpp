//
// Created by Revhome on 12.10.2025.
//

#ifndef HAR_REPLAY_APP_REPLAY_CONFIG_HPP
#define HAR_REPLAY_APP_REPLAY_CONFIG_HPP

// ⚙️ Настройки адаптера
struct ReplayConfig {
    bool strict_matching = true;      // false: достаточно совпадения метода и URL
    bool delete_after_match = true;   // false: запись можно использовать повторно
};

#endif //HAR_REPLAY_APP_REPLAY_CONFIG_HPP
