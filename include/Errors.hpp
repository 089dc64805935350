//
// Created by Revhome on 12.10.2025.
//

#ifndef HAR_REPLAY_APP_ERRORS_HPP
#define HAR_REPLAY_APP_ERRORS_HPP

#include <stdexcept>

// Ни одна запись HAR не подошла к запросу
class NoMatchFound : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// HAR не удалось разобрать
class MalformedCapture : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Обращение к несуществующей записи хранилища (ошибка программиста)
class IndexOutOfRange : public std::out_of_range {
public:
    using std::out_of_range::out_of_range;
};

#endif //HAR_REPLAY_APP_ERRORS_HPP
