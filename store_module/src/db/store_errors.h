#pragma once

#include <stdexcept>
#include <string>

// Ошибка ввода-вывода при записи data.json
class StoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Версия документа на диске ушла вперёд: сохранение по устаревшей копии отклонено
class StaleWriteError : public StoreError {
public:
    using StoreError::StoreError;
};

// Повторная попытка после StaleWriteError тоже устарела
class ConflictError : public StoreError {
public:
    using StoreError::StoreError;
};

// Некорректные входные данные; документ не изменялся
class ValidationError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Прерывает транзакцию DocumentStore::update, если сущность не найдена
class NotFoundError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Операция запрещена для этого пользователя (например, отзыв без оплаченного заказа)
class ForbiddenError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};
