#pragma once
#include <stdexcept>
#include <string>

// Нарушение дисциплины вызова: не тот тип значения, неизвестный фильтр.
class KbTypeError : public std::invalid_argument {
public:
    explicit KbTypeError(const std::string& what) : std::invalid_argument(what) {}
};

// raw_read()/get_one() нашли больше одной записи по адресу.
class KbCardinalityError : public std::logic_error {
public:
    KbCardinalityError(const std::string& what, std::size_t found)
        : std::logic_error(what), found_(found) {}
    std::size_t found() const { return found_; }
private:
    std::size_t found_;
};

// update() не нашёл запись со старым uniq_id.
class KbDbError : public std::runtime_error {
public:
    explicit KbDbError(const std::string& what) : std::runtime_error(what) {}
};

// Содержимое blob не удалось разобрать.
class KbCodecError : public std::runtime_error {
public:
    explicit KbCodecError(const std::string& what) : std::runtime_error(what) {}
};
