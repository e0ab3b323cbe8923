#pragma once
#include <stdexcept>
#include <string>

// Отчёт не является корректным JSON или в нём нет обязательных полей.
// Состояние мира при этом не меняется.
class ParseError : public std::runtime_error {
public:
    explicit ParseError(const std::string& what) : std::runtime_error(what) {}
};

// Файл сохранённого мира не читается, повреждён или не записывается.
class PersistenceError : public std::runtime_error {
public:
    explicit PersistenceError(const std::string& what) : std::runtime_error(what) {}
};
