/**
 * svtab/error.hpp - Exception types raised by tables, cursors and sources
 *
 * Part of libsvtab - SQLite virtual tables from tables, cursors and row iterators.
 *
 * Every error carries the SQLite result code it maps to when it reaches the
 * C callback boundary (see module.hpp).
 */

#pragma once

#include <sqlite3.h>
#include <stdexcept>
#include <string>

namespace svtab {

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& msg, int code = SQLITE_ERROR)
        : std::runtime_error(msg), code_(code) {}

    int code() const { return code_; }

private:
    int code_;
};

// Unknown table name, missing declaration
class LookupError : public Error {
public:
    explicit LookupError(const std::string& msg) : Error(msg) {}
};

// Malformed CREATE VIRTUAL TABLE arguments or table shape
class ArgumentError : public Error {
public:
    explicit ArgumentError(const std::string& msg) : Error(msg) {}
};

// Value accessed as the wrong storage class
class TypeError : public Error {
public:
    explicit TypeError(const std::string& msg) : Error(msg) {}
};

// The row producer failed while materializing a row
class DataSourceError : public Error {
public:
    explicit DataSourceError(const std::string& msg) : Error(msg) {}
};

// Programmer error: cursor used out of sequence, column out of range, ...
class ContractError : public Error {
public:
    explicit ContractError(const std::string& msg) : Error(msg, SQLITE_MISUSE) {}
};

} // namespace svtab
