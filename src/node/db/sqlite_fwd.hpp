#pragma once
#include "SQLiteCpp/Column.h"
#include "SQLiteCpp/Statement.h"
#include <cstdint>
#include <functional>

namespace sqlite {
struct Column : public SQLite::Column {
};

class Statement;
class Row {

private: // data
    std::reference_wrapper<Statement> st;
    bool hasValue;

public:
    friend class Statement;
    Column operator[](int index) const;
    template <typename T>
    T get(int index) const;
    bool has_value() const { return hasValue; }

private:
    void value_assert() const;
    Row(Statement& st);
    Statement& statement() const;
};

class Statement : public SQLite::Statement {
public:
    using SQLite::Statement::Statement;
    Column getColumn(const int aIndex);
    template <typename T>
    void bind(const int index, const T&);
    template <size_t i>
    void recursive_bind();
    template <size_t i, typename T, typename... Types>
    void recursive_bind(T&& t, Types&&... types);
    template <typename... Types>
    auto& bind_multiple(Types&&... types)
    {
        recursive_bind<1>(std::forward<Types>(types)...);
        return *this;
    }
    template <typename... Types>
    uint32_t run(Types&&... types);
    Row next_row() { return *this; }

    template <typename... Types, typename Lambda>
    void for_each(Lambda lambda, Types&&... types);
};

}
