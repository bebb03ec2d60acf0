#pragma once
#include "SQLiteCpp/SQLiteCpp.h"
#include "sqlite_fwd.hpp"
#include "type_conv.hpp"
#include <cassert>
#include <stdexcept>

namespace sqlite {

inline Statement& Row::statement() const
{
    return st.get();
}
inline Column Row::operator[](int index) const
{
    value_assert();
    return statement().getColumn(index);
}

template <typename T>
inline T Row::get(int index) const
{
    Column c { operator[](index) };
    return static_cast<T>(ColumnConverter(c));
}

inline void Row::value_assert() const
{
    if (!hasValue) {
        throw std::runtime_error(
            "Database error: trying to access empty result.");
    }
}
inline Row::Row(Statement& st)
    : st(st)
{
    hasValue = statement().executeStep();
}

inline Column Statement::getColumn(const int aIndex)
{
    return { SQLite::Statement::getColumn(aIndex) };
}

template <typename T>
inline void Statement::bind(const int index, const T& t)
{
    struct Binder {
        using Stmt = SQLite::Statement;
        Binder(Stmt& stmt)
            : stmt(stmt)
        {
        }
        void bind_param(int i, int64_t a)
        {
            stmt.bind(i, a);
        }
        void bind_param(const int i, std::span<const uint8_t> s)
        {
            stmt.bind(i, s.data(), static_cast<int>(s.size()));
        }
        void bind_param(const int i, const std::string& s)
        {
            stmt.bind(i, s); // text
        }
        auto bind(int i, const auto& a)
        {
            bind_param(i, bind_convert::convert(a));
        }
        Stmt& stmt;
    };
    Binder(*this).bind(index, t);
}

template <size_t i>
void Statement::recursive_bind()
{
}
template <size_t i, typename T, typename... Types>
void Statement::recursive_bind(T&& t, Types&&... types)
{
    bind(i, std::forward<T>(t));
    recursive_bind<i + 1>(std::forward<Types>(types)...);
}
template <typename... Types>
inline uint32_t Statement::run(Types&&... types)
{
    bind_multiple(std::forward<Types>(types)...);
    int nchanged;
    try {
        nchanged = exec();
    } catch (const SQLite::Exception&) {
        tryReset(); // keep the statement reusable after constraint violations
        throw;
    }
    reset();
    assert(nchanged >= 0);
    return nchanged;
}

template <typename... Types, typename Lambda>
void Statement::for_each(Lambda lambda, Types&&... types)
{
    bind_multiple(std::forward<Types>(types)...);
    while (true) {
        auto r { next_row() };
        if (!r.has_value())
            break;
        lambda(r);
    }
    reset();
}
}
