#pragma once

#include <algorithm>
#include <cstddef>
#include <reglib/throw_assert.hh>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>

namespace reglist::sql {

namespace detail {

inline size_t count_placeholders(std::string_view sql) noexcept {
    return static_cast<size_t>(std::count(sql.begin(), sql.end(), '?'));
}

} // namespace detail

template <class... Params>
class SqlWithParams {
    static_assert((std::is_reference_v<Params> && ... && true), "this is meant to hold references");
    std::string sql;
    std::tuple<Params...> params;

public:
    explicit SqlWithParams(std::string&& sql_, Params&&... params_)
    : sql{std::move(sql_)}
    , params{std::forward<Params>(params_)...} {
        throw_assert(detail::count_placeholders(sql) == sizeof...(Params));
    }

    explicit SqlWithParams(std::string&& sql_, std::tuple<Params...>&& params_)
    : sql{std::move(sql_)}
    , params{std::move(params_)} {
        throw_assert(detail::count_placeholders(sql) == sizeof...(Params));
    }

    ~SqlWithParams() = default;
    SqlWithParams(const SqlWithParams&) = delete;
    SqlWithParams(SqlWithParams&&) noexcept = default;
    SqlWithParams& operator=(const SqlWithParams&) = delete;
    SqlWithParams& operator=(SqlWithParams&&) = delete;

    [[nodiscard]] const std::string& get_sql() const& noexcept { return sql; }

    std::string&& get_sql() && noexcept { return std::move(sql); }

    std::tuple<Params...>&& get_params() && noexcept { return std::move(params); }
};

template <class... Params>
SqlWithParams(std::string&&, Params&&...) -> SqlWithParams<Params&&...>;

template <class... Params>
class Select;
template <class... Params>
class SelectFrom;
template <class... Params>
class SelectJoin;
template <class... Params>
class SelectJoinOn;
template <class... Params>
class SelectWhere;
template <class... Params>
class SelectGroupBy;
template <class... Params>
class SelectOrderBy;

#define REGLIST_SQL_SELECT_PART_COMMON(Class)                                                    \
    static_assert((std::is_reference_v<Params> && ... && true), "this is meant to hold references"); \
                                                                                                 \
    std::string sql;                                                                             \
    std::tuple<Params...> params;                                                                \
                                                                                                 \
    template <class...>                                                                          \
    friend class Select;                                                                         \
    template <class...>                                                                          \
    friend class SelectFrom;                                                                     \
    template <class...>                                                                          \
    friend class SelectJoin;                                                                     \
    template <class...>                                                                          \
    friend class SelectJoinOn;                                                                   \
    template <class...>                                                                          \
    friend class SelectWhere;                                                                    \
    template <class...>                                                                          \
    friend class SelectGroupBy;                                                                  \
    template <class...>                                                                          \
    friend class SelectOrderBy;                                                                  \
                                                                                                 \
    explicit Class(std::string&& sql_, std::tuple<Params...>&& params_) noexcept                 \
    : sql{std::move(sql_)}                                                                       \
    , params{std::move(params_)} {}                                                              \
                                                                                                 \
public:                                                                                          \
    ~Class() = default;                                                                          \
    Class(const Class&) = delete;                                                                \
    Class(Class&&) = delete;                                                                     \
    Class& operator=(const Class&) = delete;                                                     \
    Class& operator=(Class&&) = delete;

template <class... Params>
class Select {
    static_assert((std::is_reference_v<Params> && ... && true), "this is meant to hold references");

    std::string sql;
    std::tuple<Params...> params;

public:
    explicit Select(std::string&& sql_, Params&&... params_)
    : sql{"SELECT " + std::move(sql_)}
    , params{std::forward<Params>(params_)...} {
        throw_assert(detail::count_placeholders(sql) == sizeof...(Params));
    }

    ~Select() = default;
    Select(const Select&) = delete;
    Select(Select&&) = delete;
    Select& operator=(const Select&) = delete;
    Select& operator=(Select&&) = delete;

    SelectFrom<Params...> from(std::string_view sql_str) && {
        throw_assert(detail::count_placeholders(sql_str) == 0);
        sql += " FROM ";
        sql += sql_str;
        return SelectFrom<Params...>{std::move(sql), std::move(params)};
    }
};

template <class... Params>
Select(std::string&&, Params&&...) -> Select<Params&&...>;

// Methods shared by SelectFrom and SelectJoinOn
#define REGLIST_SQL_SELECT_FROM_METHODS                                                         \
    SelectJoin<Params...> inner_join(std::string_view sql_str) && {                             \
        return std::move(*this).join("INNER JOIN ", sql_str);                                   \
    }                                                                                           \
                                                                                                \
    SelectJoin<Params...> left_join(std::string_view sql_str) && {                              \
        return std::move(*this).join("LEFT JOIN ", sql_str);                                    \
    }                                                                                           \
                                                                                                \
    template <class... SelectParams>                                                            \
    SelectJoin<Params..., SelectParams...> inner_join(                                          \
        SelectGroupBy<SelectParams...>&& select, std::string_view table_name                    \
    ) && {                                                                                      \
        throw_assert(detail::count_placeholders(table_name) == 0);                              \
        sql += " INNER JOIN (";                                                                 \
        sql += std::move(select).sql;                                                           \
        sql += ") ";                                                                            \
        sql += table_name;                                                                      \
        return SelectJoin<Params..., SelectParams...>{                                          \
            std::move(sql), std::tuple_cat(std::move(params), std::move(select).params)         \
        };                                                                                      \
    }                                                                                           \
                                                                                                \
    template <class... WhereParams>                                                             \
    SelectWhere<Params..., WhereParams&&...> where(                                             \
        std::string_view sql_str, WhereParams&&... where_params                                 \
    ) && {                                                                                      \
        throw_assert(detail::count_placeholders(sql_str) == sizeof...(WhereParams));            \
        sql += " WHERE ";                                                                       \
        sql += sql_str;                                                                         \
        return SelectWhere<Params..., WhereParams&&...>{                                        \
            std::move(sql),                                                                     \
            std::tuple_cat(                                                                     \
                std::move(params),                                                              \
                std::tuple<WhereParams&&...>{std::forward<WhereParams>(where_params)...}        \
            )                                                                                   \
        };                                                                                      \
    }                                                                                           \
                                                                                                \
    SelectGroupBy<Params...> group_by(std::string_view sql_str) && {                            \
        return std::move(*this).template append_clause<SelectGroupBy>(" GROUP BY ", sql_str);   \
    }                                                                                           \
                                                                                                \
    SelectOrderBy<Params...> order_by(std::string_view sql_str) && {                            \
        return std::move(*this).template append_clause<SelectOrderBy>(" ORDER BY ", sql_str);   \
    }                                                                                           \
                                                                                                \
    /* NOLINTNEXTLINE(google-explicit-constructor) */                                           \
    operator SqlWithParams<Params...>() && noexcept {                                           \
        return SqlWithParams<Params...>{std::move(sql), std::move(params)};                     \
    }                                                                                           \
                                                                                                \
private:                                                                                        \
    SelectJoin<Params...> join(std::string_view join_str, std::string_view sql_str) && {        \
        throw_assert(detail::count_placeholders(sql_str) == 0);                                 \
        sql += ' ';                                                                             \
        sql += join_str;                                                                        \
        sql += sql_str;                                                                         \
        return SelectJoin<Params...>{std::move(sql), std::move(params)};                        \
    }                                                                                           \
                                                                                                \
    template <template <class...> class ResultClass>                                            \
    ResultClass<Params...> append_clause(std::string_view clause, std::string_view sql_str) && { \
        throw_assert(detail::count_placeholders(sql_str) == 0);                                 \
        sql += clause;                                                                          \
        sql += sql_str;                                                                         \
        return ResultClass<Params...>{std::move(sql), std::move(params)};                       \
    }

template <class... Params>
class SelectFrom {
    REGLIST_SQL_SELECT_PART_COMMON(SelectFrom)
    REGLIST_SQL_SELECT_FROM_METHODS
};

template <class... Params>
class SelectJoin {
    REGLIST_SQL_SELECT_PART_COMMON(SelectJoin)

    template <class... OnParams>
    SelectJoinOn<Params..., OnParams&&...>
    on(std::string_view sql_str, OnParams&&... on_params) && {
        throw_assert(detail::count_placeholders(sql_str) == sizeof...(OnParams));
        sql += " ON ";
        sql += sql_str;
        return SelectJoinOn<Params..., OnParams&&...>{
            std::move(sql),
            std::tuple_cat(
                std::move(params), std::tuple<OnParams&&...>{std::forward<OnParams>(on_params)...}
            )
        };
    }
};

template <class... Params>
class SelectJoinOn {
    REGLIST_SQL_SELECT_PART_COMMON(SelectJoinOn)
    REGLIST_SQL_SELECT_FROM_METHODS
};

template <class... Params>
class SelectWhere {
    REGLIST_SQL_SELECT_PART_COMMON(SelectWhere)

    SelectGroupBy<Params...> group_by(std::string_view sql_str) && {
        throw_assert(detail::count_placeholders(sql_str) == 0);
        sql += " GROUP BY ";
        sql += sql_str;
        return SelectGroupBy<Params...>{std::move(sql), std::move(params)};
    }

    SelectOrderBy<Params...> order_by(std::string_view sql_str) && {
        throw_assert(detail::count_placeholders(sql_str) == 0);
        sql += " ORDER BY ";
        sql += sql_str;
        return SelectOrderBy<Params...>{std::move(sql), std::move(params)};
    }

    // NOLINTNEXTLINE(google-explicit-constructor)
    operator SqlWithParams<Params...>() && noexcept {
        return SqlWithParams<Params...>{std::move(sql), std::move(params)};
    }
};

template <class... Params>
class SelectGroupBy {
    REGLIST_SQL_SELECT_PART_COMMON(SelectGroupBy)

    SelectOrderBy<Params...> order_by(std::string_view sql_str) && {
        throw_assert(detail::count_placeholders(sql_str) == 0);
        sql += " ORDER BY ";
        sql += sql_str;
        return SelectOrderBy<Params...>{std::move(sql), std::move(params)};
    }

    // NOLINTNEXTLINE(google-explicit-constructor)
    operator SqlWithParams<Params...>() && noexcept {
        return SqlWithParams<Params...>{std::move(sql), std::move(params)};
    }
};

template <class... Params>
class SelectOrderBy {
    REGLIST_SQL_SELECT_PART_COMMON(SelectOrderBy)

    // NOLINTNEXTLINE(google-explicit-constructor)
    operator SqlWithParams<Params...>() && noexcept {
        return SqlWithParams<Params...>{std::move(sql), std::move(params)};
    }
};

#undef REGLIST_SQL_SELECT_FROM_METHODS
#undef REGLIST_SQL_SELECT_PART_COMMON

template <class... Params>
SqlWithParams(SelectFrom<Params...>&&) -> SqlWithParams<Params...>;
template <class... Params>
SqlWithParams(SelectJoinOn<Params...>&&) -> SqlWithParams<Params...>;
template <class... Params>
SqlWithParams(SelectWhere<Params...>&&) -> SqlWithParams<Params...>;
template <class... Params>
SqlWithParams(SelectGroupBy<Params...>&&) -> SqlWithParams<Params...>;
template <class... Params>
SqlWithParams(SelectOrderBy<Params...>&&) -> SqlWithParams<Params...>;

} // namespace reglist::sql
