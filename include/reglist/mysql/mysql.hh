#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <errmsg.h>
#include <exception>
#include <memory>
#include <mysql.h>
#include <optional>
#include <reglib/concat_tostr.hh>
#include <reglib/macros/throw.hh>
#include <reglist/sql/sql.hh>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>

namespace reglist::mysql {

class Transaction;
class Statement;

class Connection {
    MYSQL* conn;
    size_t referencing_objects_num = 0;

public:
    explicit Connection(
        const char* host, const char* user, const char* password, const char* database
    );

    // Reads variables host, user, password and db from the config file
    static Connection from_credential_file(const char* credential_file_path);

    ~Connection();

    Connection(const Connection&) = delete;
    Connection(Connection&&) = delete;
    Connection& operator=(const Connection&) = delete;
    Connection& operator=(Connection&&) = delete;

    // Every query run inside the transaction sees the same snapshot of the database
    Transaction start_repeatable_read_transaction();

    void update(std::string_view sql);

    template <class SqlExpr, class = decltype(sql::SqlWithParams{std::declval<SqlExpr&&>()})>
    Statement execute(SqlExpr&& sql_expr);
};

class Transaction {
    friend class Connection;

    MYSQL* conn;
    size_t* connection_referencing_objects_num;
    int uncaught_exceptions = std::uncaught_exceptions();

    explicit Transaction(MYSQL* conn, size_t* connection_referencing_objects_num) noexcept;

public:
    // Rolls back the transaction unless it was committed
    ~Transaction() noexcept(false);

    Transaction(const Transaction&) = delete;
    Transaction(Transaction&&) = delete;
    Transaction& operator=(const Transaction&) = delete;
    Transaction& operator=(Transaction&&) = delete;

    void commit();
};

namespace detail {

enum class ColumnKind {
    INTEGER,
    STRING,
    OPTIONAL_STRING,
};

} // namespace detail

// Cannot outlive Connection and has to be used single-threadly with the Connection
class Statement {
    friend class Connection;

    MYSQL* conn;
    size_t* connection_referencing_objects_num;
    MYSQL_STMT* stmt;
    size_t field_count = 0;
    int uncaught_exceptions = std::uncaught_exceptions();

    explicit Statement(
        MYSQL* conn, size_t* connection_referencing_objects_num, MYSQL_STMT* stmt
    ) noexcept;

    template <class... Params>
    void bind_and_execute(const Params&... params);

    struct Column {
        detail::ColumnKind kind;
        // String columns are fetched into buff, integer columns directly into the bound variable
        std::string buff;
        unsigned long length = 0; // NOLINT(google-runtime-int)
        void* dest = nullptr;
        void (*assign)(void* dest, std::string_view value) = nullptr;
        void (*assign_null)(void* dest) = nullptr;
    };

    std::unique_ptr<Column[]> columns;
    std::unique_ptr<MYSQL_BIND[]> mysql_binds;
    bool previous_fetch_changed_binds = false;

public:
    ~Statement() noexcept(false);

    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) = delete;

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    // Binds result columns to @p refs, they are filled by every successful next(). Supported
    // types: integers, std::string (and types deriving from it) and std::optional of the latter
    template <class... Refs>
    void res_bind(Refs&... refs);

    // Fetches the next row, returns false if there are no more rows
    bool next();
};

/***************************************** IMPLEMENTATION *****************************************/

namespace detail {

template <class>
constexpr inline bool always_false = false;

template <class>
constexpr inline bool is_optional = false;
template <class T>
constexpr inline bool is_optional<std::optional<T>> = true;

template <class T>
constexpr inline bool is_integer = std::is_integral_v<T> && !std::is_same_v<T, bool>;

template <class T>
constexpr enum_field_types buffer_type_of() {
    static_assert(is_integer<T>, "buffer_type_of works only with integer types");
    if constexpr (sizeof(T) == 1) {
        return MYSQL_TYPE_TINY;
    } else if constexpr (sizeof(T) == 2) {
        return MYSQL_TYPE_SHORT;
    } else if constexpr (sizeof(T) == 4) {
        return MYSQL_TYPE_LONG;
    } else {
        static_assert(sizeof(T) == 8, "Unsupported integer size");
        return MYSQL_TYPE_LONGLONG;
    }
}

template <class Ref>
constexpr ColumnKind column_kind_of() {
    if constexpr (is_integer<Ref>) {
        return ColumnKind::INTEGER;
    } else if constexpr (std::is_convertible_v<Ref&, std::string&>) {
        return ColumnKind::STRING;
    } else if constexpr (is_optional<Ref>) {
        static_assert(
            std::is_convertible_v<typename Ref::value_type&, std::string&>,
            "Only optional string columns are supported"
        );
        return ColumnKind::OPTIONAL_STRING;
    } else {
        static_assert(always_false<Ref>, "Unsupported type to bind");
    }
}

// Initial capacity of a buffer receiving a string column, longer values are refetched
constexpr inline size_t string_bind_initial_capacity = 64;

} // namespace detail

template <class SqlExpr, class>
Statement Connection::execute(SqlExpr&& sql_expr) {
    auto sql = sql::SqlWithParams{std::forward<SqlExpr>(sql_expr)}; // may throw
    auto sql_str = std::move(sql).get_sql();
    bool retrying = false;
    for (;;) {
        MYSQL_STMT* stmt = mysql_stmt_init(conn);
        if (!stmt) {
            THROW(mysql_error(conn));
        }
        if (mysql_stmt_prepare(stmt, sql_str.data(), sql_str.length())) {
            bool safe_to_reconnect = referencing_objects_num == 0;
            if (!retrying && mysql_errno(conn) == CR_SERVER_GONE_ERROR && safe_to_reconnect) {
                (void)mysql_stmt_close(stmt);
                // mysql_real_connect() may be called only once on a connection
                auto new_connection = Connection(conn->host, conn->user, conn->passwd, conn->db);
                std::swap(conn, new_connection.conn);
                retrying = true;
                continue;
            }
            auto error = concat_tostr(mysql_error(conn), " (", mysql_errno(conn), ')');
            (void)mysql_stmt_close(stmt);
            THROW("Preparing statement failed: ", error);
        }

        auto res = Statement{conn, &referencing_objects_num, stmt};
        std::apply(
            [&res](const auto&... params) { res.bind_and_execute(params...); },
            std::move(sql).get_params()
        );
        return res;
    }
}

template <class... Params>
void Statement::bind_and_execute(const Params&... params) {
    if (sizeof...(params) != mysql_stmt_param_count(stmt)) {
        THROW(
            "Invalid number of parameters: ",
            sizeof...(params),
            " expected ",
            mysql_stmt_param_count(stmt)
        );
    }
    field_count = mysql_stmt_field_count(stmt);

    std::array<MYSQL_BIND, sizeof...(Params)> binds{};
    [[maybe_unused]] size_t idx = 0;
    (
        [&](const auto& param) {
            using Param = std::remove_cvref_t<decltype(param)>;
            static_assert(detail::is_integer<Param>, "Only integer parameters are supported");
            auto& bind = binds[idx++];
            bind.buffer_type = detail::buffer_type_of<Param>();
            // The bound value has to live up to mysql_stmt_execute()
            bind.buffer = const_cast<Param*>(&param);
            bind.is_unsigned = std::is_unsigned_v<Param>;
        }(params),
        ...
    );
    if (mysql_stmt_bind_param(stmt, binds.data())) {
        THROW(mysql_stmt_error(stmt));
    }
    if (mysql_stmt_execute(stmt)) {
        THROW(mysql_stmt_error(stmt));
    }
}

template <class... Refs>
void Statement::res_bind(Refs&... refs) {
    if (sizeof...(refs) != field_count) {
        THROW("Invalid number of binds: ", sizeof...(refs), " expected ", field_count);
    }

    columns = std::make_unique<Column[]>(sizeof...(refs));
    mysql_binds = std::make_unique<MYSQL_BIND[]>(sizeof...(refs));

    [[maybe_unused]] size_t idx = 0;
    (
        [&](auto& ref) {
            using Ref = std::remove_reference_t<decltype(ref)>;
            auto& column = columns[idx];
            auto& mysql_bind = mysql_binds[idx];
            ++idx;
            // MYSQL_BIND::error_value and MYSQL_BIND::is_null_value are filled only if
            // MYSQL_BIND::error and MYSQL_BIND::is_null are set
            mysql_bind.error = &mysql_bind.error_value;
            mysql_bind.is_null = &mysql_bind.is_null_value;

            column.kind = detail::column_kind_of<Ref>();
            column.dest = &ref;
            if constexpr (detail::column_kind_of<Ref>() == detail::ColumnKind::INTEGER) {
                mysql_bind.buffer_type = detail::buffer_type_of<Ref>();
                mysql_bind.buffer = &ref;
                mysql_bind.is_unsigned = std::is_unsigned_v<Ref>;
                return;
            } else if constexpr (detail::column_kind_of<Ref>() == detail::ColumnKind::STRING) {
                column.assign = [](void* dest, std::string_view value) {
                    static_cast<std::string&>(*static_cast<Ref*>(dest)).assign(value);
                };
            } else {
                using T = typename Ref::value_type;
                column.assign = [](void* dest, std::string_view value) {
                    *static_cast<Ref*>(dest) = T{std::string{value}};
                };
                column.assign_null = [](void* dest) { static_cast<Ref*>(dest)->reset(); };
            }
            column.buff.resize(detail::string_bind_initial_capacity);
            mysql_bind.buffer_type = MYSQL_TYPE_BLOB;
            mysql_bind.buffer = column.buff.data();
            mysql_bind.buffer_length = column.buff.size();
            mysql_bind.length = &column.length;
        }(refs),
        ...
    );
    if (mysql_stmt_bind_result(stmt, mysql_binds.get())) {
        THROW(mysql_stmt_error(stmt));
    }
    // Buffers the whole result so that the next statement can be executed before this one is
    // exhausted
    if (mysql_stmt_store_result(stmt)) {
        THROW(mysql_stmt_error(stmt));
    }
    previous_fetch_changed_binds = false;
}

} // namespace reglist::mysql
