#include <cassert>
#include <cstddef>
#include <errmsg.h>
#include <exception>
#include <fcntl.h>
#include <mutex>
#include <mysql.h>
#include <reglib/config_file.hh>
#include <reglib/errmsg.hh>
#include <reglib/macros/throw.hh>
#include <reglist/mysql/mysql.hh>
#include <string>
#include <string_view>
#include <utility>

namespace {

MYSQL* new_mysql() {
    // Some documentations say that invoking mysql_init() is unsafe in a multi-thread environment
    static std::mutex mysql_init_mutex;
    MYSQL* conn = [] {
        auto guard = std::lock_guard{mysql_init_mutex};
        return mysql_init(nullptr);
    }();
    if (!conn) {
        THROW("mysql_init() failed");
    }
    return conn;
}

} // namespace

namespace reglist::mysql {

Connection::Connection(
    const char* host, const char* user, const char* password, const char* database
)
: conn{new_mysql()} {
    try {
        my_bool true_val = true;
        if (mysql_optionsv(conn, MYSQL_REPORT_DATA_TRUNCATION, &true_val)) {
            THROW(mysql_error(conn));
        }
        if (mysql_optionsv(conn, MYSQL_SET_CHARSET_NAME, "utf8mb4")) {
            THROW(mysql_error(conn));
        }
        if (!mysql_real_connect(conn, host, user, password, database, 0, nullptr, 0)) {
            THROW(mysql_error(conn));
        }
        // Set CLOEXEC flag on the mysql connection socket
        int mysql_socket = mysql_get_socket(conn);
        int flags = fcntl(mysql_socket, F_GETFD);
        if (flags == -1) {
            THROW("fnctl()", errmsg());
        }
        if (fcntl(mysql_socket, F_SETFD, flags | FD_CLOEXEC)) {
            THROW("fnctl()", errmsg());
        }
    } catch (...) {
        mysql_close(conn);
        throw;
    }
}

Connection Connection::from_credential_file(const char* credential_file_path) {
    ConfigFile cf;
    cf.add_vars("host", "user", "password", "db");
    cf.load_config_from_file(credential_file_path);
    for (const auto& [name, var] : cf.get_vars()) {
        if (!var.is_set()) {
            THROW(credential_file_path, ": variable `", name, "` is not set");
        }
        if (var.is_array()) {
            THROW(credential_file_path, ": variable `", name, "` cannot be specified as an array");
        }
    }
    return Connection(
        cf["host"].as_string().c_str(),
        cf["user"].as_string().c_str(),
        cf["password"].as_string().c_str(),
        cf["db"].as_string().c_str()
    );
}

Connection::~Connection() {
    assert(referencing_objects_num == 0);
    mysql_close(conn);
}

Transaction Connection::start_repeatable_read_transaction() {
    update("SET TRANSACTION ISOLATION LEVEL REPEATABLE READ");
    update("START TRANSACTION READ ONLY");
    return Transaction{conn, &referencing_objects_num};
}

void Connection::update(std::string_view sql) {
    bool retrying = false;
    for (;;) {
        if (mysql_real_query(conn, sql.data(), sql.size())) {
            bool safe_to_reconnect = referencing_objects_num == 0;
            if (!retrying && mysql_errno(conn) == CR_SERVER_GONE_ERROR && safe_to_reconnect) {
                // mysql_real_connect() may be called only once on a connection -- a new one must be
                // created.
                auto new_connection = Connection(conn->host, conn->user, conn->passwd, conn->db);
                std::swap(conn, new_connection.conn);
                retrying = true;
                continue;
            }
            THROW(mysql_error(conn));
        }
        break;
    }
}

Transaction::Transaction(MYSQL* conn, size_t* connection_referencing_objects_num) noexcept
: conn{conn}
, connection_referencing_objects_num{connection_referencing_objects_num} {
    ++*connection_referencing_objects_num;
}

Transaction::~Transaction() noexcept(false) {
    if (conn) {
        --*connection_referencing_objects_num;
        if (mysql_rollback(conn) && uncaught_exceptions == std::uncaught_exceptions()) {
            THROW(mysql_error(conn));
        }
    }
}

void Transaction::commit() {
    if (mysql_commit(conn)) {
        THROW(mysql_error(conn));
    }
    --*connection_referencing_objects_num;
    conn = nullptr;
}

Statement::Statement(
    MYSQL* conn, size_t* connection_referencing_objects_num, MYSQL_STMT* stmt
) noexcept
: conn{conn}
, connection_referencing_objects_num{connection_referencing_objects_num}
, stmt{stmt} {
    ++*connection_referencing_objects_num;
}

Statement::~Statement() noexcept(false) {
    --*connection_referencing_objects_num;
    if (stmt && mysql_stmt_close(stmt) && uncaught_exceptions == std::uncaught_exceptions()) {
        THROW(mysql_error(conn));
    }
}

Statement::Statement(Statement&& other) noexcept
: conn{other.conn}
, connection_referencing_objects_num{other.connection_referencing_objects_num}
, stmt{std::exchange(other.stmt, nullptr)}
, field_count{other.field_count}
, columns{std::move(other.columns)}
, mysql_binds{std::move(other.mysql_binds)}
, previous_fetch_changed_binds{other.previous_fetch_changed_binds} {
    ++*connection_referencing_objects_num;
}

bool Statement::next() {
    // A refetch of a truncated string column changed the bound buffers
    if (previous_fetch_changed_binds && mysql_stmt_bind_result(stmt, mysql_binds.get())) {
        THROW(mysql_stmt_error(stmt));
    }
    previous_fetch_changed_binds = false;

    auto rc = mysql_stmt_fetch(stmt);
    if (rc == MYSQL_NO_DATA) {
        return false;
    }
    if (rc != 0 && rc != MYSQL_DATA_TRUNCATED) {
        THROW(mysql_stmt_error(stmt));
    }
    if (!columns) {
        return true; // res_bind() was not called
    }

    for (size_t idx = 0; idx < field_count; ++idx) {
        auto& column = columns[idx];
        auto& mysql_bind = mysql_binds[idx];
        bool truncated = false;
        if (mysql_bind.error_value) {
            if (rc != MYSQL_DATA_TRUNCATED) {
                THROW("Unexpected error at column: ", idx);
            }
            truncated = true;
        }

        if (mysql_bind.is_null_value) {
            if (column.kind != detail::ColumnKind::OPTIONAL_STRING) {
                THROW("Unexpected NULL at column: ", idx, " (bound variable is not optional)");
            }
            column.assign_null(column.dest);
            continue;
        }
        if (column.kind == detail::ColumnKind::INTEGER) {
            if (truncated) {
                THROW("Truncated data at column: ", idx);
            }
            continue;
        }

        if (truncated) {
            // Needs to happen before a potential exception
            previous_fetch_changed_binds = true;
            column.buff.resize(column.length);
            mysql_bind.buffer = column.buff.data();
            mysql_bind.buffer_length = column.buff.size();
            if (mysql_stmt_fetch_column(stmt, &mysql_bind, idx, 0)) {
                THROW(mysql_stmt_error(stmt));
            }
        }
        column.assign(column.dest, std::string_view{column.buff.data(), column.length});
    }
    return true;
}

} // namespace reglist::mysql
