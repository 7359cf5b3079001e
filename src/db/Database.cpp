#include "Database.hpp"

#include <sqlite3.h>

#include <utility>

namespace scramble::db
{
    namespace
    {
        constexpr const char *ACTIVE_CONFIG_KEY = "active_simulation_config";

        // Owns one sqlite3 handle for the duration of a call.
        class Connection
        {
        public:
            explicit Connection(const std::string &file_path)
            {
                open_rc = sqlite3_open(file_path.c_str(), &handle);
            }

            ~Connection()
            {
                sqlite3_close(handle);
            }

            Connection(const Connection &) = delete;
            Connection &operator=(const Connection &) = delete;

            bool ok() const { return open_rc == SQLITE_OK; }
            sqlite3 *get() const { return handle; }

            std::string lastError() const
            {
                const char *message = handle ? sqlite3_errmsg(handle) : nullptr;
                return message ? message : "failed to open database";
            }

        private:
            sqlite3 *handle = nullptr;
            int open_rc = SQLITE_ERROR;
        };

        class Statement
        {
        public:
            Statement(sqlite3 *handle, const char *sql)
            {
                prepare_rc = sqlite3_prepare_v2(handle, sql, -1, &stmt, nullptr);
            }

            ~Statement()
            {
                sqlite3_finalize(stmt);
            }

            Statement(const Statement &) = delete;
            Statement &operator=(const Statement &) = delete;

            bool ok() const { return prepare_rc == SQLITE_OK; }
            sqlite3_stmt *get() const { return stmt; }

            bool bindText(int index, const std::string &value)
            {
                return sqlite3_bind_text(stmt, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT) == SQLITE_OK;
            }

        private:
            sqlite3_stmt *stmt = nullptr;
            int prepare_rc = SQLITE_ERROR;
        };

        void setError(std::string *error, const std::string &message)
        {
            if (error)
            {
                *error = message;
            }
        }
    }

    Database::Database(std::string file_path)
        : file_path(std::move(file_path))
    {
    }

    bool Database::initialize(std::string *error) const
    {
        Connection connection(file_path);
        if (!connection.ok())
        {
            setError(error, connection.lastError());
            return false;
        }

        const char *create_sql =
            "CREATE TABLE IF NOT EXISTS app_config ("
            "key TEXT PRIMARY KEY,"
            "value TEXT NOT NULL"
            ");";

        char *errmsg = nullptr;
        const int exec_rc = sqlite3_exec(connection.get(), create_sql, nullptr, nullptr, &errmsg);
        if (exec_rc != SQLITE_OK)
        {
            setError(error, errmsg ? errmsg : "failed to initialize schema");
            sqlite3_free(errmsg);
            return false;
        }

        return true;
    }

    bool Database::saveValue(const std::string &key, const std::string &value, std::string *error) const
    {
        Connection connection(file_path);
        if (!connection.ok())
        {
            setError(error, connection.lastError());
            return false;
        }

        const char *upsert_sql =
            "INSERT INTO app_config(key, value) VALUES(?, ?) "
            "ON CONFLICT(key) DO UPDATE SET value = excluded.value;";

        Statement stmt(connection.get(), upsert_sql);
        if (!stmt.ok() || !stmt.bindText(1, key) || !stmt.bindText(2, value))
        {
            setError(error, connection.lastError());
            return false;
        }

        if (sqlite3_step(stmt.get()) != SQLITE_DONE)
        {
            setError(error, connection.lastError());
            return false;
        }

        return true;
    }

    std::optional<std::string> Database::loadValue(const std::string &key, std::string *error) const
    {
        Connection connection(file_path);
        if (!connection.ok())
        {
            setError(error, connection.lastError());
            return std::nullopt;
        }

        Statement stmt(connection.get(), "SELECT value FROM app_config WHERE key = ? LIMIT 1;");
        if (!stmt.ok() || !stmt.bindText(1, key))
        {
            setError(error, connection.lastError());
            return std::nullopt;
        }

        const int step_rc = sqlite3_step(stmt.get());
        if (step_rc == SQLITE_ROW)
        {
            const unsigned char *text = sqlite3_column_text(stmt.get(), 0);
            return std::string(text ? reinterpret_cast<const char *>(text) : "");
        }

        if (step_rc != SQLITE_DONE)
        {
            setError(error, connection.lastError());
        }
        return std::nullopt;
    }

    bool Database::removeValue(const std::string &key, std::string *error) const
    {
        Connection connection(file_path);
        if (!connection.ok())
        {
            setError(error, connection.lastError());
            return false;
        }

        Statement stmt(connection.get(), "DELETE FROM app_config WHERE key = ?;");
        if (!stmt.ok() || !stmt.bindText(1, key))
        {
            setError(error, connection.lastError());
            return false;
        }

        if (sqlite3_step(stmt.get()) != SQLITE_DONE)
        {
            setError(error, connection.lastError());
            return false;
        }
        return true;
    }

    bool Database::saveActiveSimulationConfigJson(const std::string &config_json, std::string *error) const
    {
        return saveValue(ACTIVE_CONFIG_KEY, config_json, error);
    }

    std::optional<std::string> Database::loadActiveSimulationConfigJson(std::string *error) const
    {
        return loadValue(ACTIVE_CONFIG_KEY, error);
    }
} // namespace scramble::db
