#pragma once

#include <optional>
#include <string>

namespace scramble::db
{

    // Key/value settings table in a SQLite file. Every call opens its own connection, so a
    // Database object is safe to share between the tick and server threads.
    class Database
    {
    public:
        explicit Database(std::string file_path);

        bool initialize(std::string *error = nullptr) const;

        bool saveValue(const std::string &key, const std::string &value, std::string *error = nullptr) const;
        std::optional<std::string> loadValue(const std::string &key, std::string *error = nullptr) const;
        bool removeValue(const std::string &key, std::string *error = nullptr) const;

        bool saveActiveSimulationConfigJson(const std::string &config_json, std::string *error = nullptr) const;
        std::optional<std::string> loadActiveSimulationConfigJson(std::string *error = nullptr) const;

        const std::string &path() const { return file_path; }

    private:
        std::string file_path;
    };

} // namespace scramble::db
