#pragma once

#include <string>
#include <cstdlib>
#include <stdexcept>

namespace crossover::settings
{

    /**
     * @brief Настройки PostgreSQL для леджера (CROSSOVER_LEDGER=postgres)
     *
     * ENV:
     * - CROSSOVER_DB_HOST, CROSSOVER_DB_PORT, CROSSOVER_DB_NAME
     * - CROSSOVER_DB_USER, CROSSOVER_DB_PASSWORD
     * - CROSSOVER_DB_LEDGER_TABLE (default: "ledger_entries")
     * - CROSSOVER_DB_CONNECT_TIMEOUT_SEC (default: 5)
     */
    class DbSettings
    {
    public:
        DbSettings()
            : host_(envOr("CROSSOVER_DB_HOST", "crossover-postgres"))
            , port_(parsePort(envOr("CROSSOVER_DB_PORT", "5432")))
            , name_(envOr("CROSSOVER_DB_NAME", "crossover_db"))
            , user_(envOr("CROSSOVER_DB_USER", "crossover_user"))
            , password_(envOr("CROSSOVER_DB_PASSWORD", "crossover_password"))
            , ledgerTable_(envOr("CROSSOVER_DB_LEDGER_TABLE", "ledger_entries"))
            , connectTimeoutSec_(std::stoi(envOr("CROSSOVER_DB_CONNECT_TIMEOUT_SEC", "5")))
        {
            if (ledgerTable_.empty())
            {
                throw std::invalid_argument("CROSSOVER_DB_LEDGER_TABLE must not be empty");
            }
        }

        const std::string &getHost() const { return host_; }
        int getPort() const { return port_; }
        const std::string &getName() const { return name_; }
        const std::string &getLedgerTable() const { return ledgerTable_; }

        /// libpq keyword/value строка
        std::string getConnectionString() const
        {
            std::string result = "host=" + host_ + " port=" + std::to_string(port_) +
                                 " dbname=" + name_ + " user=" + user_ + " password=" + password_;
            if (connectTimeoutSec_ > 0)
            {
                result += " connect_timeout=" + std::to_string(connectTimeoutSec_);
            }
            return result;
        }

    private:
        std::string host_;
        int port_;
        std::string name_;
        std::string user_;
        std::string password_;
        std::string ledgerTable_;
        int connectTimeoutSec_;

        static std::string envOr(const char *name, const char *fallback)
        {
            const char *value = std::getenv(name);
            return value ? std::string(value) : std::string(fallback);
        }

        static int parsePort(const std::string &value)
        {
            int port = std::stoi(value);
            if (port < 1 || port > 65535)
            {
                throw std::invalid_argument("CROSSOVER_DB_PORT out of range: " + value);
            }
            return port;
        }
    };

} // namespace crossover::settings
