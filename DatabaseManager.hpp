// File: DatabaseManager.hpp
// Description: Hands out PostgreSQL connections and translates libpqxx
// failures into ExternalDependencyError at the repository boundary.
#pragma once

#include "CombatErrors.hpp"
#include <pqxx/pqxx>
#include <string>
#include <memory>
#include <iostream>

class DatabaseManager {
private:
    std::string connection_string_;

public:
    explicit DatabaseManager(const std::string& conn_str)
        : connection_string_(conn_str) {
        try {
            // Test the connection on startup
            pqxx::connection C(connection_string_);
            std::cout << "[DB] Connected to database: " << C.dbname() << std::endl;
        }
        catch (const std::exception& e) {
            std::cerr << "[DB ERROR] Connection failed: " << e.what() << std::endl;
            throw; // Stop the server if the DB is unreachable at boot
        }
    }

    // One short-lived connection per repository call.
    pqxx::connection get_connection() {
        try {
            return pqxx::connection(connection_string_);
        }
        catch (const std::exception& e) {
            std::cerr << "[DB ERROR] Failed to create new connection: " << e.what() << std::endl;
            throw ExternalDependencyError(std::string("Could not connect to database: ") + e.what(), true);
        }
    }
};

/**
 * @brief Runs one repository operation, mapping pqxx errors onto the combat
 * error taxonomy. Dropped connections and serialization/deadlock rollbacks
 * are transient; everything else is not.
 */
template <typename Fn>
auto runDatabaseOp(const char* operation, Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    }
    catch (const CombatError&) {
        throw;
    }
    catch (const pqxx::broken_connection& e) {
        std::cerr << "[DB ERROR] " << operation << ": connection lost: " << e.what() << std::endl;
        throw ExternalDependencyError(std::string(operation) + ": database connection lost", true);
    }
    catch (const pqxx::transaction_rollback& e) {
        std::cerr << "[DB ERROR] " << operation << ": rolled back: " << e.what() << std::endl;
        throw ExternalDependencyError(std::string(operation) + ": transaction rolled back", true);
    }
    catch (const std::exception& e) {
        std::cerr << "[DB ERROR] " << operation << ": " << e.what() << std::endl;
        throw ExternalDependencyError(std::string(operation) + ": " + e.what(), false);
    }
}
