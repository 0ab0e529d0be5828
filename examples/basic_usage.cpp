/**
 * @file basic_usage.cpp
 * @brief Basic usage example for Pagewise
 */

#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include <pagewise/pagewise.hpp>

int main() {
    std::cout << "Pagewise v" << pagewise::version() << "\n\n";

    // A SQLite executor owns the connection and the registered queries
    auto executor = std::make_shared<pagewise::SqliteQueryExecutor>(":memory:");
    auto status = executor->open();
    if (!status.ok()) {
        std::cerr << "Open failed: " << status.to_string() << "\n";
        return 1;
    }

    status = executor->exec(
        "CREATE TABLE users (id INTEGER PRIMARY KEY, name TEXT, status TEXT);"
        "INSERT INTO users VALUES (1, 'Alice', 'active');"
        "INSERT INTO users VALUES (2, 'Bob', 'inactive');"
        "INSERT INTO users VALUES (3, 'Carol', 'active');"
        "INSERT INTO users VALUES (4, 'Dave', 'active');"
        "INSERT INTO users VALUES (5, 'Erin', 'active');");
    if (!status.ok()) {
        std::cerr << "Setup failed: " << status.to_string() << "\n";
        return 1;
    }

    // Paging parameters arrive as :_page, :_pagesize and :_skiprows
    status = executor->register_query(
        "active_users",
        "SELECT id, name FROM users WHERE status = :status ORDER BY id "
        "LIMIT :_pagesize OFFSET :_skiprows");
    if (!status.ok()) {
        std::cerr << "Register failed: " << status.to_string() << "\n";
        return 1;
    }

    pagewise::PagingItemReader reader;
    status = reader.set_query_id("active_users");
    if (status.ok()) status = reader.set_query_executor(executor);
    if (status.ok()) status = reader.set_page_size(2);
    if (status.ok()) {
        status = reader.set_parameter_values({{"status", pagewise::Value("active")}});
    }
    if (status.ok()) status = reader.initialize();
    if (!status.ok()) {
        std::cerr << "Reader setup failed: " << status.to_string() << "\n";
        return 1;
    }

    std::optional<pagewise::Row> row;
    while (true) {
        status = reader.read_next(&row);
        if (!status.ok()) {
            std::cerr << "Read failed: " << status.to_string() << "\n";
            return 1;
        }
        if (!row.has_value()) {
            break;
        }
        std::cout << "  page " << reader.page() - 1 << ": "
                  << (*row)["id"].to_string() << " "
                  << (*row)["name"].to_string() << "\n";
    }

    // Checkpoint the position the way a batch framework would
    pagewise::ExecutionContext context;
    status = reader.update(&context);
    if (!status.ok()) {
        std::cerr << "Update failed: " << status.to_string() << "\n";
        return 1;
    }
    for (const auto& [key, value] : context) {
        std::cout << "\n" << key << " = " << value.to_string() << "\n";
    }

    reader.close();
    executor->close();
    return 0;
}
