#pragma once

/**
 * @file test_utils.hpp
 * @brief Common test utilities
 */

#include <filesystem>
#include <random>
#include <string>
#include <vector>

#include "pagewise/query_executor.hpp"
#include "pagewise/status.hpp"
#include "pagewise/value.hpp"

namespace pagewise {
namespace test {

/**
 * @brief RAII helper for temporary test files
 */
class TempFile {
public:
    explicit TempFile(const std::string& prefix = "pagewise_test_") {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 999999);

        path_ = std::filesystem::temp_directory_path() /
                (prefix + std::to_string(dis(gen)) + ".db");
    }

    ~TempFile() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
        std::filesystem::remove(path_.string() + "-journal", ec);
    }

    [[nodiscard]] const std::filesystem::path& path() const noexcept {
        return path_;
    }

    [[nodiscard]] std::string string() const {
        return path_.string();
    }

private:
    std::filesystem::path path_;
};

/**
 * @brief Single-column row holding a name
 */
inline Row make_row(const std::string& name) {
    return Row({Value(name)}, {"name"});
}

/**
 * @brief Rows named after each string, in order
 */
inline std::vector<Row> make_rows(const std::vector<std::string>& names) {
    std::vector<Row> rows;
    rows.reserve(names.size());
    for (const auto& name : names) {
        rows.push_back(make_row(name));
    }
    return rows;
}

/**
 * @brief Scripted executor recording every call
 *
 * Call i returns pages[i]; calls past the script return an empty page.
 * Queued failures are returned, in order, before the scripted page of the
 * call they land on is consumed.
 */
class FakeQueryExecutor : public QueryExecutor {
public:
    struct Call {
        std::string query_id;
        ParameterMap parameters;
    };

    explicit FakeQueryExecutor(std::vector<std::vector<Row>> pages = {})
        : pages_(std::move(pages)) {}

    Status execute(std::string_view query_id, const ParameterMap& parameters,
                   std::vector<Row>* rows) override {
        calls_.push_back({std::string(query_id), parameters});

        if (!failures_.empty()) {
            Status failure = failures_.front();
            failures_.erase(failures_.begin());
            return failure;
        }

        if (next_page_ < pages_.size()) {
            *rows = pages_[next_page_++];
        } else {
            rows->clear();
        }
        return Status::Ok();
    }

    void fail_next(Status status) { failures_.push_back(std::move(status)); }

    [[nodiscard]] const std::vector<Call>& calls() const noexcept { return calls_; }

private:
    std::vector<std::vector<Row>> pages_;
    size_t next_page_ = 0;
    std::vector<Status> failures_;
    std::vector<Call> calls_;
};

}  // namespace test
}  // namespace pagewise
