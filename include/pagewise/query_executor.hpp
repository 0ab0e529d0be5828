#pragma once

/**
 * @file query_executor.hpp
 * @brief Query executor interface consumed by the paging reader
 */

#include <string_view>
#include <vector>

#include "pagewise/status.hpp"
#include "pagewise/value.hpp"

namespace pagewise {

/**
 * @brief Runs a named query and returns its mapped rows
 *
 * Implementations own whatever store session the query needs. The
 * parameters are read-only input and rows must come back in store order.
 */
class QueryExecutor {
public:
    virtual ~QueryExecutor() = default;

    /**
     * @brief Execute a query
     * @param query_id Identifier of the query to run
     * @param parameters Named parameter values
     * @param[out] rows Result rows, replaced on success
     * @return Status; failures are reported with StatusCode::kExecution
     *         unless the implementation documents otherwise
     */
    [[nodiscard]] virtual Status execute(std::string_view query_id,
                                         const ParameterMap& parameters,
                                         std::vector<Row>* rows) = 0;
};

}  // namespace pagewise
