#pragma once

#include "core/cell_value.hpp"
#include "core/types.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace dpgw {

/**
 * @brief A row with typed core columns plus an optional JSON document
 *
 * The document is written into payload_column and cast to jsonb, so
 * semi-structured attributes live next to the indexed keys.
 */
struct HybridRecord {
    std::map<std::string, CellValue> columns;
    std::optional<std::string> payload_json;
    std::string payload_column = "payload";
};

/**
 * @brief Key-addressed record operations on a relational store
 *
 * Identifiers are always quoted and values always bound as parameters.
 * Results come back as QueryResult rows (RETURNING for writes).
 */
class IRecordStore {
public:
    virtual ~IRecordStore() = default;

    /**
     * @brief Insert or update by key
     * @param key_fields Conflict target; every key must be present in the record
     */
    virtual QueryResult upsert_record(
        const std::string& table,
        const HybridRecord& record,
        const std::vector<std::string>& key_fields,
        const std::string& transaction_id = "") = 0;

    [[nodiscard]] virtual QueryResult get_record(
        const std::string& table,
        const std::string& key_field,
        const CellValue& key_value,
        const std::string& transaction_id = "") = 0;

    /** @brief Rows matching every equality filter (NULL filters match IS NULL) */
    [[nodiscard]] virtual QueryResult fetch_records(
        const std::string& table,
        const std::map<std::string, CellValue>& filters,
        std::optional<size_t> limit = std::nullopt,
        const std::string& transaction_id = "") = 0;

    /** @brief Delete by key; row_count is the number of rows removed */
    virtual QueryResult delete_record(
        const std::string& table,
        const std::string& key_field,
        const CellValue& key_value,
        const std::string& transaction_id = "") = 0;
};

} // namespace dpgw
