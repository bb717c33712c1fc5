#pragma once

#include "core/cell_value.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace dpgw {

/**
 * @brief Engine-agnostic column type classification
 *
 * Maps from vendor-specific types (PG OIDs, BigQuery field types, SQLite
 * storage classes). Decides how a textual wire value becomes a CellValue.
 */
enum class GenericColumnType : uint16_t {
    UNKNOWN = 0,

    // Integer family
    SMALLINT,
    INTEGER,
    BIGINT,

    // Floating point
    REAL,
    DOUBLE_PRECISION,
    NUMERIC,

    // String family
    TEXT,
    VARCHAR,

    BOOLEAN,

    // Date/Time (carried as ISO-8601 text)
    DATE,
    TIME,
    TIMESTAMP,
    TIMESTAMP_TZ,

    BLOB,
    JSON,
    UUID,

    // Vendor-specific fallback
    VENDOR_SPECIFIC,
};

/**
 * @brief Extended column type info carrying both generic and vendor-specific data
 */
struct ColumnTypeInfo {
    GenericColumnType generic_type = GenericColumnType::UNKNOWN;
    uint32_t vendor_type_id = 0;       // PG OID or SQLite storage class
    std::string vendor_type_name;      // "int8", "FLOAT64", etc.

    ColumnTypeInfo() = default;
    ColumnTypeInfo(GenericColumnType gt, uint32_t vid, std::string vname)
        : generic_type(gt), vendor_type_id(vid), vendor_type_name(std::move(vname)) {}
};

[[nodiscard]] const char* generic_column_type_to_string(GenericColumnType type);

/** @brief Map a PostgreSQL type OID (pg_type.oid) */
[[nodiscard]] GenericColumnType pg_oid_to_generic(uint32_t oid);

/** @brief Map a BigQuery schema field type ("INT64", "FLOAT", "BOOL", ...) */
[[nodiscard]] GenericColumnType bigquery_type_to_generic(std::string_view type_name);

/**
 * @brief Convert a textual wire value into a typed cell
 *
 * Integer and floating types parse with std::from_chars; booleans accept
 * t/f/true/false/1/0. Anything that fails to parse stays text, so no data is
 * dropped on an unexpected representation.
 */
[[nodiscard]] CellValue decode_text_cell(std::string_view text, GenericColumnType type);

} // namespace dpgw
