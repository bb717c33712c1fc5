#include "core/column_type.hpp"
#include "core/utils.hpp"

#include <unordered_map>

namespace dpgw {

const char* generic_column_type_to_string(GenericColumnType type) {
    switch (type) {
        case GenericColumnType::UNKNOWN: return "UNKNOWN";
        case GenericColumnType::SMALLINT: return "SMALLINT";
        case GenericColumnType::INTEGER: return "INTEGER";
        case GenericColumnType::BIGINT: return "BIGINT";
        case GenericColumnType::REAL: return "REAL";
        case GenericColumnType::DOUBLE_PRECISION: return "DOUBLE_PRECISION";
        case GenericColumnType::NUMERIC: return "NUMERIC";
        case GenericColumnType::TEXT: return "TEXT";
        case GenericColumnType::VARCHAR: return "VARCHAR";
        case GenericColumnType::BOOLEAN: return "BOOLEAN";
        case GenericColumnType::DATE: return "DATE";
        case GenericColumnType::TIME: return "TIME";
        case GenericColumnType::TIMESTAMP: return "TIMESTAMP";
        case GenericColumnType::TIMESTAMP_TZ: return "TIMESTAMP_TZ";
        case GenericColumnType::BLOB: return "BLOB";
        case GenericColumnType::JSON: return "JSON";
        case GenericColumnType::UUID: return "UUID";
        case GenericColumnType::VENDOR_SPECIFIC: return "VENDOR_SPECIFIC";
        default: return "UNKNOWN";
    }
}

GenericColumnType pg_oid_to_generic(uint32_t oid) {
    // Built-in OIDs from pg_type.dat; stable across server versions
    switch (oid) {
        case 16:   return GenericColumnType::BOOLEAN;
        case 17:   return GenericColumnType::BLOB;
        case 20:   return GenericColumnType::BIGINT;
        case 21:   return GenericColumnType::SMALLINT;
        case 23:   return GenericColumnType::INTEGER;
        case 25:   return GenericColumnType::TEXT;
        case 114:  return GenericColumnType::JSON;
        case 700:  return GenericColumnType::REAL;
        case 701:  return GenericColumnType::DOUBLE_PRECISION;
        case 1042: return GenericColumnType::TEXT;
        case 1043: return GenericColumnType::VARCHAR;
        case 1082: return GenericColumnType::DATE;
        case 1083: return GenericColumnType::TIME;
        case 1114: return GenericColumnType::TIMESTAMP;
        case 1184: return GenericColumnType::TIMESTAMP_TZ;
        case 1700: return GenericColumnType::NUMERIC;
        case 2950: return GenericColumnType::UUID;
        case 3802: return GenericColumnType::JSON;
        default:   return GenericColumnType::VENDOR_SPECIFIC;
    }
}

GenericColumnType bigquery_type_to_generic(std::string_view type_name) {
    static const std::unordered_map<std::string, GenericColumnType> kTypeMap = {
        {"INTEGER",    GenericColumnType::BIGINT},
        {"INT64",      GenericColumnType::BIGINT},
        {"FLOAT",      GenericColumnType::DOUBLE_PRECISION},
        {"FLOAT64",    GenericColumnType::DOUBLE_PRECISION},
        {"NUMERIC",    GenericColumnType::NUMERIC},
        {"BIGNUMERIC", GenericColumnType::NUMERIC},
        {"BOOLEAN",    GenericColumnType::BOOLEAN},
        {"BOOL",       GenericColumnType::BOOLEAN},
        {"STRING",     GenericColumnType::TEXT},
        {"BYTES",      GenericColumnType::BLOB},
        {"DATE",       GenericColumnType::DATE},
        {"TIME",       GenericColumnType::TIME},
        {"DATETIME",   GenericColumnType::TIMESTAMP},
        {"TIMESTAMP",  GenericColumnType::TIMESTAMP_TZ},
        {"JSON",       GenericColumnType::JSON},
    };

    const auto it = kTypeMap.find(utils::to_upper(type_name));
    return (it != kTypeMap.end()) ? it->second : GenericColumnType::VENDOR_SPECIFIC;
}

CellValue decode_text_cell(std::string_view text, GenericColumnType type) {
    switch (type) {
        case GenericColumnType::SMALLINT:
        case GenericColumnType::INTEGER:
        case GenericColumnType::BIGINT:
            if (const auto v = utils::try_parse_int<int64_t>(text)) return *v;
            break;
        case GenericColumnType::REAL:
        case GenericColumnType::DOUBLE_PRECISION:
        case GenericColumnType::NUMERIC:
            if (const auto v = utils::try_parse_double(text)) return *v;
            break;
        case GenericColumnType::BOOLEAN: {
            const auto lower = utils::to_lower(text);
            if (lower == "t" || lower == "true" || lower == "1") return true;
            if (lower == "f" || lower == "false" || lower == "0") return false;
            break;
        }
        default:
            break;
    }
    return std::string(text);
}

} // namespace dpgw
