#pragma once

#include <cstdint>
#include <optional>

namespace sextant::value::pg_oid {

inline constexpr std::uint32_t kBool = 16U;
inline constexpr std::uint32_t kBytea = 17U;
inline constexpr std::uint32_t kChar = 18U;
inline constexpr std::uint32_t kName = 19U;
inline constexpr std::uint32_t kInt8 = 20U;
inline constexpr std::uint32_t kInt2 = 21U;
inline constexpr std::uint32_t kInt4 = 23U;
inline constexpr std::uint32_t kText = 25U;
inline constexpr std::uint32_t kOid = 26U;
inline constexpr std::uint32_t kJson = 114U;
inline constexpr std::uint32_t kXml = 142U;
inline constexpr std::uint32_t kFloat4 = 700U;
inline constexpr std::uint32_t kFloat8 = 701U;
inline constexpr std::uint32_t kUnknown = 705U;
inline constexpr std::uint32_t kMoney = 790U;
inline constexpr std::uint32_t kBpchar = 1042U;
inline constexpr std::uint32_t kVarchar = 1043U;
inline constexpr std::uint32_t kDate = 1082U;
inline constexpr std::uint32_t kTime = 1083U;
inline constexpr std::uint32_t kTimestamp = 1114U;
inline constexpr std::uint32_t kTimestampTz = 1184U;
inline constexpr std::uint32_t kInterval = 1186U;
inline constexpr std::uint32_t kTimeTz = 1266U;
inline constexpr std::uint32_t kNumeric = 1700U;
inline constexpr std::uint32_t kUuid = 2950U;
inline constexpr std::uint32_t kJsonb = 3802U;

inline constexpr std::uint32_t kJsonArray = 199U;
inline constexpr std::uint32_t kBoolArray = 1000U;
inline constexpr std::uint32_t kByteaArray = 1001U;
inline constexpr std::uint32_t kCharArray = 1002U;
inline constexpr std::uint32_t kNameArray = 1003U;
inline constexpr std::uint32_t kInt2Array = 1005U;
inline constexpr std::uint32_t kInt4Array = 1007U;
inline constexpr std::uint32_t kTextArray = 1009U;
inline constexpr std::uint32_t kBpcharArray = 1014U;
inline constexpr std::uint32_t kVarcharArray = 1015U;
inline constexpr std::uint32_t kInt8Array = 1016U;
inline constexpr std::uint32_t kFloat4Array = 1021U;
inline constexpr std::uint32_t kFloat8Array = 1022U;
inline constexpr std::uint32_t kOidArray = 1028U;
inline constexpr std::uint32_t kTimestampArray = 1115U;
inline constexpr std::uint32_t kDateArray = 1182U;
inline constexpr std::uint32_t kTimeArray = 1183U;
inline constexpr std::uint32_t kTimestampTzArray = 1185U;
inline constexpr std::uint32_t kNumericArray = 1231U;
inline constexpr std::uint32_t kTimeTzArray = 1270U;
inline constexpr std::uint32_t kUuidArray = 2951U;
inline constexpr std::uint32_t kJsonbArray = 3807U;

// Element type for the built-in array types; nullopt for anything else.
[[nodiscard]] constexpr std::optional<std::uint32_t> array_element(std::uint32_t array_oid) noexcept
{
    switch (array_oid) {
    case kJsonArray:
        return kJson;
    case kBoolArray:
        return kBool;
    case kByteaArray:
        return kBytea;
    case kCharArray:
        return kChar;
    case kNameArray:
        return kName;
    case kInt2Array:
        return kInt2;
    case kInt4Array:
        return kInt4;
    case kTextArray:
        return kText;
    case kBpcharArray:
        return kBpchar;
    case kVarcharArray:
        return kVarchar;
    case kInt8Array:
        return kInt8;
    case kFloat4Array:
        return kFloat4;
    case kFloat8Array:
        return kFloat8;
    case kOidArray:
        return kOid;
    case kTimestampArray:
        return kTimestamp;
    case kDateArray:
        return kDate;
    case kTimeArray:
        return kTime;
    case kTimestampTzArray:
        return kTimestampTz;
    case kNumericArray:
        return kNumeric;
    case kTimeTzArray:
        return kTimeTz;
    case kUuidArray:
        return kUuid;
    case kJsonbArray:
        return kJsonb;
    default:
        return std::nullopt;
    }
}

}  // namespace sextant::value::pg_oid
