#pragma once

namespace promptgrid {
namespace obs {

inline constexpr const char* kErrDbConnectFailed = "E_DB_CONNECT_FAILED";
inline constexpr const char* kErrDbQueryFailed = "E_DB_QUERY_FAILED";
inline constexpr const char* kErrDbInsertFailed = "E_DB_INSERT_FAILED";

inline constexpr const char* kErrExpandInvalid = "E_EXPAND_INVALID";
inline constexpr const char* kErrClaimFailed = "E_CLAIM_FAILED";
inline constexpr const char* kErrReleaseFailed = "E_RELEASE_FAILED";
inline constexpr const char* kErrPredictFailed = "E_PREDICT_FAILED";
inline constexpr const char* kErrPredictTimeout = "E_PREDICT_TIMEOUT";
inline constexpr const char* kErrPredictCapacity = "E_PREDICT_CAPACITY";
inline constexpr const char* kErrPredictBackendMissing = "E_PREDICT_BACKEND_MISSING";
inline constexpr const char* kErrWatchdogEntity = "E_WATCHDOG_ENTITY";
inline constexpr const char* kErrConfigInvalid = "E_CONFIG_INVALID";

inline constexpr const char* kErrInternal = "E_INTERNAL";

} // namespace obs
} // namespace promptgrid
