/*
 * ctxformat C++ - JSON type
 *
 * Project-wide alias for nlohmann::json.
 */
#ifndef ctxformat_CORE_JSON_HPP
#define ctxformat_CORE_JSON_HPP

#include <nlohmann/json.hpp>

namespace ctxformat {

typedef nlohmann::json Json;

} // namespace ctxformat

#endif // ctxformat_CORE_JSON_HPP
