#ifndef codeloop_CORE_JSON_HPP
#define codeloop_CORE_JSON_HPP

#include <nlohmann/json.hpp>

namespace codeloop {

typedef nlohmann::json Json;

} // namespace codeloop

#endif // codeloop_CORE_JSON_HPP
