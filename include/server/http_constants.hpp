#pragma once

#include <string>
#include <string_view>

namespace dpgw::http {

inline constexpr std::string_view kBearerPrefix = "Bearer ";
// std::string because cpp-httplib APIs require const std::string&
inline const std::string kAuthorizationHeader = "Authorization";
inline constexpr const char* kJsonContentType = "application/json";

inline constexpr const char* kQueryRoute = "/api/v1/query";
inline constexpr const char* kDataProductRoute = R"(/api/v1/data-products/([A-Za-z0-9_.\-]+))";
inline constexpr const char* kHealthRoute = "/health";
inline constexpr const char* kReloadRoute = "/admin/reload";

} // namespace dpgw::http
