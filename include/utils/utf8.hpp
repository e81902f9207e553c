#ifndef NETCP_UTILS_UTF8_HPP
#define NETCP_UTILS_UTF8_HPP

#include <string_view>

namespace netcp {
namespace utils {

// True if text is well-formed UTF-8 (no overlong forms, surrogates or truncated sequences)
bool is_valid_utf8(std::string_view text);

} // namespace utils
} // namespace netcp

#endif // NETCP_UTILS_UTF8_HPP
