#ifndef CORO_FILELINK_UTIL_CRYPTO_UTILS_H
#define CORO_FILELINK_UTIL_CRYPTO_UTILS_H

#include <string>
#include <string_view>

namespace coro::filelink::util {

std::string ToHex(std::string_view message);
std::string GetHMACSHA256(std::string_view key, std::string_view message);

// Compares in time independent of the position of the first mismatch.
bool ConstantTimeEqual(std::string_view s1, std::string_view s2);

}  // namespace coro::filelink::util

#endif  // CORO_FILELINK_UTIL_CRYPTO_UTILS_H
