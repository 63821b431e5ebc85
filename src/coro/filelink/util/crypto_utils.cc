#include "coro/filelink/util/crypto_utils.h"

#include <cryptopp/hex.h>
#include <cryptopp/hmac.h>
#include <cryptopp/misc.h>
#include <cryptopp/sha.h>

namespace coro::filelink::util {

std::string ToHex(std::string_view message) {
  ::CryptoPP::HexEncoder hex_encoder(/*attachment=*/nullptr,
                                     /*uppercase=*/false);
  hex_encoder.Put(reinterpret_cast<const uint8_t*>(message.data()),
                  message.size());
  hex_encoder.MessageEnd();
  std::string result(2 * message.size(), 0);
  hex_encoder.Get(reinterpret_cast<uint8_t*>(result.data()), result.size());
  return result;
}

std::string GetHMACSHA256(std::string_view key, std::string_view message) {
  ::CryptoPP::HMAC<::CryptoPP::SHA256> hmac(
      reinterpret_cast<const uint8_t*>(key.data()), key.length());
  std::string result(hmac.DigestSize(), 0);
  hmac.CalculateDigest(reinterpret_cast<uint8_t*>(result.data()),
                       reinterpret_cast<const uint8_t*>(message.data()),
                       message.size());
  return result;
}

bool ConstantTimeEqual(std::string_view s1, std::string_view s2) {
  if (s1.size() != s2.size()) {
    return false;
  }
  return ::CryptoPP::VerifyBufsEqual(
      reinterpret_cast<const ::CryptoPP::byte*>(s1.data()),
      reinterpret_cast<const ::CryptoPP::byte*>(s2.data()), s1.size());
}

}  // namespace coro::filelink::util
