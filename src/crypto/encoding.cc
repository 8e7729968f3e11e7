#include "hitl/crypto/encoding.h"

#include <algorithm>
#include <cstdint>

namespace hitl {
namespace crypto {

namespace {

const char kStandardChars[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
const char kUrlChars[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

std::string encode(const std::string& data, const char* alphabet, bool pad) {
  std::string out;
  out.reserve((data.size() + 2) / 3 * 4);

  uint32_t val = 0;
  int valb = -6;
  for (unsigned char c : data) {
    val = (val << 8) + c;
    valb += 8;
    while (valb >= 0) {
      out.push_back(alphabet[(val >> valb) & 0x3F]);
      valb -= 6;
    }
  }
  if (valb > -6) {
    out.push_back(alphabet[((val << 8) >> (valb + 8)) & 0x3F]);
  }
  if (pad) {
    while (out.size() % 4 != 0) {
      out.push_back('=');
    }
  }
  return out;
}

int indexOf(const char* alphabet, char c) {
  for (int i = 0; i < 64; ++i) {
    if (alphabet[i] == c) {
      return i;
    }
  }
  return -1;
}

optional<std::string> decode(const std::string& encoded,
                             const char* alphabet,
                             bool padding_required) {
  size_t data_len = encoded.size();
  while (data_len > 0 && encoded[data_len - 1] == '=') {
    --data_len;
  }
  size_t pad_len = encoded.size() - data_len;
  if (pad_len > 2) {
    return nullopt;
  }
  if (padding_required && encoded.size() % 4 != 0) {
    return nullopt;
  }
  if (pad_len > 0 && encoded.size() % 4 != 0) {
    return nullopt;
  }
  // A single trailing symbol cannot encode a whole byte
  if (data_len % 4 == 1) {
    return nullopt;
  }

  std::string out;
  out.reserve(data_len * 3 / 4);

  uint32_t val = 0;
  int valb = -8;
  for (size_t i = 0; i < data_len; ++i) {
    int idx = indexOf(alphabet, encoded[i]);
    if (idx < 0) {
      return nullopt;
    }
    val = (val << 6) + static_cast<uint32_t>(idx);
    valb += 6;
    if (valb >= 0) {
      out.push_back(static_cast<char>((val >> valb) & 0xFF));
      valb -= 8;
    }
  }
  return out;
}

}  // namespace

std::string base64Encode(const std::string& data) {
  return encode(data, kStandardChars, true);
}

optional<std::string> base64Decode(const std::string& encoded) {
  return decode(encoded, kStandardChars, true);
}

std::string base64UrlEncode(const std::string& data) {
  return encode(data, kUrlChars, false);
}

optional<std::string> base64UrlDecode(const std::string& encoded) {
  return decode(encoded, kUrlChars, false);
}

}  // namespace crypto
}  // namespace hitl
