#pragma once
#include <cstdint>
#include <string>
#include <string_view>

namespace bookland::internal {

inline std::string EncodeU32LE(uint32_t v) {
  std::string s(4, '\0');
  for (int i = 0; i < 4; ++i) {
    s[i] = static_cast<char>(v & 0xffu);
    v >>= 8;
  }
  return s;
}

inline bool DecodeU32LE(std::string_view s, uint32_t* out) {
  if (s.size() != 4) return false;
  uint32_t v = 0;
  // little endian decode
  for (int i = 3; i >= 0; --i) {
    v <<= 8;
    v |= static_cast<uint8_t>(s[static_cast<size_t>(i)]);
  }
  *out = v;
  return true;
}

// ---------------------------------------------------------------------------
// Product value stored in the bookland_products CF
// ---------------------------------------------------------------------------

// Serialization format:
//   [isbn_len:4 LE][isbn bytes][superseded:1]
struct ProductValue {
  std::string isbn_number;
  bool superseded = false;

  std::string Serialize() const {
    std::string out;
    out.reserve(4 + isbn_number.size() + 1);
    out.append(EncodeU32LE(static_cast<uint32_t>(isbn_number.size())));
    out.append(isbn_number);
    out.push_back(superseded ? '\x01' : '\x00');
    return out;
  }

  static bool Deserialize(std::string_view data, ProductValue* out) {
    if (!out) return false;
    if (data.size() < 5) return false;

    uint32_t len = 0;
    if (!DecodeU32LE(data.substr(0, 4), &len)) return false;
    if (data.size() != 4 + static_cast<size_t>(len) + 1) return false;

    out->isbn_number = std::string(data.substr(4, len));
    const char flag = data[4 + len];
    if (flag != '\x00' && flag != '\x01') return false;
    out->superseded = (flag == '\x01');
    return true;
  }
};

// ---------------------------------------------------------------------------
// UPC index key helpers
// ---------------------------------------------------------------------------

// UPC index key: [upc]['\0'][product_id]
// The separator sorts below every digit, so all links of one UPC are
// contiguous and a prefix scan on "upc\0" finds exactly them.
inline constexpr char kUpcKeySeparator = '\0';

inline std::string MakeUpcKey(std::string_view upc, std::string_view product_id) {
  std::string key;
  key.reserve(upc.size() + 1 + product_id.size());
  key.append(upc);
  key.push_back(kUpcKeySeparator);
  key.append(product_id);
  return key;
}

inline std::string MakeUpcPrefix(std::string_view upc) {
  std::string prefix(upc);
  prefix.push_back(kUpcKeySeparator);
  return prefix;
}

inline bool ParseUpcKey(std::string_view key, std::string* upc, std::string* product_id) {
  const size_t sep = key.find(kUpcKeySeparator);
  if (sep == std::string_view::npos) return false;
  *upc = std::string(key.substr(0, sep));
  *product_id = std::string(key.substr(sep + 1));
  return true;
}

}  // namespace bookland::internal
