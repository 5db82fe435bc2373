#include "warden/common/crypto.hpp"

#include <openssl/rand.h>
#include <openssl/sha.h>

#include <iomanip>
#include <random>
#include <sstream>
#include <vector>

namespace warden::common {

std::string sha256_hex(const std::string &text) {
  unsigned char digest[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char *>(text.data()), text.size(), digest);
  std::ostringstream out;
  out << std::hex << std::setfill('0');
  for (unsigned char c : digest) {
    out << std::setw(2) << static_cast<int>(c);
  }
  return out.str();
}

std::string random_hex(const std::size_t bytes) {
  std::vector<unsigned char> data(bytes);
  if (RAND_bytes(data.data(), static_cast<int>(data.size())) != 1) {
    static thread_local std::mt19937_64 rng(std::random_device{}());
    for (auto &byte : data) {
      byte = static_cast<unsigned char>(rng() & 0xFFULL);
    }
  }
  std::ostringstream out;
  out << std::hex << std::setfill('0');
  for (unsigned char c : data) {
    out << std::setw(2) << static_cast<int>(c);
  }
  return out.str();
}

} // namespace warden::common
