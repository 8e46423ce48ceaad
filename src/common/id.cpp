#include "chronicle/common/id.hpp"

#include <array>
#include <iomanip>
#include <openssl/rand.h>
#include <random>
#include <sstream>
#include <vector>

namespace chronicle::common {

namespace {

void fill_random(unsigned char *data, const std::size_t size) {
  if (RAND_bytes(data, static_cast<int>(size)) == 1) {
    return;
  }
  // RAND_bytes only fails when the OpenSSL pool cannot be seeded.
  thread_local std::mt19937_64 fallback{std::random_device{}()};
  for (std::size_t i = 0; i < size; ++i) {
    data[i] = static_cast<unsigned char>(fallback() & 0xFF);
  }
}

} // namespace

std::string random_hex(const std::size_t bytes) {
  std::vector<unsigned char> data(bytes);
  fill_random(data.data(), data.size());

  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  for (const auto byte : data) {
    stream << std::setw(2) << static_cast<int>(byte);
  }
  return stream.str();
}

std::string generate_id() {
  std::array<unsigned char, 16> bytes{};
  fill_random(bytes.data(), bytes.size());
  bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);
  bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);

  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      stream << '-';
    }
    stream << std::setw(2) << static_cast<int>(bytes[i]);
  }
  return stream.str();
}

} // namespace chronicle::common
