#include "NoteId.hpp"

#include <cstdint>
#include <random>

namespace notes {

static std::string hexn(uint64_t v, int n) {
  static const char* k = "0123456789abcdef";
  std::string s(n, '0');
  for (int i = n - 1; i >= 0; --i) { s[i] = k[v & 0xf]; v >>= 4; }
  return s;
}

std::string generate_note_id() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  uint64_t a = rng(), b = rng();
  // version 4
  a = (a & 0xffffffffffff0fffULL) | 0x0000000000004000ULL;
  // variant 10xx...
  b = (b & 0x3fffffffffffffffULL) | 0x8000000000000000ULL;

  return hexn(a >> 32, 8) + "-" + hexn((a >> 16) & 0xffffULL, 4) + "-" +
         hexn(a & 0xffffULL, 4) + "-" + hexn(b >> 48, 4) + "-" +
         hexn(b & 0xffffffffffffULL, 12);
}

} // namespace notes
