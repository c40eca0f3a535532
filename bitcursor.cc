#include "bitcursor.hh"
#include "bits.hh"
#include <algorithm>

unsigned int BitCursor::getbitu(int len)
{
  need(len);
  unsigned int ret = ::getbitu(d_payload.data(), d_pos, len);
  d_pos += len;
  return ret;
}

int BitCursor::getbits(int len)
{
  need(len);
  int ret = ::getbits(d_payload.data(), d_pos, len);
  d_pos += len;
  return ret;
}

/* one sign bit, then len-1 bits of magnitude. GLONASS does this. Note that
   this means there is a 'negative zero' */
int BitCursor::getbitsm(int len)
{
  need(len);
  bool negative = ::getbitu(d_payload.data(), d_pos, 1);
  int magnitude = ::getbitu(d_payload.data(), d_pos + 1, len - 1);
  d_pos += len;
  return negative ? -magnitude : magnitude;
}

uint64_t BitCursor::getbitu64(int len)
{
  need(len);
  uint64_t ret=0;
  while(len > 0) {
    int chunk = std::min(len, 32);
    ret = (ret << chunk) | ::getbitu(d_payload.data(), d_pos, chunk);
    d_pos += chunk;
    len -= chunk;
  }
  return ret;
}

// len bits, packed MSB first into ceil(len/8) bytes
std::basic_string<uint8_t> BitCursor::getBytes(int len)
{
  need(len);
  std::basic_string<uint8_t> ret;
  while(len > 0) {
    int chunk = std::min(len, 8);
    ret.append(1, (uint8_t)(::getbitu(d_payload.data(), d_pos, chunk) << (8 - chunk)));
    d_pos += chunk;
    len -= chunk;
  }
  return ret;
}

bool BitCursor::isNull() const
{
  int whole = d_bitlen / 8;
  if(!std::all_of(d_payload.begin(), d_payload.begin() + whole, [](uint8_t c) { return c == 0; }))
    return false;
  int rest = d_bitlen % 8;
  return !rest || !::getbitu(d_payload.data(), 8*whole, rest);
}
