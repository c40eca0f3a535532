#pragma once
#include <stdint.h>
#include <string>
#include <string_view>
#include <initializer_list>
#include "bits.hh"

// builds bit-packed payloads for the tests, MSB first
struct BitWriter
{
  std::basic_string<uint8_t> buf;
  int pos{0};

  BitWriter& u(int len, unsigned int val)
  {
    grow(len);
    setbitu(&buf[0], pos, len, val);
    pos += len;
    return *this;
  }
  BitWriter& s(int len, int val)
  {
    grow(len);
    setbits(&buf[0], pos, len, val);
    pos += len;
    return *this;
  }
  // sign-magnitude, as GLONASS sends it
  BitWriter& sm(int len, int val)
  {
    u(1, val < 0);
    return u(len - 1, val < 0 ? -val : val);
  }
  BitWriter& u64(int len, uint64_t val)
  {
    if(len > 32) {
      u(len - 32, val >> 32);
      len = 32;
    }
    return u(len, val & 0xffffffff);
  }
  std::basic_string_view<uint8_t> view() const
  {
    return std::basic_string_view<uint8_t>(buf.c_str(), buf.size());
  }
private:
  void grow(int len)
  {
    while((int)buf.size() * 8 < pos + len)
      buf.append(1, 0);
  }
};

/* CSSR header: message number, subtype, then 20 bits of epoch for the mask
   or 12 bits of hourly epoch for the rest, update interval, mmi and IOD SSR */
inline BitWriter& cssrHeader(BitWriter& bw, int subtype, int epoch, int iod=3, int msgnum=4073)
{
  bw.u(12, msgnum).u(4, subtype);
  if(subtype == 10)
    return bw;
  bw.u(subtype == 1 ? 20 : 12, epoch);
  return bw.u(4, 2).u(1, 0).u(4, iod);
}

// one GNSS of a mask: satellites and signals as 1-based/0-based positions, no cell mask
inline BitWriter& maskGNSS(BitWriter& bw, int gnssid, std::initializer_list<int> sats, std::initializer_list<int> sigs)
{
  uint64_t satmask=0;
  for(int s : sats)
    satmask |= 1ULL << (40 - s);
  unsigned int sigmask=0;
  for(int s : sigs)
    sigmask |= 1u << (15 - s);
  return bw.u(4, gnssid).u64(40, satmask).u(16, sigmask).u(1, 0);
}
