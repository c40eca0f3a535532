#pragma once
#include <stdint.h>
#include <string>
#include <string_view>
#include <stdexcept>

// thrown when a read would run past the end of the payload
struct InsufficientData
{
  int pos;
  int wanted;
  int available;
};

/* A read-only cursor over a bit-packed payload, MSB first as RTCM sends it.
   The cursor owns only its position, so copying one gives an independent
   cursor over the same bytes, which is how speculative reads are done.
   Decoders check has() before every read whose width depends on earlier fields.
   The getters throw InsufficientData if they run out anyhow. */
class BitCursor
{
public:
  // bitlen < 0 means all bits of the payload, CSSR data from L6 frames is not byte aligned
  explicit BitCursor(std::basic_string_view<uint8_t> payload, int pos=0, int bitlen=-1)
    : d_payload(payload), d_pos(pos), d_bitlen(bitlen < 0 ? 8*payload.size() : bitlen)
  {
    if(d_bitlen > 8*(int)payload.size())
      throw std::out_of_range("BitCursor length of "+std::to_string(d_bitlen)+" bits exceeds payload");
    if(pos < 0 || pos > bitLength())
      throw std::out_of_range("BitCursor start position "+std::to_string(pos)+" outside payload of "+std::to_string(bitLength())+" bits");
  }

  unsigned int getbitu(int len);
  int getbits(int len);
  int getbitsm(int len);                // sign-magnitude
  uint64_t getbitu64(int len);
  std::basic_string<uint8_t> getBytes(int len);

  void skip(int len)
  {
    need(len);
    d_pos += len;
  }

  int pos() const { return d_pos; }
  int bitLength() const { return d_bitlen; }
  int remaining() const { return bitLength() - d_pos; }
  bool has(int len) const { return len >= 0 && remaining() >= len; }

  // true if no bit is set in the whole bit range, which is what zero padding looks like
  bool isNull() const;

  std::basic_string_view<uint8_t> payload() const { return d_payload; }
  
private:
  void need(int len) const
  {
    if(!has(len))
      throw InsufficientData{d_pos, len, remaining()};
  }
  std::basic_string_view<uint8_t> d_payload;
  int d_pos;
  int d_bitlen;
};
