#pragma once
#include <string>
#include <string_view>
#include <optional>
#include <stdio.h>
#include "cssrmon.hh"
#include "rtcmeph.hh"
#include "ssr.hh"
#include "cssr.hh"

struct RTCMFrame
{
  std::string payload;   // without preamble, length and CRC

  std::basic_string_view<uint8_t> bytes() const
  {
    return std::basic_string_view<uint8_t>((const uint8_t*)payload.c_str(), payload.size());
  }
};

/* Reads RTCM3 frames: 0xD3, 6 bits reserved, 10 bits length, payload, 24 bits CRC-24Q.
   Frames with a bad CRC are skipped and counted, after which we hunt for the next preamble */
class RTCMReader
{
public:
  explicit RTCMReader(int fd) : d_fp(fdopen(fd, "r")) {}
  explicit RTCMReader(FILE* fp) : d_fp(fp) {}
  bool get(RTCMFrame& rf);

  int d_skipped{0};     // bytes before a preamble
  int d_crcErrors{0};
private:
  FILE* d_fp;
};

// the outcome of one RTCM payload, only the member for its message family is set
struct RTCMDecode
{
  int msgnum{0};
  DecodeStatus status{DecodeStatus::Ok};
  std::string reason;
  std::string summary;
  std::string trace;
  std::string stats;
  std::optional<EphemerisResult> eph;
  std::optional<SSRMessage> ssr;
  std::optional<CSSRMessage> cssr;
};

/* Maps message numbers to decoders: 1019/1020/1041/1042/1044/1045/1046 ephemeris,
   SSR blocks 1057-1068 and 1240-1263, 4073 Compact SSR. One per stream, since it
   carries the CSSR mask. */
class RTCMDispatcher
{
public:
  explicit RTCMDispatcher(bool stats=false) : d_cssr(stats) {}
  RTCMDecode decode(std::basic_string_view<uint8_t> payload);
  const CSSRSession& cssr() const { return d_cssr; }

private:
  CSSRSession d_cssr;
};

// ephemeris message number to satellite system, 0 if it is not one
char ephemerisSatsys(int msgnum);
