#include "rtcm.hh"
#include "bits.hh"
#include <iostream>
#include <vector>
#include "fmt/format.h"

using namespace std;

bool RTCMReader::get(RTCMFrame& rf)
{
  for(;;) {
    int c;
    while( ((c=fgetc(d_fp)) != -1) && c != 211) {
      d_skipped++;
      continue;
    }

    if(c != 211)
      return false;

    // 6 bits reserved, 10 bits of size
    unsigned char buffer[3 + 1023 + 3];
    buffer[0] = c;
    if(fread((char*)buffer + 1, 1, 2, d_fp) != 2)
      return false;

    int size = getbitu(buffer, 14, 10);
    if((int)fread((char*)buffer + 3, 1, size + 3, d_fp) != size + 3)
      return false;

    unsigned int crc = getbitu(buffer, (3 + size) * 8, 24);
    if(rtk_crc24q(buffer, 3 + size) != crc) {
      d_crcErrors++;
      continue;
    }
    rf.payload.assign((const char*)buffer + 3, size);
    return true;
  }
}

char ephemerisSatsys(int msgnum)
{
  switch(msgnum) {
  case 1019: return 'G';
  case 1020: return 'R';
  case 1041: return 'I';
  case 1042: return 'C';
  case 1044: return 'J';
  case 1045:
  case 1046: return 'E';
  }
  return 0;
}

RTCMDecode RTCMDispatcher::decode(std::basic_string_view<uint8_t> payload)
{
  RTCMDecode ret;
  if(payload.size() < 2) {
    ret.status = DecodeStatus::InsufficientData;
    ret.reason = fmt::format("RTCM payload of {} bytes has no message number", payload.size());
    return ret;
  }
  BitCursor bc(payload);
  ret.msgnum = bc.getbitu(12);

  char satsys;
  SSRKind kind;
  if(ret.msgnum == CSSRSession::c_msgnum) {
    CSSRMessage cm = d_cssr.decode(payload);
    ret.status = cm.status;
    ret.reason = cm.reason;
    ret.summary = cm.summary;
    ret.trace = cm.trace;
    ret.stats = cm.stats;
    ret.cssr = cm;
    return ret;
  }
  try {
    if(char eph = ephemerisSatsys(ret.msgnum)) {
      ret.eph = decodeEphemeris(bc, eph, ret.msgnum == 1045 ? GalileoNav::FNAV : GalileoNav::INAV);
      ret.summary = fmt::format("RTCM {} {} ephemeris", ret.msgnum, eph);
      ret.trace = ret.eph->trace + "\n";
    }
    else if(ssrMessageType(ret.msgnum, satsys, kind)) {
      SSRMessage sm;
      BitCursor sbc(payload);
      sm.parse(sbc);
      ret.summary = sm.summary();
      ret.trace = sm.trace();
      ret.ssr = sm;
    }
    else {
      ret.status = DecodeStatus::Unsupported;
      ret.reason = fmt::format("no decoder for RTCM message {}", ret.msgnum);
    }
  }
  catch(InsufficientData& id) {
    ret.status = DecodeStatus::InsufficientData;
    ret.reason = fmt::format("RTCM {}: needed {} bits at position {}, {} left", ret.msgnum, id.wanted, id.pos, id.available);
    ret.eph.reset();
    ret.trace.clear();
  }
  catch(UnknownEnumeration& ue) {
    ret.status = DecodeStatus::UnknownEnumeration;
    ret.reason = fmt::format("RTCM {}: {}", ret.msgnum, ue.what());
    ret.eph.reset();
    ret.trace.clear();
  }
  return ret;
}
