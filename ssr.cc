#include "ssr.hh"
#include "fieldcodec.hh"
#include "fmt/format.h"
#include "fmt/printf.h"

using namespace std;

bool ssrMessageType(int type, char& satsys, SSRKind& kind)
{
  static const struct { int base; char satsys; } blocks[]={
    {1057, 'G'}, {1063, 'R'}, {1240, 'E'}, {1246, 'J'}, {1252, 'S'}, {1258, 'C'}};
  for(const auto& b : blocks) {
    if(type >= b.base && type < b.base + 6) {
      satsys = b.satsys;
      kind = (SSRKind)(type - b.base);
      return true;
    }
  }
  return false;
}

/* 1057 (GPS), 1240 (Galileo) and friends
   0    12 bits message number
   12   20 bits GNSS epoch time (17 bits of GLONASS time of day)
   32   4 bits SSR update interval
   36   1 bit multiple message indicator
   37   1 bit Satellite Reference Datum (0: ITRF, 1: regional), orbit and combined only
   38   4 bit (IOD SSR)
   42   16 bits SSR provider ID
   58   4 bits SSR solution ID
   62   6 bits number of satellites, 4 for QZSS
*/
void SSRMessage::parseHeader(BitCursor& bc)
{
  type = bc.getbitu(12);
  if(!ssrMessageType(type, satsys, kind))
    throw UnknownEnumeration("not an SSR message number", type);
  sow = bc.getbitu(satsys == 'R' ? 17 : 20);
  udi = bc.getbitu(4);
  mmi = bc.getbitu(1);
  if(kind == SSRKind::Orbit || kind == SSRKind::Combined)
    reference = bc.getbitu(1);
  ssrIOD = bc.getbitu(4);
  ssrProvider = bc.getbitu(16);
  ssrSolution = bc.getbitu(4);
  numSats = bc.getbitu(satsys == 'J' ? 4 : 6);
}

SatID SSRMessage::getSatID(BitCursor& bc) const
{
  SatID id;
  id.gnss = satsys;
  if(satsys == 'J')
    id.sv = bc.getbitu(4);
  else if(satsys == 'R')
    id.sv = bc.getbitu(5);
  else
    id.sv = bc.getbitu(6);
  return id;
}

/*
   0   6 bits sv (5 GLONASS, 4 QZSS)
   6   10 bits IODE nav                      / 8 for the others
   16   22 bits delta radial (0.1mm)
   38   20 bits along track (0.4mm)
   58   20 bits cross track (0.4mm)
   78   21 bits dot delta radial (0.001 mm/s)
   99   19 bits dot delta along (0.004 mm/s)
   118  19 bits dot delta cross-track (0.004 mm/s)
*/
SSRMessage::EphemerisDelta SSRMessage::getEphemerisDelta(BitCursor& bc, const SatID& id) const
{
  EphemerisDelta ed;
  ed.id = id;
  ed.iod = bc.getbitu(satsys == 'E' ? 10 : 8);
  ed.radial = bc.getbits(22) * 0.1;
  ed.along = bc.getbits(20) * 0.4;
  ed.cross = bc.getbits(20) * 0.4;

  ed.dradial = bc.getbits(21) * 0.001;
  ed.dalong = bc.getbits(19) * 0.004;
  ed.dcross = bc.getbits(19) * 0.004;
  ed.sow = sow;
  ed.udi = udi;
  return ed;
}

/*
   22 bits dclk[0] 1e-4 meter // 0.1 mm
   21 bits dclk[1] 1e-6 meter/s // 0.001 mm/s
   27 bits dclk[2] 2e-8 meter // 0.0002mm/s^2

   Reference time is Epoch Time + 0.5* SSR update interval, which can be zero.
*/
SSRMessage::ClockDelta SSRMessage::getClockDelta(BitCursor& bc, const SatID& id) const
{
  ClockDelta cd;
  cd.id = id;
  cd.sow = sow;
  cd.udi = udi;
  cd.dclock0 = bc.getbits(22)*1e-4;
  cd.dclock1 = bc.getbits(21)*1e-6;
  cd.dclock2 = bc.getbits(27)*2e-8;
  return cd;
}

void SSRMessage::parse(BitCursor& bc)
{
  d_ephs.clear();
  d_clocks.clear();
  d_dcbs.clear();
  d_uras.clear();
  d_hrclocks.clear();

  parseHeader(bc);
  for(int n = 0; n < numSats; ++n) {
    SatID id = getSatID(bc);
    switch(kind) {
    case SSRKind::Orbit:
      d_ephs.push_back(getEphemerisDelta(bc, id));
      break;
    case SSRKind::Clock:
      d_clocks.push_back(getClockDelta(bc, id));
      break;
    case SSRKind::Combined: {
      EphemerisDelta ed = getEphemerisDelta(bc, id);
      ClockDelta cd = getClockDelta(bc, id);
      cd.iod = ed.iod;
      d_ephs.push_back(ed);
      d_clocks.push_back(cd);
      break;
    }
    case SSRKind::CodeBias: {
      int numdcbs = bc.getbitu(5);
      for(int m = 0 ; m < numdcbs; ++m) {
        CodeBiasDelta cb;
        cb.id = id;
        cb.signal = bc.getbitu(5);
        cb.bias = 0.01 * bc.getbits(14); // 0.01 meter
        d_dcbs.push_back(cb);
      }
      break;
    }
    case SSRKind::URA:
      d_uras.push_back({id, (int)bc.getbitu(6)});
      break;
    case SSRKind::HRClock:
      d_hrclocks.push_back({id, bc.getbits(22) * 1e-4});
      break;
    }
  }
}

static const char* kindName(SSRKind kind)
{
  switch(kind) {
  case SSRKind::Orbit:    return "SSR orbit";
  case SSRKind::Clock:    return "SSR clock";
  case SSRKind::CodeBias: return "SSR code bias";
  case SSRKind::Combined: return "SSR obt/clk";
  case SSRKind::URA:      return "SSR URA";
  case SSRKind::HRClock:  return "SSR hr clock";
  }
  return "SSR ?";
}

// signal indicator numbers only coincide with the CSSR mask names up to 15
static string ssrSignalName(char satsys, int signal)
{
  string ret;
  if(signal < 16)
    ret = signalName(satsys, signal);
  if(ret.empty())
    ret = "sig " + std::to_string(signal);
  return ret;
}

std::string SSRMessage::summary() const
{
  return fmt::format("RTCM {} {} nsat={} iod={}{}", type, kindName(kind), numSats, ssrIOD, mmi ? " cont." : "");
}

std::string SSRMessage::trace() const
{
  string ret;
  for(const auto& ed : d_ephs)
    ret += fmt::sprintf("%s IODE=%4d d_radial=%7.4fm d_along=%7.4fm d_cross=%7.4fm dot_d_radial=%7.4fm/s dot_d_along=%7.4fm/s dot_d_cross=%7.4fm/s\n",
                        makeSatIDName(ed.id), ed.iod, ed.radial/1000, ed.along/1000, ed.cross/1000,
                        ed.dradial/1000, ed.dalong/1000, ed.dcross/1000);
  for(const auto& cd : d_clocks)
    ret += fmt::sprintf("%s c0=%7.3fm c1=%7.3fm/s c2=%7.3fm/s^2\n", makeSatIDName(cd.id), cd.dclock0, cd.dclock1, cd.dclock2);
  for(const auto& cb : d_dcbs)
    ret += fmt::sprintf("%s %-13s code_bias=%7.3fm\n", makeSatIDName(cb.id), ssrSignalName(satsys, cb.signal), cb.bias);
  for(const auto& u : d_uras)
    ret += fmt::sprintf("%s ura=%02d (%s m)\n", makeSatIDName(u.id), u.ura, fmtUra(u.ura, 0, 4));
  for(const auto& hr : d_hrclocks)
    ret += fmt::sprintf("%s high_rate_clock=%7.3fm\n", makeSatIDName(hr.id), hr.dclock);
  return ret;
}
