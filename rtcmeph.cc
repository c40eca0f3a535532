#include "rtcmeph.hh"
#include "cssrmon.hh"
#include "fieldcodec.hh"
#include "fmt/format.h"
#include "fmt/printf.h"

using namespace std;

void GPSEphemeris::parse(BitCursor& bc)
{
  sv = bc.getbitu(6);      // DF009
  wn = bc.getbitu(10);
  sva = bc.getbitu(4);
  l2code = bc.getbitu(2);
  idot = bc.getbits(14);
  iode = bc.getbitu(8);
  t0c = bc.getbitu(16);
  af2 = bc.getbits(8);
  af1 = bc.getbits(16);
  af0 = bc.getbits(22);
  iodc = bc.getbitu(10);
  crs = bc.getbits(16);
  deltan = bc.getbits(16);
  m0 = bc.getbits(32);
  cuc = bc.getbits(16);
  e = bc.getbitu(32);
  cus = bc.getbits(16);
  sqrtA = bc.getbitu(32);
  t0e = bc.getbitu(16);
  cic = bc.getbits(16);
  omega0 = bc.getbits(32);
  cis = bc.getbits(16);
  i0 = bc.getbits(32);
  crc = bc.getbits(16);
  omega = bc.getbits(32);
  omegadot = bc.getbits(24);
  tgd = bc.getbits(8);
  svh = bc.getbitu(6);
  l2p = bc.getbitu(1);
  fitInterval = bc.getbitu(1);  // DF137
}

void QZSSEphemeris::parse(BitCursor& bc)
{
  sv = bc.getbitu(4);      // DF429
  t0c = bc.getbitu(16);
  af2 = bc.getbits(8);
  af1 = bc.getbits(16);
  af0 = bc.getbits(22);
  iode = bc.getbitu(8);
  crs = bc.getbits(16);
  deltan = bc.getbits(16);
  m0 = bc.getbits(32);
  cuc = bc.getbits(16);
  e = bc.getbitu(32);
  cus = bc.getbits(16);
  sqrtA = bc.getbitu(32);
  t0e = bc.getbitu(16);
  cic = bc.getbits(16);
  omega0 = bc.getbits(32);
  cis = bc.getbits(16);
  i0 = bc.getbits(32);
  crc = bc.getbits(16);
  omega = bc.getbits(32);
  omegadot = bc.getbits(24);
  i0dot = bc.getbits(14);
  idot = i0dot;
  l2code = bc.getbitu(2);
  wn = bc.getbitu(10);
  ura = bc.getbitu(4);
  svh = bc.getbitu(6);
  tgd = bc.getbits(8);
  iodc = bc.getbitu(10);
  fitInterval = bc.getbitu(1);  // DF457
}

void BeidouEphemeris::parse(BitCursor& bc)
{
  sv = bc.getbitu(6);      // DF488
  wn = bc.getbitu(13);
  urai = bc.getbitu(4);
  idot = bc.getbits(14);
  aode = bc.getbitu(5);
  t0c = bc.getbitu(17);
  af2 = bc.getbits(11);
  af1 = bc.getbits(22);
  af0 = bc.getbits(24);
  aodc = bc.getbitu(5);
  crs = bc.getbits(18);
  deltan = bc.getbits(16);
  m0 = bc.getbits(32);
  cuc = bc.getbits(18);
  e = bc.getbitu(32);
  cus = bc.getbits(18);
  sqrtA = bc.getbitu(32);
  t0e = bc.getbitu(17);
  cic = bc.getbits(18);
  omega0 = bc.getbits(32);
  cis = bc.getbits(18);
  i0 = bc.getbits(32);
  crc = bc.getbits(18);
  omega = bc.getbits(32);
  omegadot = bc.getbits(24);
  tgd1 = bc.getbits(10);
  tgd2 = bc.getbits(10);
  sath1 = bc.getbitu(1);   // DF515
}

void NavICEphemeris::parse(BitCursor& bc)
{
  sv = bc.getbitu(6);      // DF516
  wn = bc.getbitu(10);
  af0 = bc.getbits(22);
  af1 = bc.getbits(16);
  af2 = bc.getbits(8);
  ura = bc.getbitu(4);
  t0c = bc.getbitu(16);
  tgd = bc.getbits(8);
  deltan = bc.getbits(22);
  iodec = bc.getbitu(8);
  bc.skip(10);             // reserved, DF526
  l5flag = bc.getbitu(1);
  sflag = bc.getbitu(1);
  cuc = bc.getbits(15);
  cus = bc.getbits(15);
  cic = bc.getbits(15);
  cis = bc.getbits(15);
  crc = bc.getbits(15);
  crs = bc.getbits(15);
  idot = bc.getbits(14);
  m0 = bc.getbits(32);
  t0e = bc.getbitu(16);
  e = bc.getbitu(32);
  sqrtA = bc.getbitu(32);
  omega0 = bc.getbits(32);
  omega = bc.getbits(32);
  omegadot = bc.getbits(22);
  i0 = bc.getbits(32);
  bc.skip(4);              // spare, DF544 & DF545
}

void GalileoEphemeris::parse(BitCursor& bc, GalileoNav nav)
{
  if(nav != GalileoNav::FNAV && nav != GalileoNav::INAV)
    throw UnknownEnumeration("unknown Galileo navigation message type", (int)nav);
  navtype = nav;
  sv = bc.getbitu(6);      // DF252
  wn = bc.getbitu(12);
  iodnav = bc.getbitu(10);
  sisa = bc.getbitu(8);
  idot = bc.getbits(14);
  t0c = bc.getbitu(14);
  af2 = bc.getbits(6);
  af1 = bc.getbits(21);
  af0 = bc.getbits(31);
  crs = bc.getbits(16);
  deltan = bc.getbits(16);
  m0 = bc.getbits(32);
  cuc = bc.getbits(16);
  e = bc.getbitu(32);
  cus = bc.getbits(16);
  sqrtA = bc.getbitu(32);
  t0e = bc.getbitu(14);
  cic = bc.getbits(16);
  omega0 = bc.getbits(32);
  cis = bc.getbits(16);
  i0 = bc.getbits(32);
  crc = bc.getbits(16);
  omega = bc.getbits(32);
  omegadot = bc.getbits(24);
  BGDE1E5a = bc.getbits(10);
  if(navtype == GalileoNav::FNAV) {
    e5ahs = bc.getbitu(2);   // DF314
    e5advs = bc.getbitu(1);  // DF315
    bc.skip(7);
  }
  else {
    BGDE1E5b = bc.getbits(10);
    e5bhs = bc.getbitu(2);   // DF316
    e5bdvs = bc.getbitu(1);
    e1bhs = bc.getbitu(2);   // DF287
    e1bdvs = bc.getbitu(1);
    bc.skip(2);
  }
}

void GlonassEphemeris::parse(BitCursor& bc)
{
  sv = bc.getbitu(6);      // DF038
  freqChannel = bc.getbitu(5);
  almHealth = bc.getbitu(1);
  almHealthAvailable = bc.getbitu(1);
  P1 = bc.getbitu(2);
  hour = bc.getbitu(5);    // t_k, DF107
  minute = bc.getbitu(6);
  seconds = 30 * bc.getbitu(1);
  Bn = bc.getbitu(1);      // MSB of B_n, the health bit
  P2 = bc.getbitu(1);
  Tb = bc.getbitu(7);
  dx = bc.getbitsm(24);
  x = bc.getbitsm(27);
  ddx = bc.getbitsm(5);
  dy = bc.getbitsm(24);
  y = bc.getbitsm(27);
  ddy = bc.getbitsm(5);
  dz = bc.getbitsm(24);
  z = bc.getbitsm(27);
  ddz = bc.getbitsm(5);
  P3 = bc.getbitu(1);
  gamman = bc.getbitsm(11);
  P = bc.getbitu(2);
  ln3 = bc.getbitu(1);
  taun = bc.getbitsm(22);
  deltaTaun = bc.getbitsm(5);
  En = bc.getbitu(5);
  P4 = bc.getbitu(1);
  FT = bc.getbitu(4);
  NT = bc.getbitu(11);
  M = bc.getbitu(2);
  additional = bc.getbitu(1);
  NA = bc.getbitu(11);
  tauc = bc.getbitsm(32);
  n4 = bc.getbitu(5);
  taugps = bc.getbitsm(22);
  ln5 = bc.getbitu(1);
  bc.skip(7);
}

vector<HealthNote> getHealth(const GPSEphemeris& eph)
{
  vector<HealthNote> ret;
  if(eph.svh)
    ret.push_back({fmt::sprintf("unhealthy(%02x)", eph.svh), true});
  return ret;
}

/* QZSS health is 6 bits: L1, L1C/A, L2C, L5, L1C, L1C/B. The satellite is
   unhealthy if L1, L2C, L5 or L1C is flagged (IS-QZSS-PNT 4.1.2.3). L1C/A and L1C/B
   double as 'this one is being transmitted' when L1 is fine. */
vector<HealthNote> getHealth(const QZSSEphemeris& eph)
{
  vector<HealthNote> ret;
  if(eph.svhBit(0) || eph.svhBit(2) || eph.svhBit(3) || eph.svhBit(4)) {
    static const char* names[6]={"", "L1C/A", "L2C", "L5", "L1C", "L1C/B"};
    string unhealthy;
    for(int n = 1; n < 6; ++n) {
      if(eph.svhBit(n)) {
        if(!unhealthy.empty())
          unhealthy += ' ';
        unhealthy += names[n];
      }
    }
    ret.push_back({"unhealthy ("+unhealthy+")", true});
  }
  else {
    if(eph.svhBit(1))
      ret.push_back({"L1C/B", false});
    if(eph.svhBit(5))
      ret.push_back({"L1C/A", false});
  }
  return ret;
}

vector<HealthNote> getHealth(const BeidouEphemeris& eph)
{
  vector<HealthNote> ret;
  if(eph.sath1)
    ret.push_back({"unhealthy", true});
  return ret;
}

vector<HealthNote> getHealth(const NavICEphemeris& eph)
{
  vector<HealthNote> ret;
  if(eph.l5flag || eph.sflag) {
    string what="unhealthy";
    if(eph.l5flag)
      what += " L5";
    if(eph.sflag)
      what += " S";
    ret.push_back({what, true});
  }
  return ret;
}

vector<HealthNote> getHealth(const GalileoEphemeris& eph)
{
  vector<HealthNote> ret;
  if(eph.navtype == GalileoNav::FNAV) {
    if(eph.e5ahs)
      ret.push_back({fmt::sprintf("unhealthy OS (%d)", eph.e5ahs), true});
    if(eph.e5advs)
      ret.push_back({"invalid OS", true});
  }
  else {
    if(eph.e5bhs)
      ret.push_back({fmt::sprintf("unhealthy E5b (%d)", eph.e5bhs), true});
    if(eph.e5bdvs)
      ret.push_back({"invalid E5b", true});
    if(eph.e1bhs)
      ret.push_back({fmt::sprintf("unhealthy E1b (%d)", eph.e1bhs), true});
    if(eph.e1bdvs)
      ret.push_back({"invalid E1b", true});
  }
  return ret;
}

vector<HealthNote> getHealth(const GlonassEphemeris& eph)
{
  vector<HealthNote> ret;
  if(eph.Bn)
    ret.push_back({"unhealthy", true});
  return ret;
}

static string l2CodeName(int code)
{
  switch(code) {
  case 1: return "L2P";
  case 2: return "L2C/A";
  case 3: return "L2C";
  }
  return fmt::sprintf("unknown L2 code(%d)", code);
}

EphemerisResult decodeEphemeris(BitCursor& bc, char satsys, GalileoNav navtype)
{
  EphemerisResult ret;
  ret.satsys = satsys;
  if(satsys == 'G') {
    GPSEphemeris eph;
    eph.parse(bc);
    ret.trace = fmt::sprintf("G%02d WN=%d IODE=%-4d IODC=%-4d %s", eph.sv, eph.wn, eph.iode, eph.iodc, l2CodeName(eph.l2code));
    ret.accuracy = humanUra(eph.sva);
    ret.health = getHealth(eph);
    ret.record = eph;
  }
  else if(satsys == 'R') {
    GlonassEphemeris eph;
    eph.parse(bc);
    ret.trace = fmt::sprintf("R%02d f=%02d tk=%02d:%02d:%02d tb=%dmin", eph.sv, eph.freqChannel,
                             eph.hour, eph.minute, eph.seconds, eph.getTbMinutes());
    ret.accuracy = humanFt(eph.FT);
    // health from Bn, not from the almanac health bit DF104
    ret.health = getHealth(eph);
    ret.record = eph;
  }
  else if(satsys == 'E') {
    GalileoEphemeris eph;
    eph.parse(bc, navtype);
    ret.trace = fmt::sprintf("E%02d WN=%d IODnav=%d", eph.sv, eph.wn, eph.iodnav);
    ret.accuracy = humanSisa(eph.sisa);
    ret.health = getHealth(eph);
    ret.record = eph;
  }
  else if(satsys == 'J') {
    QZSSEphemeris eph;
    eph.parse(bc);
    ret.trace = fmt::sprintf("J%02d WN=%d IODE=%-4d IODC=%-4d", eph.sv, eph.wn, eph.iode, eph.iodc);
    ret.accuracy = humanUra(eph.ura);
    ret.health = getHealth(eph);
    ret.record = eph;
  }
  else if(satsys == 'C') {
    BeidouEphemeris eph;
    eph.parse(bc);
    ret.trace = fmt::sprintf("C%02d WN=%d AODE=%d", eph.sv, eph.wn, eph.aode);
    ret.accuracy = humanUra(eph.urai);
    ret.health = getHealth(eph);
    ret.record = eph;
  }
  else if(satsys == 'I') {
    NavICEphemeris eph;
    eph.parse(bc);
    ret.trace = fmt::sprintf("I%02d WN=%d IODEC=%-4d", eph.sv, eph.wn, eph.iodec);
    ret.accuracy = humanUra(eph.ura);
    ret.health = getHealth(eph);
    ret.record = eph;
  }
  else
    throw UnknownEnumeration(fmt::format("no ephemeris for satellite system '{}'", satsys), satsys);

  for(const auto& h : ret.health)
    ret.trace += " " + h.text;
  return ret;
}
