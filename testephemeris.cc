#include "doctest/doctest.h"
#include "rtcmeph.hh"
#include "cssrmon.hh"
#include "testbits.hh"

using namespace std;

// RTCM 1019 with everything zero unless set
static BitWriter gpsEphemeris(int sv, int af0, int m0, int svh, int t0e=100, uint32_t e=0)
{
  BitWriter bw;
  bw.u(12, 1019);
  bw.u(6, sv).u(10, 100).u(4, 0).u(2, 1).s(14, 0).u(8, 45).u(16, 7).s(8, 0).s(16, 0).s(22, af0);
  bw.u(10, 45).s(16, 0).s(16, 0).s(32, m0).s(16, 0).u(32, e).s(16, 0).u(32, 2u << 19).u(16, t0e);
  bw.s(16, 0).s(32, 0).s(16, 0).s(32, 0).s(16, 0).s(32, 0).s(24, 0).s(8, 0).u(6, svh).u(1, 0).u(1, 0);
  return bw;
}

static BitWriter galileoEphemeris(GalileoNav nav, int e5bhs)
{
  BitWriter bw;
  bw.u(12, (int)nav);
  bw.u(6, 11).u(12, 1100).u(10, 77).u(8, 107).s(14, 0).u(14, 5).s(6, 0).s(21, 0).s(31, 0);
  bw.s(16, 0).s(16, 0).s(32, 0).s(16, 0).u(32, 0).s(16, 0).u(32, 0).u(14, 5);
  bw.s(16, 0).s(32, 0).s(16, 0).s(32, 0).s(16, 0).s(32, 0).s(24, 0).s(10, -2);
  if(nav == GalileoNav::FNAV)
    bw.u(2, 0).u(1, 0).u(7, 0);
  else
    bw.s(10, 3).u(2, e5bhs).u(1, 0).u(2, 0).u(1, 0).u(2, 0);
  return bw;
}

TEST_CASE("gps ephemeris scaling") {
  auto bw = gpsEphemeris(1, -1, -(1<<30), 0);
  CHECK(bw.pos == 488);
  BitCursor bc(bw.view());
  CHECK(bc.getbitu(12) == 1019);
  auto res = decodeEphemeris(bc, 'G');
  CHECK(bc.pos() == 488);
  CHECK(res.satsys == 'G');
  REQUIRE(std::holds_alternative<GPSEphemeris>(res.record));
  const auto& eph = std::get<GPSEphemeris>(res.record);
  CHECK(eph.sv == 1);
  CHECK(eph.wn == 100);
  CHECK(eph.iode == 45);
  // af0 raw -1 is a tiny valid number, not 'invalid'
  CHECK(eph.af0 == -1);
  CHECK(eph.getAf0() == ldexp(-1.0, -34));
  CHECK(eph.getM0() == doctest::Approx(-M_PI / 2));
  CHECK(eph.getSqrtA() == doctest::Approx(2.0));
  CHECK(eph.getT0e() == 6000);
  CHECK(eph.getIOD() == 45);
  CHECK(!res.unhealthy());
  CHECK(res.trace == "G01 WN=100 IODE=45   IODC=45   L2P");
  CHECK(res.accuracy == "200 cm");
}

TEST_CASE("eccentricity scaling") {
  // the 32 bit field tops out just below 0.5
  auto bw = gpsEphemeris(1, 0, 0, 0, 100, 0xffffffff);
  BitCursor bc(bw.view());
  bc.skip(12);
  auto eph = std::get<GPSEphemeris>(decodeEphemeris(bc, 'G').record);
  CHECK(eph.e == 0xffffffff);
  CHECK(eph.getE() == ldexp(4294967295.0, -33));
  CHECK(eph.getE() == doctest::Approx(0.5));
  CHECK(eph.getSqrtA() == doctest::Approx(2.0));
  CHECK(eph.getCus() == 0.0);

  bw = gpsEphemeris(1, 0, 0, 0, 100, 1u << 31);
  BitCursor bc2(bw.view());
  bc2.skip(12);
  eph = std::get<GPSEphemeris>(decodeEphemeris(bc2, 'G').record);
  CHECK(eph.getE() == 0.25);
  CHECK(eph.getM0() == 0.0);
}

TEST_CASE("gps health") {
  auto bw = gpsEphemeris(7, 0, 0, 0x3f);
  BitCursor bc(bw.view());
  bc.skip(12);
  auto res = decodeEphemeris(bc, 'G');
  CHECK(res.unhealthy());
  REQUIRE(res.health.size() == 1);
  CHECK(res.health[0].text == "unhealthy(3f)");
}

TEST_CASE("truncated ephemeris") {
  auto bw = gpsEphemeris(1, 0, 0, 0);
  BitCursor bc(bw.view(), 0, 400);
  bc.skip(12);
  CHECK_THROWS_AS(decodeEphemeris(bc, 'G'), InsufficientData);

  BitCursor bc2(bw.view());
  bc2.skip(12);
  CHECK_THROWS_AS(decodeEphemeris(bc2, 'X'), UnknownEnumeration);
}

TEST_CASE("galileo navigation types") {
  auto fnav = galileoEphemeris(GalileoNav::FNAV, 0);
  auto inav = galileoEphemeris(GalileoNav::INAV, 1);
  CHECK(fnav.pos == 496);
  CHECK(inav.pos == 504);

  BitCursor bc(fnav.view());
  bc.skip(12);
  auto res = decodeEphemeris(bc, 'E', GalileoNav::FNAV);
  CHECK(bc.pos() == 496);
  const auto& feph = std::get<GalileoEphemeris>(res.record);
  CHECK(feph.navtype == GalileoNav::FNAV);
  CHECK(feph.iodnav == 77);
  CHECK(feph.getBGDE1E5a() == ldexp(-2.0, -32));
  CHECK(feph.getT0e() == 300);
  CHECK(!res.unhealthy());
  CHECK(res.trace == "E11 WN=1100 IODnav=77");
  CHECK(res.accuracy == "312 cm");

  BitCursor bc2(inav.view());
  bc2.skip(12);
  res = decodeEphemeris(bc2, 'E', GalileoNav::INAV);
  CHECK(bc2.pos() == 504);
  const auto& ieph = std::get<GalileoEphemeris>(res.record);
  CHECK(ieph.BGDE1E5b == 3);
  CHECK(ieph.e5bhs == 1);
  CHECK(res.unhealthy());

  BitCursor bc3(inav.view());
  bc3.skip(12);
  CHECK_THROWS_AS(decodeEphemeris(bc3, 'E', (GalileoNav)1047), UnknownEnumeration);
}

TEST_CASE("glonass state vector") {
  BitWriter bw;
  bw.u(12, 1020);
  bw.u(6, 3).u(5, 8).u(1, 0).u(1, 0).u(2, 0);
  bw.u(5, 12).u(6, 34).u(1, 1);           // tk
  bw.u(1, 1).u(1, 0).u(7, 10);            // Bn, P2, tb
  bw.sm(24, -1024).sm(27, -2048).sm(5, 1);  // x
  bw.sm(24, 0).sm(27, 4096).sm(5, 0);
  bw.sm(24, 0).sm(27, 0).sm(5, -1);
  bw.u(1, 0).sm(11, -1).u(2, 0).u(1, 0).sm(22, 1024).sm(5, 0).u(5, 0).u(1, 0).u(4, 0).u(11, 0);
  bw.u(2, 0).u(1, 0).u(11, 0).sm(32, 0).u(5, 0).sm(22, 0).u(1, 0).u(7, 0);
  CHECK(bw.pos == 360);

  BitCursor bc(bw.view());
  bc.skip(12);
  auto res = decodeEphemeris(bc, 'R');
  CHECK(bc.pos() == 360);
  const auto& eph = std::get<GlonassEphemeris>(res.record);
  CHECK(eph.sv == 3);
  CHECK(eph.x == -2048);
  CHECK(eph.getX() == doctest::Approx(-1000.0));
  CHECK(eph.getY() == doctest::Approx(2000.0));
  CHECK(eph.getdX() == doctest::Approx(-1000.0 * ldexp(1.0, -10)));
  CHECK(eph.ddz == -1);
  CHECK(eph.getGamman() == ldexp(-1.0, -40));
  CHECK(eph.getTaun() == ldexp(1.0, -20));
  CHECK(eph.getTbMinutes() == 150);
  CHECK(res.unhealthy());
  CHECK(res.trace == "R03 f=08 tk=12:34:30 tb=150min unhealthy");
}

static QZSSEphemeris qzssWithHealth(int svh)
{
  BitWriter bw;
  bw.u(4, 2).u(16, 0).s(8, 0).s(16, 0).s(22, 0).u(8, 9);
  bw.s(16, 0).s(16, 0).s(32, 0).s(16, 0).u(32, 0).s(16, 0).u(32, 0).u(16, 0);
  bw.s(16, 0).s(32, 0).s(16, 0).s(32, 0).s(16, 0).s(32, 0).s(24, 0).s(14, 0);
  bw.u(2, 0).u(10, 200).u(4, 0).u(6, svh).s(8, 0).u(10, 9).u(1, 0);
  BitCursor bc(bw.view());
  QZSSEphemeris eph;
  eph.parse(bc);
  CHECK(bc.pos() == 485 - 12);
  return eph;
}

TEST_CASE("qzss health") {
  auto eph = qzssWithHealth(0);
  CHECK(getHealth(eph).empty());
  CHECK(eph.wn == 200);

  // L1 flagged together with L5
  eph = qzssWithHealth(0x24);
  auto health = getHealth(eph);
  REQUIRE(health.size() == 1);
  CHECK(health[0].unhealthy);
  CHECK(health[0].text == "unhealthy (L5)");

  // L1 fine: L1C/B and L1C/A say what is transmitted
  eph = qzssWithHealth(0x11);
  health = getHealth(eph);
  REQUIRE(health.size() == 2);
  CHECK(!health[0].unhealthy);
  CHECK(health[0].text == "L1C/B");
  CHECK(health[1].text == "L1C/A");
}

TEST_CASE("beidou and navic") {
  BitWriter bw;
  bw.u(6, 21).u(13, 900).u(4, 0).s(14, 0).u(5, 3).u(17, 0).s(11, 0).s(22, 0).s(24, -5).u(5, 3);
  bw.s(18, 0).s(16, 0).s(32, 0).s(18, 0).u(32, 0).s(18, 0).u(32, 0).u(17, 0);
  bw.s(18, -7).s(32, 0).s(18, 0).s(32, 0).s(18, 0).s(32, 0).s(24, 0).s(10, -20).s(10, 0).u(1, 1);
  BitCursor bc(bw.view());
  auto res = decodeEphemeris(bc, 'C');
  CHECK(bc.pos() == 511 - 12);
  const auto& beph = std::get<BeidouEphemeris>(res.record);
  CHECK(beph.cic == -7);
  CHECK(beph.af0 == -5);
  CHECK(beph.getTgd1() == doctest::Approx(-2e-9));
  CHECK(res.unhealthy());
  CHECK(res.trace == "C21 WN=900 AODE=3 unhealthy");

  BitWriter nw;
  nw.u(6, 4).u(10, 500).s(22, 0).s(16, 0).s(8, 0).u(4, 0).u(16, 0).s(8, 0).s(22, 0).u(8, 12).u(10, 0).u(1, 0).u(1, 1);
  nw.s(15, 0).s(15, 0).s(15, 0).s(15, 0).s(15, 0).s(15, 0).s(14, 0).s(32, 0).u(16, 0).u(32, 0).u(32, 0);
  nw.s(32, 0).s(32, 0).s(22, 0).s(32, 0).u(4, 0);
  BitCursor nbc(nw.view());
  res = decodeEphemeris(nbc, 'I');
  CHECK(nbc.pos() == nw.pos);
  CHECK(std::get<NavICEphemeris>(res.record).iodec == 12);
  CHECK(res.unhealthy());
  CHECK(res.trace == "I04 WN=500 IODEC=12   unhealthy S");
}
