#include "doctest/doctest.h"
#include "has.hh"
#include "testbits.hh"

using namespace std;

static BitWriter& hasHeader(BitWriter& bw, int toh, bool mask, bool orbit, bool ckful, bool cksub, bool cbias, bool pbias, int maskId=2, int iodSet=7)
{
  return bw.u(12, toh).u(1, mask).u(1, orbit).u(1, ckful).u(1, cksub).u(1, cbias).u(1, pbias)
    .u(4, 0).u(5, maskId).u(5, iodSet);
}

// Galileo E01 and E02 with E1 B and E5a I+Q
static BitWriter& hasMask(BitWriter& bw)
{
  bw.u(4, 1);
  maskGNSS(bw, 2, {1, 2}, {0, 5});
  return bw.u(3, 0).u(6, 0);
}

static HASSession withMask()
{
  HASSession hs;
  BitWriter bw;
  hasHeader(bw, 100, true, false, false, false, false, false);
  hasMask(bw);
  auto msg = hs.decode(bw.view());
  REQUIRE(msg.status == DecodeStatus::Ok);
  REQUIRE(msg.mask);
  return hs;
}

TEST_CASE("has mask and orbit") {
  HASSession hs;
  BitWriter bw;
  hasHeader(bw, 100, true, true, false, false, false, false);
  hasMask(bw);
  int maskEnd = bw.pos;
  bw.u(4, 2);
  bw.u(10, 100).s(13, 40).s(12, -2048).s(12, 1);
  bw.u(10, 101).s(13, -4096).s(12, 0).s(12, 0);
  auto msg = hs.decode(bw.view());
  REQUIRE(msg.status == DecodeStatus::Ok);
  CHECK(msg.header.toh == 100);
  CHECK(msg.header.maskId == 2);
  CHECK(msg.header.iodSet == 7);
  CHECK(maskEnd == 32 + 4 + 61 + 3 + 6);
  CHECK(msg.bits == maskEnd + 4 + 2 * 47);
  REQUIRE(msg.mask);
  CHECK(msg.mask->gnss[0].signals == vector<string>({"E1 B", "E5a I+Q"}));
  REQUIRE(msg.orbit);
  CHECK(msg.orbit->validity == 15);
  REQUIRE(msg.orbit->sats.size() == 2);
  CHECK(msg.orbit->sats[0].iode == 100);
  CHECK(*msg.orbit->sats[0].radial == doctest::Approx(0.1));
  CHECK(!msg.orbit->sats[0].along);
  CHECK(*msg.orbit->sats[0].cross == doctest::Approx(0.008));
  CHECK(!msg.orbit->sats[1].radial);
  CHECK(hs.getMaskId() == 2);
  CHECK(msg.summary == "HAS toh=100 mask_id=2 iod_set=7 MASK ORBIT");
  CHECK(msg.trace.find("ORBIT validity_interval=15s (2)\n") != string::npos);
}

TEST_CASE("has corrections need their mask") {
  HASSession fresh;
  BitWriter bw;
  hasHeader(bw, 100, false, true, false, false, false, false);
  bw.u(4, 0).u(32, 0xffffffff);
  CHECK(fresh.decode(bw.view()).status == DecodeStatus::SequencingError);

  auto hs = withMask();
  BitWriter other;
  hasHeader(other, 100, false, true, false, false, false, false, 3);
  other.u(4, 0).u(32, 0xffffffff);
  CHECK(hs.decode(other.view()).status == DecodeStatus::SequencingError);
  CHECK(hs.getMask());
}

TEST_CASE("has clock full set") {
  auto hs = withMask();
  BitWriter bw;
  hasHeader(bw, 200, false, false, true, false, false, false);
  bw.u(4, 15).u(2, 1).s(13, 100).s(13, 4095);
  auto msg = hs.decode(bw.view());
  REQUIRE(msg.status == DecodeStatus::Ok);
  REQUIRE(msg.clockFull);
  CHECK(msg.clockFull->validity == 0);
  REQUIRE(msg.clockFull->sats.size() == 2);
  CHECK(msg.clockFull->sats[0].multiplier == 2);
  CHECK(*msg.clockFull->sats[0].c0 == doctest::Approx(0.5));
  CHECK(!msg.clockFull->sats[1].c0);
  CHECK(msg.clockFull->sats[1].doNotUse);
  CHECK(hs.getHeader().toh == 200);
}

TEST_CASE("has clock subset") {
  auto hs = withMask();
  BitWriter bw;
  hasHeader(bw, 200, false, false, false, true, false, false);
  bw.u(4, 0).u(4, 1).u(4, 2).u(2, 0).u(2, 0x1).s(13, -4096);
  auto msg = hs.decode(bw.view());
  REQUIRE(msg.status == DecodeStatus::Ok);
  REQUIRE(msg.clockSubset);
  REQUIRE(msg.clockSubset->sats.size() == 1);
  CHECK(msg.clockSubset->sats[0].id.sv == 2);
  CHECK(!msg.clockSubset->sats[0].c0);
  CHECK(!msg.clockSubset->sats[0].doNotUse);

  // GPS is not in the mask
  BitWriter gw;
  hasHeader(gw, 200, false, false, false, true, false, false);
  gw.u(4, 0).u(4, 1).u(4, 0).u(2, 0).u(2, 0x3).s(13, 1).s(13, 1);
  CHECK(hs.decode(gw.view()).status == DecodeStatus::UnknownEnumeration);
}

TEST_CASE("has biases") {
  auto hs = withMask();
  BitWriter bw;
  hasHeader(bw, 300, false, false, false, false, true, true);
  bw.u(4, 3);
  for(int n = 0; n < 4; ++n)
    bw.s(11, n == 2 ? -1024 : 10 * n);
  bw.u(4, 4);
  for(int n = 0; n < 4; ++n)
    bw.s(11, -5 * n).u(2, n);
  auto msg = hs.decode(bw.view());
  REQUIRE(msg.status == DecodeStatus::Ok);
  REQUIRE(msg.codeBias);
  CHECK(msg.codeBias->validity == 20);
  REQUIRE(msg.codeBias->cells.size() == 4);
  CHECK(*msg.codeBias->cells[1].bias == doctest::Approx(0.2));
  CHECK(msg.codeBias->cells[1].signal == "E5a I+Q");
  CHECK(!msg.codeBias->cells[2].bias);
  REQUIRE(msg.phaseBias);
  CHECK(msg.phaseBias->validity == 30);
  CHECK(*msg.phaseBias->cells[3].bias == doctest::Approx(-0.15));
  CHECK(msg.phaseBias->cells[3].discontinuity == 3);
  CHECK(msg.bits == 32 + 4 + 44 + 4 + 52);
}

TEST_CASE("has truncated and null") {
  auto hs = withMask();
  BitWriter bw;
  hasHeader(bw, 300, false, true, false, false, false, false);
  bw.u(4, 3).u(10, 1);
  CHECK(hs.decode(bw.view()).status == DecodeStatus::InsufficientData);
  CHECK(hs.decode(bw.view(), 31).status == DecodeStatus::InsufficientData);

  basic_string<uint8_t> zero(20, 0);
  CHECK(hs.decode(basic_string_view<uint8_t>(zero.c_str(), zero.size())).status == DecodeStatus::MalformedHeader);
  CHECK(hs.getStats().bnull == 160);

  BitWriter late;
  hasHeader(late, 3600, false, false, false, false, false, false);
  CHECK(hs.decode(late.view()).status == DecodeStatus::MalformedHeader);
}

TEST_CASE("has clock values") {
  auto cc = hasClockValue(-4096, 1);
  CHECK(!cc.c0);
  CHECK(!cc.doNotUse);
  cc = hasClockValue(4095, 3);
  CHECK(!cc.c0);
  CHECK(cc.doNotUse);
  cc = hasClockValue(-4095, 4);
  REQUIRE(cc.c0);
  CHECK(*cc.c0 == doctest::Approx(-4095 * 0.0025 * 4));
}
