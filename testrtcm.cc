#include "doctest/doctest.h"
#include "rtcm.hh"
#include "protoconv.hh"
#include "bits.hh"
#include "testbits.hh"
#include <stdio.h>

using namespace std;

static string makeFrame(const basic_string<uint8_t>& payload)
{
  basic_string<uint8_t> frame(3 + payload.size() + 3, 0);
  frame[0] = 0xd3;
  setbitu(&frame[0], 14, 10, payload.size());
  frame.replace(3, payload.size(), payload);
  setbitu(&frame[0], (3 + payload.size()) * 8, 24, rtk_crc24q(&frame[0], 3 + payload.size()));
  return string((const char*)frame.c_str(), frame.size());
}

TEST_CASE("crc24q") {
  const char* check = "123456789";
  CHECK(rtk_crc24q((const unsigned char*)check, 9) == 0xcde703);
}

TEST_CASE("rtcm framing") {
  basic_string<uint8_t> p1={0x3f, 0x90, 0x01};
  basic_string<uint8_t> p2={0xfe, 0x90, 0x02, 0x03};
  string bad = makeFrame(p1);
  bad[4] ^= 0x01;
  string stream = "junk" + makeFrame(p1) + bad + makeFrame(p2);

  FILE* fp = fmemopen((void*)stream.c_str(), stream.size(), "r");
  REQUIRE(fp);
  RTCMReader rr(fp);
  RTCMFrame rf;
  REQUIRE(rr.get(rf));
  CHECK(rf.payload == string("\x3f\x90\x01", 3));
  CHECK(rr.d_skipped == 4);
  REQUIRE(rr.get(rf));
  CHECK(rf.payload.size() == 4);
  CHECK(rr.d_crcErrors == 1);
  CHECK(rf.bytes()[0] == 0xfe);
  CHECK(!rr.get(rf));
  fclose(fp);
}

static BitWriter ssrHeader(int msgnum, int nsat, bool withDatum, int epochBits=20, int nsatBits=6)
{
  BitWriter bw;
  bw.u(12, msgnum).u(epochBits, 345600 % (1 << epochBits)).u(4, 2).u(1, 0);
  if(withDatum)
    bw.u(1, 0);
  return bw.u(4, 9).u(16, 1234).u(4, 1).u(nsatBits, nsat);
}

TEST_CASE("ssr message numbers") {
  char satsys;
  SSRKind kind;
  CHECK(ssrMessageType(1057, satsys, kind));
  CHECK(satsys == 'G');
  CHECK(kind == SSRKind::Orbit);
  CHECK(ssrMessageType(1068, satsys, kind));
  CHECK(satsys == 'R');
  CHECK(kind == SSRKind::HRClock);
  CHECK(ssrMessageType(1243, satsys, kind));
  CHECK(satsys == 'E');
  CHECK(kind == SSRKind::Combined);
  CHECK(ssrMessageType(1260, satsys, kind));
  CHECK(satsys == 'C');
  CHECK(!ssrMessageType(1069, satsys, kind));
  CHECK(!ssrMessageType(1019, satsys, kind));
}

TEST_CASE("ssr orbit") {
  auto bw = ssrHeader(1057, 1, true);
  CHECK(bw.pos == 68);
  bw.u(6, 12).u(8, 55).s(22, 10000).s(20, -2500).s(20, 2500).s(21, 1000).s(19, -250).s(19, 0);
  BitCursor bc(bw.view());
  SSRMessage sm;
  sm.parse(bc);
  CHECK(sm.type == 1057);
  CHECK(sm.sow == 345600);
  CHECK(sm.ssrIOD == 9);
  CHECK(sm.ssrProvider == 1234);
  REQUIRE(sm.d_ephs.size() == 1);
  const auto& ed = sm.d_ephs[0];
  CHECK(makeSatIDName(ed.id) == "G12");
  CHECK(ed.iod == 55);
  CHECK(ed.radial == doctest::Approx(1000.0));
  CHECK(ed.along == doctest::Approx(-1000.0));
  CHECK(ed.cross == doctest::Approx(1000.0));
  CHECK(ed.dradial == doctest::Approx(1.0));
  CHECK(ed.dalong == doctest::Approx(-1.0));
  CHECK(sm.summary() == "RTCM 1057 SSR orbit nsat=1 iod=9");
  CHECK(sm.trace().rfind("G12 IODE=  55 d_radial= 1.0000m d_along=-1.0000m d_cross= 1.0000m", 0) == 0);
}

TEST_CASE("ssr combined galileo") {
  auto bw = ssrHeader(1243, 1, true);
  bw.u(6, 3).u(10, 1000).s(22, 0).s(20, 0).s(20, 0).s(21, 0).s(19, 0).s(19, 0);
  bw.s(22, -10000).s(21, 500).s(27, 50);
  BitCursor bc(bw.view());
  SSRMessage sm;
  sm.parse(bc);
  CHECK(bc.pos() == 68 + 6 + 10 + 121 + 70);
  REQUIRE(sm.d_clocks.size() == 1);
  CHECK(sm.d_ephs[0].iod == 1000);
  CHECK(sm.d_clocks[0].iod == 1000);
  CHECK(sm.d_clocks[0].dclock0 == doctest::Approx(-1.0));
  CHECK(sm.d_clocks[0].dclock1 == doctest::Approx(5e-4));
  CHECK(sm.d_clocks[0].dclock2 == doctest::Approx(1e-6));
}

TEST_CASE("ssr system specific widths") {
  // QZSS: 4 bit satellite count and id
  auto bw = ssrHeader(1247, 2, false, 20, 4);
  bw.u(4, 1).s(22, 1).s(21, 0).s(27, 0);
  bw.u(4, 7).s(22, 2).s(21, 0).s(27, 0);
  BitCursor bc(bw.view());
  SSRMessage sm;
  sm.parse(bc);
  REQUIRE(sm.d_clocks.size() == 2);
  CHECK(makeSatIDName(sm.d_clocks[1].id) == "J07");

  // GLONASS: 17 bit epoch, 5 bit id
  auto gw = ssrHeader(1068, 1, false, 17);
  gw.u(5, 24).s(22, -1);
  BitCursor gbc(gw.view());
  sm.parse(gbc);
  CHECK(sm.sow == 345600 % (1 << 17));
  REQUIRE(sm.d_hrclocks.size() == 1);
  CHECK(sm.d_clocks.empty());
  CHECK(makeSatIDName(sm.d_hrclocks[0].id) == "R24");
  CHECK(sm.d_hrclocks[0].dclock == doctest::Approx(-1e-4));
}

TEST_CASE("ssr code bias and ura") {
  auto bw = ssrHeader(1059, 1, false);
  bw.u(6, 5).u(5, 2).u(5, 0).s(14, -150).u(5, 11).s(14, 20);
  BitCursor bc(bw.view());
  SSRMessage sm;
  sm.parse(bc);
  REQUIRE(sm.d_dcbs.size() == 2);
  CHECK(sm.d_dcbs[0].signal == 0);
  CHECK(sm.d_dcbs[0].bias == doctest::Approx(-1.5));
  CHECK(sm.d_dcbs[1].signal == 11);

  auto uw = ssrHeader(1061, 1, false);
  uw.u(6, 5).u(6, 9);
  BitCursor ubc(uw.view());
  sm.parse(ubc);
  REQUIRE(sm.d_uras.size() == 1);
  CHECK(sm.d_uras[0].ura == 9);
  CHECK(sm.d_dcbs.empty());
}

TEST_CASE("dispatcher") {
  RTCMDispatcher disp;

  basic_string<uint8_t> unsupported={0x3e, 0xd0, 0x00, 0x00};  // 1005
  auto rd = disp.decode(basic_string_view<uint8_t>(unsupported.c_str(), unsupported.size()));
  CHECK(rd.msgnum == 1005);
  CHECK(rd.status == DecodeStatus::Unsupported);

  auto bw = ssrHeader(1057, 1, true);
  bw.u(6, 12).u(8, 55).s(22, 10000).s(20, -2500).s(20, 2500).s(21, 1000).s(19, -250).s(19, 0);
  rd = disp.decode(bw.view());
  CHECK(rd.status == DecodeStatus::Ok);
  REQUIRE(rd.ssr);
  CHECK(!rd.eph);
  CHECK(rd.summary == "RTCM 1057 SSR orbit nsat=1 iod=9");

  auto sw = ssrHeader(1057, 2, true);
  sw.u(6, 12);
  rd = disp.decode(sw.view());
  CHECK(rd.status == DecodeStatus::InsufficientData);
  CHECK(!rd.ssr);

  BitWriter cw;
  cssrHeader(cw, 1, 500);
  cw.u(4, 1);
  maskGNSS(cw, 4, {1, 2}, {0});
  rd = disp.decode(cw.view());
  CHECK(rd.status == DecodeStatus::Ok);
  REQUIRE(rd.cssr);
  CHECK(rd.summary == "ST1  epoch=500 iod=3");
  REQUIRE(disp.cssr().getMask());
  CHECK(disp.cssr().getMask()->gnss[0].satsys == 'J');

  basic_string<uint8_t> shortpayload={0x3f};
  CHECK(disp.decode(basic_string_view<uint8_t>(shortpayload.c_str(), 1)).status == DecodeStatus::InsufficientData);
}

TEST_CASE("ephemeris dispatch") {
  CHECK(ephemerisSatsys(1019) == 'G');
  CHECK(ephemerisSatsys(1045) == 'E');
  CHECK(ephemerisSatsys(1041) == 'I');
  CHECK(ephemerisSatsys(1057) == 0);

  BitWriter bw;
  bw.u(12, 1042);
  bw.u(6, 21).u(13, 900).u(4, 0).s(14, 0).u(5, 3).u(17, 0).s(11, 0).s(22, 0).s(24, -5).u(5, 3);
  bw.s(18, 0).s(16, 0).s(32, 0).s(18, 0).u(32, 0).s(18, 0).u(32, 0).u(17, 0);
  bw.s(18, 0).s(32, 0).s(18, 0).s(32, 0).s(18, 0).s(32, 0).s(24, 0).s(10, 0).s(10, 0).u(1, 0);
  RTCMDispatcher disp;
  auto rd = disp.decode(bw.view());
  REQUIRE(rd.status == DecodeStatus::Ok);
  REQUIRE(rd.eph);
  CHECK(rd.eph->satsys == 'C');
  CHECK(rd.trace == "C21 WN=900 AODE=3\n");

  SsrMonMessage smm;
  REQUIRE(makeProto(rd, smm));
  CHECK(smm.type() == SsrMonMessage::EphemerisType);
  CHECK(smm.msgnum() == 1042);
  CHECK(smm.eph().gnss() == "C");
  CHECK(smm.eph().gnsssv() == 21);
  CHECK(smm.eph().healthy());
  CHECK(smm.eph().af0() == ldexp(-5.0, -34));
}

TEST_CASE("protobuf framing") {
  RTCMDispatcher disp;
  BitWriter mw;
  cssrHeader(mw, 1, 500);
  mw.u(4, 1);
  maskGNSS(mw, 0, {3}, {0});
  REQUIRE(disp.decode(mw.view()).status == DecodeStatus::Ok);

  BitWriter bw;
  cssrHeader(bw, 2, 60);
  bw.u(8, 45).s(15, 100).s(13, -4096).s(13, -1);
  auto rd = disp.decode(bw.view());
  REQUIRE(rd.status == DecodeStatus::Ok);

  SsrMonMessage smm;
  REQUIRE(makeProto(rd, smm));
  smm.set_localutcseconds(1000);
  smm.set_localutcnanoseconds(0);
  smm.set_sourceid(7);
  string framed = frameProto(smm);
  CHECK(framed.substr(0, 4) == "bert");
  CHECK((((unsigned char)framed[4] << 8) | (unsigned char)framed[5]) == (int)framed.size() - 6);

  SsrMonMessage back;
  REQUIRE(unframeProto(framed, back));
  CHECK(back.type() == SsrMonMessage::CSSRType);
  CHECK(back.sourceid() == 7);
  CHECK(back.corr().subtype() == 2);
  CHECK(back.corr().epoch() == 60);
  REQUIRE(back.corr().orbits_size() == 1);
  const auto& o = back.corr().orbits(0);
  CHECK(o.gnss() == "G");
  CHECK(o.gnsssv() == 3);
  CHECK(o.radial() == doctest::Approx(0.16));
  CHECK(!o.has_along());
  CHECK(o.has_cross());

  CHECK(!unframeProto("nope", back));

  RTCMDecode failed;
  failed.status = DecodeStatus::InsufficientData;
  CHECK(!makeProto(failed, back));
}

TEST_CASE("has to protobuf") {
  HASSession hs;
  BitWriter bw;
  bw.u(12, 10).u(1, 1).u(1, 0).u(1, 1).u(1, 0).u(1, 0).u(1, 0).u(4, 0).u(5, 1).u(5, 1);
  bw.u(4, 1);
  maskGNSS(bw, 0, {4}, {0});
  bw.u(3, 0).u(6, 0);
  bw.u(4, 0).u(2, 0).s(13, 400);
  auto msg = hs.decode(bw.view());
  REQUIRE(msg.status == DecodeStatus::Ok);

  SsrMonMessage smm;
  REQUIRE(makeProto(msg, smm));
  smm.set_localutcseconds(1000);
  smm.set_localutcnanoseconds(0);
  smm.set_sourceid(3);
  CHECK(!smm.has_msgnum());

  SsrMonMessage back;
  REQUIRE(unframeProto(frameProto(smm), back));
  CHECK(back.type() == SsrMonMessage::HASType);
  const auto& corr = back.corr();
  REQUIRE(corr.clocks_size() == 1);
  CHECK(corr.clocks(0).c0() == doctest::Approx(1.0));
  CHECK(corr.clocks(0).gnsssv() == 4);
  CHECK(corr.epoch() == 10);
  CHECK(corr.iod() == 1);

  HASMessage failed;
  failed.status = DecodeStatus::SequencingError;
  CHECK(!makeProto(failed, back));
}

// GPS satellites 1, 3 and 5 with two signals each
static CSSRSession gpsSession()
{
  CSSRSession cs;
  BitWriter bw;
  cssrHeader(bw, 1, 1000);
  bw.u(4, 1);
  maskGNSS(bw, 0, {1, 3, 5}, {0, 2});
  REQUIRE(cs.decode(bw.view()).status == DecodeStatus::Ok);
  return cs;
}

TEST_CASE("gridded correction to protobuf") {
  auto cs = gpsSession();
  BitWriter bw;
  cssrHeader(bw, 9, 10);
  bw.u(2, 0).u(1, 0).u(5, 1).u(3, 0x7).u(6, 10).u(6, 2);
  for(int n = 0; n < 2; ++n) {
    bw.s(9, -256 + n).s(8, 25);
    bw.s(7, -64).s(7, 10).s(7, -10);
  }
  auto msg = cs.decode(bw.view());
  REQUIRE(msg.status == DecodeStatus::Ok);

  SsrMonMessage::Corrections corr;
  fillProto(&corr, msg);
  CHECK(corr.subtype() == 9);
  CHECK(corr.networkid() == 1);
  REQUIRE(corr.tropos_size() == 2);
  CHECK(!corr.tropos(0).has_hydrostatic());
  CHECK(corr.tropos(0).wet() == doctest::Approx(0.1));
  REQUIRE(corr.tropos(0).stec_size() == 3);
  CHECK(!corr.tropos(0).stec(0).has_tecu());
  CHECK(corr.tropos(0).stec(1).gnsssv() == 3);
  CHECK(corr.tropos(0).stec(1).tecu() == doctest::Approx(0.4));
  CHECK(corr.tropos(1).stec(2).tecu() == doctest::Approx(-0.4));
}

TEST_CASE("network correction to protobuf") {
  auto cs = gpsSession();
  BitWriter bw;
  cssrHeader(bw, 12, 10);
  bw.u(2, 3).u(2, 2).u(5, 4).u(6, 2);
  bw.u(6, 12).u(2, 1).s(9, 50).s(7, -64).s(7, 3);
  bw.u(1, 1).u(4, 5).s(8, -128).s(8, 10);
  bw.u(3, 0x4);
  bw.u(6, 7).u(2, 0).s(14, 40).u(2, 2).s(5, -16).s(5, 3);
  auto msg = cs.decode(bw.view());
  REQUIRE(msg.status == DecodeStatus::Ok);

  SsrMonMessage::Corrections corr;
  fillProto(&corr, msg);
  CHECK(corr.networkid() == 4);
  REQUIRE(corr.has_tropopoly());
  CHECK(corr.tropopoly().quality() == 12);
  CHECK(corr.tropopoly().type() == 1);
  CHECK(corr.tropopoly().t00() == doctest::Approx(0.2));
  CHECK(!corr.tropopoly().has_t01());
  CHECK(corr.tropopoly().t10() == doctest::Approx(0.006));
  CHECK(!corr.tropopoly().has_t11());
  CHECK(corr.tropooffset() == doctest::Approx(0.1));
  REQUIRE(corr.tropos_size() == 2);
  CHECK(!corr.tropos(0).has_residual());
  CHECK(corr.tropos(1).residual() == doctest::Approx(0.04));
  REQUIRE(corr.stecs_size() == 1);
  CHECK(corr.stecs(0).c00() == doctest::Approx(2.0));
  REQUIRE(corr.stecs(0).residuals_size() == 2);
  CHECK(!corr.stecs(0).residuals(0).has_value());
  CHECK(corr.stecs(0).residuals(1).grid() == 2);
  CHECK(corr.stecs(0).residuals(1).value() == doctest::Approx(0.48));
}

TEST_CASE("unbounded ura to protobuf") {
  auto cs = gpsSession();
  BitWriter bw;
  cssrHeader(bw, 7, 10);
  bw.u(6, 63).u(6, 8).u(6, 0);
  auto msg = cs.decode(bw.view());
  REQUIRE(msg.status == DecodeStatus::Ok);

  SsrMonMessage::Corrections corr;
  fillProto(&corr, msg);
  REQUIRE(corr.uras_size() == 3);
  CHECK(corr.uras(0).unbounded());
  CHECK(corr.uras(0).meters() == doctest::Approx(5.4665));
  CHECK(!corr.uras(1).unbounded());
  CHECK(corr.uras(1).meters() == doctest::Approx(0.002));
  CHECK(!corr.uras(2).has_meters());
}
