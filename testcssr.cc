#include "doctest/doctest.h"
#include "cssr.hh"
#include "testbits.hh"

using namespace std;

// GPS satellites 1, 3 and 5 with L1 C/A and L1 Z-tracking, all cells active
static BitWriter gpsMask(int epoch=1000)
{
  BitWriter bw;
  cssrHeader(bw, 1, epoch);
  bw.u(4, 1);
  maskGNSS(bw, 0, {1, 3, 5}, {0, 2});
  return bw;
}

static CSSRSession withMask(bool stats=false)
{
  CSSRSession cs(stats);
  auto bw = gpsMask();
  auto msg = cs.decode(bw.view());
  REQUIRE(msg.status == DecodeStatus::Ok);
  return cs;
}

TEST_CASE("mask addressing") {
  auto bw = gpsMask();
  BitCursor bc(bw.view());
  bc.skip(45);
  auto mask = buildMask(bc, MaskKind::CSSR);
  REQUIRE(mask);
  CHECK(bc.pos() == 45 + 4 + 61);
  REQUIRE(mask->gnss.size() == 1);
  const auto& g = mask->gnss[0];
  CHECK(g.satsys == 'G');
  CHECK(g.sats == vector<int>({1, 3, 5}));
  CHECK(g.signals == vector<string>({"L1 C/A", "L1 Z-tracking"}));
  CHECK(g.cellmask.size() == 6);
  CHECK(mask->activeCells() == 6);
  CHECK(mask->numSats() == 3);
  CHECK(makeSatIDName(g.satID(2)) == "G05");
}

TEST_CASE("explicit cell mask is satellite major") {
  BitWriter bw;
  bw.u(4, 1).u(4, 2).u64(40, (1ULL << 39) | (1ULL << 38)).u(16, 0xc000).u(1, 1);
  bw.u(1, 1).u(1, 0).u(1, 0).u(1, 1);
  BitCursor bc(bw.view());
  auto mask = buildMask(bc, MaskKind::CSSR);
  REQUIRE(mask);
  const auto& g = mask->gnss[0];
  CHECK(g.satsys == 'E');
  CHECK(g.cell(0, 0));
  CHECK(!g.cell(0, 1));
  CHECK(!g.cell(1, 0));
  CHECK(g.cell(1, 1));
  CHECK(mask->activeCells() == 2);
}

TEST_CASE("mask with too few bits") {
  auto bw = gpsMask();
  BitCursor bc(bw.view(), 0, 45 + 4 + 30);
  bc.skip(45);
  CHECK(!buildMask(bc, MaskKind::CSSR));
}

TEST_CASE("corrections before mask") {
  CSSRSession cs;
  BitWriter bw;
  cssrHeader(bw, 2, 100);
  bw.u(32, 0xffffffff);
  auto msg = cs.decode(bw.view());
  CHECK(msg.status == DecodeStatus::SequencingError);
  CHECK(!cs.getMask());
  CHECK(msg.trace.empty());
}

TEST_CASE("mask then orbit") {
  CSSRSession cs;
  auto mw = gpsMask(2000);
  auto msg = cs.decode(mw.view());
  REQUIRE(msg.status == DecodeStatus::Ok);
  CHECK(msg.summary == "ST1  epoch=2000 iod=3");
  CHECK(msg.trace == "ST1 G01 L1 C/A L1 Z-tracking\nST1 G03 L1 C/A L1 Z-tracking\nST1 G05 L1 C/A L1 Z-tracking\n");
  REQUIRE(cs.getMask());
  CHECK(std::holds_alternative<CSSRMask>(msg.body));

  BitWriter bw;
  cssrHeader(bw, 2, 100);
  bw.u(8, 45).s(15, 100).s(13, -4096).s(13, -1);
  bw.u(8, 46).s(15, -16384).s(13, 0).s(13, 1);
  bw.u(8, 47).s(15, 0).s(13, 0).s(13, 0);
  CHECK(bw.pos == 184);
  msg = cs.decode(bw.view());
  REQUIRE(msg.status == DecodeStatus::Ok);
  CHECK(msg.bits == 37 + 3 * (8 + 15 + 13 + 13));
  CHECK(msg.summary == "ST2  hepoch=100 iod=3");
  CHECK(cs.getHeader().hepoch == 100);
  const auto& orbit = std::get<CSSROrbit>(msg.body);
  REQUIRE(orbit.sats.size() == 3);
  CHECK(orbit.sats[0].iode == 45);
  CHECK(*orbit.sats[0].radial == doctest::Approx(0.16));
  CHECK(!orbit.sats[0].along);
  CHECK(*orbit.sats[0].cross == doctest::Approx(-0.0064));
  CHECK(!orbit.sats[1].radial);
  CHECK(orbit.sats[2].id.sv == 5);
  CHECK(msg.trace.rfind("ST2 G01 IODE=  45 d_radial= 0.1600m d_along=    N/Am d_cross=-0.0064m\n", 0) == 0);
}

TEST_CASE("galileo orbit iode is 10 bits") {
  CSSRSession cs;
  BitWriter mw;
  cssrHeader(mw, 1, 0);
  mw.u(4, 1);
  maskGNSS(mw, 2, {7}, {0});
  REQUIRE(cs.decode(mw.view()).status == DecodeStatus::Ok);

  BitWriter bw;
  cssrHeader(bw, 2, 5);
  bw.u(10, 1000).s(15, 1).s(13, 1).s(13, 1);
  auto msg = cs.decode(bw.view());
  REQUIRE(msg.status == DecodeStatus::Ok);
  CHECK(msg.bits == 37 + 51);
  CHECK(std::get<CSSROrbit>(msg.body).sats[0].iode == 1000);
}

TEST_CASE("header boundary") {
  auto mw = gpsMask();
  CSSRSession cs;
  CHECK(cs.decode(mw.view(), 44).status == DecodeStatus::InsufficientData);
  CHECK(!cs.getMask());
  CHECK(cs.decode(mw.view(), 45).status == DecodeStatus::InsufficientData);
  CHECK(!cs.getMask());

  auto cs2 = withMask();
  BitWriter bw;
  cssrHeader(bw, 3, 100);
  bw.s(15, 1).s(15, 2).s(15, 3);
  CHECK(cs2.decode(bw.view(), 36).status == DecodeStatus::InsufficientData);
  // the header is complete, the clocks are not
  CHECK(cs2.decode(bw.view(), 37 + 29).status == DecodeStatus::InsufficientData);
  CHECK(cs2.getMask());
  CHECK(cs2.decode(bw.view(), 37 + 45).status == DecodeStatus::Ok);
}

TEST_CASE("malformed headers") {
  CSSRSession cs(true);
  BitWriter bw;
  cssrHeader(bw, 1, 0, 0, 4072);
  bw.u(4, 0);
  auto msg = cs.decode(bw.view());
  CHECK(msg.status == DecodeStatus::MalformedHeader);
  CHECK(cs.getStats().bnull == bw.view().size() * 8);

  basic_string<uint8_t> zero(10, 0);
  msg = cs.decode(basic_string_view<uint8_t>(zero.c_str(), zero.size()));
  CHECK(msg.status == DecodeStatus::MalformedHeader);
  CHECK(cs.getStats().bnull == bw.view().size() * 8 + 80);
}

TEST_CASE("unknown subtype leaves mask") {
  auto cs = withMask();
  BitWriter bw;
  cssrHeader(bw, 13, 0);
  bw.u(16, 0xffff);
  auto msg = cs.decode(bw.view());
  CHECK(msg.status == DecodeStatus::UnknownEnumeration);
  CHECK(cs.getMask());
  CHECK(cs.getMask()->numSats() == 3);
}

TEST_CASE("bad gnss id keeps previous mask") {
  auto cs = withMask();
  BitWriter bw;
  cssrHeader(bw, 1, 0);
  bw.u(4, 1);
  maskGNSS(bw, 9, {1}, {0});
  auto msg = cs.decode(bw.view());
  CHECK(msg.status == DecodeStatus::UnknownEnumeration);
  REQUIRE(cs.getMask());
  CHECK(cs.getMask()->gnss[0].satsys == 'G');
}

TEST_CASE("fresh sessions decode identically") {
  auto mw = gpsMask();
  BitWriter bw;
  cssrHeader(bw, 3, 10);
  bw.s(15, 10).s(15, -16384).s(15, -10);
  CSSRSession a, b;
  auto ma = a.decode(mw.view());
  auto mb = b.decode(mw.view());
  CHECK(ma.trace == mb.trace);
  ma = a.decode(bw.view());
  mb = b.decode(bw.view());
  CHECK(ma.trace == mb.trace);
  CHECK(ma.trace == "ST3 G01 d_clock=  0.016m\nST3 G03 d_clock=    N/Am\nST3 G05 d_clock= -0.016m\n");
}

TEST_CASE("code and phase bias") {
  auto cs = withMask();
  BitWriter bw;
  cssrHeader(bw, 4, 10);
  for(int n = 0; n < 6; ++n)
    bw.s(11, n == 1 ? -1024 : n);
  auto msg = cs.decode(bw.view());
  REQUIRE(msg.status == DecodeStatus::Ok);
  const auto& cb = std::get<CSSRCodeBias>(msg.body);
  REQUIRE(cb.cells.size() == 6);
  CHECK(cb.cells[0].signal == "L1 C/A");
  CHECK(!cb.cells[1].bias);
  CHECK(cb.cells[5].id.sv == 5);
  CHECK(*cb.cells[5].bias == doctest::Approx(0.1));
  CHECK(msg.trace.rfind("ST4 G01 L1 C/A        code_bias=  0.000m\n", 0) == 0);

  BitWriter pw;
  cssrHeader(pw, 5, 10);
  for(int n = 0; n < 6; ++n)
    pw.s(15, 100 * n).u(2, n % 4);
  msg = cs.decode(pw.view());
  REQUIRE(msg.status == DecodeStatus::Ok);
  const auto& pb = std::get<CSSRPhaseBias>(msg.body);
  REQUIRE(pb.cells.size() == 6);
  CHECK(*pb.cells[3].bias == doctest::Approx(0.3));
  CHECK(pb.cells[3].discontinuity == 3);
  CHECK(pb.cells[3].signal == "L1 Z-tracking");
}

TEST_CASE("network bias without network") {
  auto cs = withMask();
  BitWriter bw;
  cssrHeader(bw, 6, 10);
  bw.u(1, 1).u(1, 1).u(1, 0);
  for(int n = 0; n < 6; ++n)
    bw.s(11, 50).s(15, -200).u(2, 1);
  auto msg = cs.decode(bw.view());
  REQUIRE(msg.status == DecodeStatus::Ok);
  const auto& nb = std::get<CSSRNetworkBias>(msg.body);
  CHECK(!nb.network);
  REQUIRE(nb.cells.size() == 6);
  CHECK(nb.cells[0].hasCode);
  CHECK(*nb.cells[0].code == doctest::Approx(1.0));
  CHECK(*nb.cells[0].phase == doctest::Approx(-0.2));
  CHECK(msg.bits == 37 + 3 + 6 * 28);
}

TEST_CASE("network bias with network") {
  auto cs = withMask();
  BitWriter bw;
  cssrHeader(bw, 6, 10);
  bw.u(1, 1).u(1, 0).u(1, 1).u(5, 7).u(3, 0x4);
  bw.s(11, 1).s(11, 2);
  auto msg = cs.decode(bw.view());
  REQUIRE(msg.status == DecodeStatus::Ok);
  const auto& nb = std::get<CSSRNetworkBias>(msg.body);
  CHECK(nb.nid == 7);
  REQUIRE(nb.cells.size() == 2);
  CHECK(nb.cells[1].id.sv == 1);
  CHECK(!nb.cells[1].hasPhase);
}

TEST_CASE("ura") {
  auto cs = withMask();
  BitWriter bw;
  cssrHeader(bw, 7, 10);
  bw.u(6, 0).u(6, 63).u(6, 9);
  auto msg = cs.decode(bw.view());
  REQUIRE(msg.status == DecodeStatus::Ok);
  const auto& ura = std::get<CSSRUra>(msg.body);
  CHECK(!ura.sats[0].metres);
  CHECK(*ura.sats[1].metres == doctest::Approx(5.4665));
  CHECK(*ura.sats[2].metres == doctest::Approx((3 * 1.25 - 1) / 1000));
  CHECK(msg.trace.find("URA 63 (>5.4665m)") != string::npos);
}

TEST_CASE("stec polynomial") {
  auto cs = withMask();
  BitWriter bw;
  cssrHeader(bw, 8, 10);
  bw.u(2, 1).u(5, 2).u(3, 0x5);
  bw.u(6, 33).s(14, 20).s(12, -1).s(12, -2048);
  bw.u(6, 34).s(14, -8192).s(12, 0).s(12, 5);
  auto msg = cs.decode(bw.view());
  REQUIRE(msg.status == DecodeStatus::Ok);
  const auto& st = std::get<CSSRStec>(msg.body);
  CHECK(st.type == 1);
  CHECK(st.nid == 2);
  REQUIRE(st.sats.size() == 2);
  CHECK(st.sats[0].id.sv == 1);
  CHECK(st.sats[1].id.sv == 5);
  CHECK(st.sats[0].poly.quality == 33);
  CHECK(*st.sats[0].poly.c00 == doctest::Approx(1.0));
  CHECK(*st.sats[0].poly.c01 == doctest::Approx(-0.02));
  CHECK(!st.sats[0].poly.c10);
  CHECK(!st.sats[0].poly.c11);
  CHECK(!st.sats[1].poly.c00);
  CHECK(msg.bits == 37 + 10 + 2 * 44);
}

TEST_CASE("gridded correction") {
  auto cs = withMask();
  BitWriter bw;
  cssrHeader(bw, 9, 10);
  bw.u(2, 0).u(1, 0).u(5, 1).u(3, 0x7).u(6, 10).u(6, 2);
  for(int n = 0; n < 2; ++n) {
    bw.s(9, -256 + n).s(8, 25);
    bw.s(7, -64).s(7, 10).s(7, -10);
  }
  auto msg = cs.decode(bw.view());
  REQUIRE(msg.status == DecodeStatus::Ok);
  const auto& gr = std::get<CSSRGridded>(msg.body);
  CHECK(!gr.range);
  REQUIRE(gr.grids.size() == 2);
  CHECK(!gr.grids[0].hydrostatic);
  CHECK(*gr.grids[1].hydrostatic == doctest::Approx(-255 * 0.004));
  CHECK(*gr.grids[0].wet == doctest::Approx(0.1));
  REQUIRE(gr.grids[0].stec.size() == 3);
  CHECK(!gr.grids[0].stec[0].residual);
  CHECK(*gr.grids[0].stec[1].residual == doctest::Approx(0.4));
  CHECK(msg.bits == 37 + 23 + 2 * (17 + 21));
}

TEST_CASE("gridded correction with wide residuals") {
  auto cs = withMask();
  BitWriter bw;
  cssrHeader(bw, 9, 10);
  bw.u(2, 0).u(1, 1).u(5, 1).u(3, 0x1).u(6, 10).u(6, 1);
  bw.s(9, 0).s(8, 0).s(16, -32768);
  auto msg = cs.decode(bw.view());
  REQUIRE(msg.status == DecodeStatus::Ok);
  const auto& gr = std::get<CSSRGridded>(msg.body);
  REQUIRE(gr.grids[0].stec.size() == 1);
  CHECK(gr.grids[0].stec[0].id.sv == 5);
  CHECK(!gr.grids[0].stec[0].residual);
}

TEST_CASE("service information") {
  CSSRSession cs;
  BitWriter bw;
  cssrHeader(bw, 10, 0);
  bw.u(3, 5).u(2, 0).u(32, 0xdeadbeef).u(8, 0x42);
  // no mask needed
  auto msg = cs.decode(bw.view());
  REQUIRE(msg.status == DecodeStatus::Ok);
  const auto& si = std::get<CSSRServiceInfo>(msg.body);
  CHECK(si.counter == 5);
  CHECK(si.data.size() == 5);
  CHECK(si.data[4] == 0x42);
  CHECK(msg.trace == "ST10 5:deadbeef42\n");
  CHECK(msg.summary == "ST10");
}

TEST_CASE("orbit and clock for a network") {
  auto cs = withMask();
  BitWriter bw;
  cssrHeader(bw, 11, 10);
  bw.u(1, 1).u(1, 1).u(1, 1).u(5, 3).u(3, 0x2);
  bw.u(8, 99).s(15, 10).s(13, 20).s(13, 30).s(15, -16384);
  auto msg = cs.decode(bw.view());
  REQUIRE(msg.status == DecodeStatus::Ok);
  const auto& oc = std::get<CSSROrbitClock>(msg.body);
  CHECK(oc.nid == 3);
  REQUIRE(oc.sats.size() == 1);
  CHECK(oc.sats[0].id.sv == 3);
  REQUIRE(oc.sats[0].orbit);
  CHECK(oc.sats[0].orbit->iode == 99);
  CHECK(*oc.sats[0].orbit->along == doctest::Approx(0.128));
  REQUIRE(oc.sats[0].clock);
  CHECK(!oc.sats[0].clock->c0);
  CHECK(msg.bits == 37 + 11 + 49 + 15);
}

TEST_CASE("clock only for all satellites") {
  auto cs = withMask();
  BitWriter bw;
  cssrHeader(bw, 11, 10);
  bw.u(1, 0).u(1, 1).u(1, 0);
  bw.s(15, 1).s(15, 2).s(15, 3);
  auto msg = cs.decode(bw.view());
  REQUIRE(msg.status == DecodeStatus::Ok);
  const auto& oc = std::get<CSSROrbitClock>(msg.body);
  REQUIRE(oc.sats.size() == 3);
  CHECK(!oc.sats[0].orbit);
  CHECK(*oc.sats[2].clock->c0 == doctest::Approx(0.0048));
}

TEST_CASE("network correction") {
  auto cs = withMask();
  BitWriter bw;
  cssrHeader(bw, 12, 10);
  bw.u(2, 3).u(2, 2).u(5, 4).u(6, 2);
  bw.u(6, 12).u(2, 1).s(9, 50).s(7, -64).s(7, 3);
  bw.u(1, 1).u(4, 5).s(8, -128).s(8, 10);
  bw.u(3, 0x4);
  bw.u(6, 7).u(2, 0).s(14, 40).u(2, 2).s(5, -16).s(5, 3);
  auto msg = cs.decode(bw.view());
  REQUIRE(msg.status == DecodeStatus::Ok);
  const auto& nc = std::get<CSSRNetwork>(msg.body);
  CHECK(nc.nid == 4);
  CHECK(nc.ngrid == 2);
  CHECK(nc.tropoType == 1);
  CHECK(*nc.t00 == doctest::Approx(0.2));
  CHECK(!nc.t01);
  CHECK(*nc.t10 == doctest::Approx(0.006));
  CHECK(!nc.t11);
  CHECK(nc.tropoResidualBits == 8);
  CHECK(nc.tropoOffset == doctest::Approx(0.1));
  REQUIRE(nc.tropoResiduals.size() == 2);
  CHECK(!nc.tropoResiduals[0]);
  CHECK(*nc.tropoResiduals[1] == doctest::Approx(0.04));
  REQUIRE(nc.stec.size() == 1);
  CHECK(nc.stec[0].id.sv == 1);
  CHECK(*nc.stec[0].poly.c00 == doctest::Approx(2.0));
  CHECK(nc.stec[0].residualBits == 5);
  REQUIRE(nc.stec[0].residuals.size() == 2);
  CHECK(!nc.stec[0].residuals[0]);
  CHECK(*nc.stec[0].residuals[1] == doctest::Approx(0.48));
}

TEST_CASE("truncated body keeps the mask") {
  auto cs = withMask();
  BitWriter bw;
  cssrHeader(bw, 2, 100);
  bw.u(8, 45).s(15, 100).s(13, 1).s(13, -1);
  auto msg = cs.decode(bw.view());
  CHECK(msg.status == DecodeStatus::InsufficientData);
  CHECK(msg.trace.empty());
  REQUIRE(cs.getMask());
  CHECK(cs.getMask()->numSats() == 3);
}

TEST_CASE("bit statistics") {
  auto cs = withMask(true);
  CHECK(cs.getStats().bother == 110);
  CHECK(cs.getStats().nsat == 3);
  CHECK(cs.getStats().nsig == 6);

  BitWriter bw;
  cssrHeader(bw, 2, 100);
  for(int n = 0; n < 3; ++n)
    bw.u(8, 45).s(15, 100).s(13, 1).s(13, -1);
  REQUIRE(cs.decode(bw.view()).status == DecodeStatus::Ok);
  CHECK(cs.getStats().bother == 147);
  CHECK(cs.getStats().bsat == 147);

  BitWriter cw;
  cssrHeader(cw, 4, 10);
  for(int n = 0; n < 6; ++n)
    cw.s(11, 0);
  REQUIRE(cs.decode(cw.view()).status == DecodeStatus::Ok);
  CHECK(cs.getStats().bsig == 66);
  CHECK(cs.getStats().total() == 147 + 147 + 37 + 66);

  auto mw = gpsMask();
  auto msg = cs.decode(mw.view());
  CHECK(msg.stats == "stat n_sat 3 n_sig 6 bit_sat 147 bit_sig 66 bit_other 184 bit_null 0 bit_total 397");
  CHECK(cs.getStats().bother == 110);
  CHECK(cs.getStats().bsat == 0);

  CSSRSession quiet;
  CHECK(quiet.decode(mw.view()).stats.empty());
  CHECK(quiet.decode(mw.view()).stats.empty());
}
