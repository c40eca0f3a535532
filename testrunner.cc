#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN

#include "doctest/doctest.h"
#include "bitcursor.hh"
#include "fieldcodec.hh"
#include "cssrmon.hh"
#include "testbits.hh"

using namespace std;

static basic_string_view<uint8_t> sv(const basic_string<uint8_t>& s)
{
  return basic_string_view<uint8_t>(s.c_str(), s.size());
}

TEST_CASE("bit cursor reads") {
  basic_string<uint8_t> data={0xa5, 0xf0};
  BitCursor bc(sv(data));
  CHECK(bc.getbitu(4) == 10);
  CHECK(bc.getbits(4) == 5);
  CHECK(bc.getbits(4) == -1);
  CHECK(bc.getbitu(4) == 0);
  CHECK(bc.pos() == 16);
  CHECK(bc.remaining() == 0);
  CHECK(bc.has(0));
  CHECK(!bc.has(1));
}

TEST_CASE("sign magnitude") {
  BitWriter bw;
  bw.sm(5, -3).sm(5, 3).u(1, 1).u(4, 0);
  BitCursor bc(bw.view());
  CHECK(bc.getbitsm(5) == -3);
  CHECK(bc.getbitsm(5) == 3);
  // 'negative zero'
  CHECK(bc.getbitsm(5) == 0);
}

static int64_t twosComplement(uint64_t raw, int len)
{
  if(raw >> (len - 1))
    return (int64_t)raw - ((int64_t)1 << len);
  return raw;
}

static int64_t signMagnitude(uint64_t raw, int len)
{
  int64_t magnitude = raw & (((uint64_t)1 << (len - 1)) - 1);
  return (raw >> (len - 1)) ? -magnitude : magnitude;
}

TEST_CASE("signed reads for every width") {
  for(int len = 2; len <= 32; ++len) {
    uint64_t all = ((uint64_t)1 << len) - 1;
    uint64_t top = (uint64_t)1 << (len - 1);
    for(uint64_t raw : {(uint64_t)0, (uint64_t)1, top - 1, top, top | 1, all,
          0x5555555555ULL & all, 0xaaaaaaaaaaULL & all}) {
      CAPTURE(len);
      CAPTURE(raw);
      BitWriter bw;
      bw.u(3, 5).u(len, raw).u(len, raw);
      BitCursor bc(bw.view());
      bc.skip(3);
      int64_t tc = bc.getbits(len);
      int64_t sm = bc.getbitsm(len);
      CHECK(tc == twosComplement(raw, len));
      CHECK(sm == signMagnitude(raw, len));
      // same magnitude bits: both agree below the sign bit, and on the sign
      if(raw & top) {
        CHECK(tc < 0);
        CHECK(sm <= 0);
        CHECK(tc + (int64_t)top == -sm);
      }
      else
        CHECK(tc == sm);
    }
  }
}

TEST_CASE("bit cursor runs out") {
  basic_string<uint8_t> data={0xff, 0xff};
  BitCursor bc(sv(data));
  bc.skip(10);
  CHECK_THROWS_AS(bc.getbitu(7), InsufficientData);
  CHECK(bc.pos() == 10);
  CHECK(bc.getbitu(6) == 63);

  BitCursor empty(basic_string_view<uint8_t>{});
  CHECK(empty.remaining() == 0);
  CHECK_THROWS_AS(empty.getbits(1), InsufficientData);
}

TEST_CASE("bit cursor copies are independent") {
  basic_string<uint8_t> data={0x12, 0x34};
  BitCursor bc(sv(data));
  bc.skip(4);
  BitCursor copy = bc;
  CHECK(copy.getbitu(8) == 0x23);
  CHECK(bc.pos() == 4);
  CHECK(bc.getbitu(12) == 0x234);
}

TEST_CASE("bit length limits") {
  basic_string<uint8_t> data={0xff, 0xff};
  BitCursor bc(sv(data), 0, 10);
  CHECK(bc.bitLength() == 10);
  CHECK(bc.has(10));
  CHECK(!bc.has(11));
  CHECK_THROWS_AS(BitCursor(sv(data), 0, 17), std::out_of_range);
  CHECK_THROWS_AS(BitCursor(sv(data), 11, 10), std::out_of_range);
}

TEST_CASE("wide fields and blobs") {
  BitWriter bw;
  bw.u64(40, 0x8000000001ULL).u(8, 0xab).u(8, 0xcd);
  BitCursor bc(bw.view());
  CHECK(bc.getbitu64(40) == 0x8000000001ULL);
  auto bytes = bc.getBytes(12);
  REQUIRE(bytes.size() == 2);
  CHECK(bytes[0] == 0xab);
  CHECK(bytes[1] == 0xc0);
}

TEST_CASE("null data") {
  basic_string<uint8_t> zero(20, 0);
  CHECK(BitCursor(sv(zero)).isNull());

  basic_string<uint8_t> tail={0x00, 0x01};
  CHECK(!BitCursor(sv(tail)).isNull());
  CHECK(BitCursor(sv(tail), 0, 15).isNull());
}

TEST_CASE("gnss ids") {
  CHECK(gnssIdToSatsys(0) == 'G');
  CHECK(gnssIdToSatsys(1) == 'R');
  CHECK(gnssIdToSatsys(2) == 'E');
  CHECK(gnssIdToSatsys(3) == 'C');
  CHECK(gnssIdToSatsys(4) == 'J');
  CHECK(gnssIdToSatsys(5) == 'S');
  CHECK_THROWS_AS(gnssIdToSatsys(6), UnknownEnumeration);
  try {
    gnssIdToSatsys(15);
  }
  catch(UnknownEnumeration& ue) {
    CHECK(ue.raw == 15);
  }
  CHECK(satsysToGnssId('J') == 4);
}

TEST_CASE("signal names") {
  CHECK(signalName('G', 0) == "L1 C/A");
  CHECK(signalName('G', 13) == "L5 I+Q");
  CHECK(signalName('G', 14) == "");
  CHECK(signalName('E', 0) == "E1 B");
  CHECK(signalName('J', 7) == "L5 I");
  CHECK(signalName('R', 0) == "G1 C/A");
  CHECK_THROWS_AS(signalName('I', 0), UnknownEnumeration);
  CHECK_THROWS_AS(signalName('G', 16), UnknownEnumeration);
}

TEST_CASE("sentinels") {
  CHECK(invalidPattern(15) == -16384);
  CHECK(invalidPattern(7) == -64);
  CHECK(!scaled(-16384, 15, 0.0016));
  REQUIRE(scaled(-16383, 15, 0.0016));
  CHECK(*scaled(-16383, 15, 0.0016) == doctest::Approx(-26.2128));
  // a valid zero is not the same as invalid
  REQUIRE(scaled(0, 15, 0.0016));
  CHECK(*scaled(0, 15, 0.0016) == 0.0);
  CHECK(*scaled(16383, 15, 0.0016) == doctest::Approx(26.2128));
}

TEST_CASE("only the sentinel is invalid") {
  for(int len = 4; len <= 16; ++len) {
    int invalid = 0, wrong = 0;
    for(int raw = -(1 << (len - 1)); raw < (1 << (len - 1)); ++raw) {
      if(!scaled(raw, len, 0.004)) {
        ++invalid;
        if(raw != invalidPattern(len))
          ++wrong;
      }
    }
    CAPTURE(len);
    CHECK(invalid == 1);
    CHECK(wrong == 0);
  }

  // and the decoders see the same thing through the cursor
  BitWriter bw;
  bw.s(13, -4096).s(13, -4095).s(13, 0);
  BitCursor bc(bw.view());
  CHECK(!getScaled(bc, 13, 0.0064));
  CHECK(getScaled(bc, 13, 0.0064));
  CHECK(getScaled(bc, 13, 0.0064));
}

TEST_CASE("validity intervals") {
  CHECK(validityInterval(0) == 5);
  CHECK(validityInterval(14) == 3600);
  CHECK(validityInterval(15) == 0);
  CHECK_THROWS_AS(validityInterval(16), std::out_of_range);
  CHECK_THROWS_AS(validityInterval(-1), std::out_of_range);
}

TEST_CASE("ura") {
  CHECK(!cssrUraMetres(0));
  CHECK(*cssrUraMetres(1) == doctest::Approx(0.00025));
  // 3^7 * 2.5 - 1 mm, the largest bounded class
  CHECK(*cssrUraMetres(62) == doctest::Approx(5.4665));
  CHECK(!cssrUraUnbounded(62));
  REQUIRE(cssrUraMetres(63));
  CHECK(*cssrUraMetres(63) == doctest::Approx(5.4665));
  CHECK(cssrUraUnbounded(63));
  CHECK(fmtUra(63, 7, 4) == ">5.4665");
  CHECK(fmtUra(62, 7, 4) == " 5.4665");
  CHECK(fmtUra(0, 7, 4) == "    N/A");
  CHECK(humanUra(0) == "200 cm");
  CHECK(humanUra(15) == "NO URA AVAILABLE");
  CHECK(humanSisa(255) == "NO SISA AVAILABLE");
  CHECK(humanFt(15) == "NONE");
}

TEST_CASE("formatting") {
  CHECK(fmtScaled(Scaled(), 7, 3) == "    N/A");
  CHECK(fmtScaled(1.5, 7, 3) == "  1.500");
  CHECK(fmtScaled(-0.0064, 7, 4) == "-0.0064");
  SatID id;
  id.gnss='E';
  id.sv=5;
  CHECK(makeSatIDName(id) == "E05");
  CHECK(makeHexDump(string("\x01\xab", 2)) == "01ab");
  CHECK(humanStatus(DecodeStatus::SequencingError) == "no mask received yet");
}
