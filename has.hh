#pragma once
#include <stdint.h>
#include <string>
#include <string_view>
#include <optional>
#include "cssr.hh"

/* Galileo High Accuracy Service, message type 1 as reassembled from the E6-B pages
   (HAS SIS ICD issue 1.0). One message carries a header with six block flags, followed by
   the blocks that are present, always in the order mask, orbit, clock full set, clock subset,
   code bias, phase bias. */

struct HASHeader
{
  int toh{0};             // seconds since the start of the GST hour
  bool maskFlag{false}, orbitFlag{false}, clockFullFlag{false}, clockSubsetFlag{false};
  bool codeBiasFlag{false}, phaseBiasFlag{false};
  int maskId{0};
  int iodSet{0};
};

struct HASOrbit
{
  int validity{0};        // seconds
  std::vector<OrbitCorrection> sats;
};

// used for both the full set and the subset
struct HASClock
{
  int validity{0};
  std::vector<ClockCorrection> sats;
};

struct HASCodeBias
{
  int validity{0};
  std::vector<CodeBias> cells;
};

struct HASPhaseBias
{
  int validity{0};
  std::vector<PhaseBias> cells;  // cycles
};

struct HASMessage
{
  DecodeStatus status{DecodeStatus::Ok};
  std::string reason;
  HASHeader header;
  std::optional<MaskContext> mask;
  std::optional<HASOrbit> orbit;
  std::optional<HASClock> clockFull, clockSubset;
  std::optional<HASCodeBias> codeBias;
  std::optional<HASPhaseBias> phaseBias;
  std::string summary;
  std::string trace;
  std::string stats;
  int bits{0};
};

// most negative is 'not available', most positive 'do not use this satellite'
ClockCorrection hasClockValue(int raw, int multiplier);

class HASSession
{
public:
  explicit HASSession(bool stats=false) : d_statEnabled(stats) {}
  HASMessage decode(std::basic_string_view<uint8_t> payload, int bitlen=-1);

  const std::optional<MaskContext>& getMask() const { return d_mask; }
  int getMaskId() const { return d_maskId; }
  const HASHeader& getHeader() const { return d_header; }
  const BitStats& getStats() const { return d_stats; }

private:
  std::optional<HASOrbit> parseOrbit(BitCursor& bc, std::string& trace);
  std::optional<HASClock> parseClockFull(BitCursor& bc, std::string& trace);
  std::optional<HASClock> parseClockSubset(BitCursor& bc, std::string& trace);
  std::optional<HASCodeBias> parseCodeBias(BitCursor& bc, std::string& trace);
  std::optional<HASPhaseBias> parsePhaseBias(BitCursor& bc, std::string& trace);

  std::optional<MaskContext> d_mask;
  int d_maskId{-1};
  HASHeader d_header;
  BitStats d_stats;
  bool d_statEnabled;
};
