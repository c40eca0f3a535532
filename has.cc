#include "has.hh"
#include "fmt/format.h"
#include "fmt/printf.h"

using namespace std;

ClockCorrection hasClockValue(int raw, int multiplier)
{
  ClockCorrection ret;
  ret.multiplier = multiplier;
  if(raw == invalidPattern(13))
    return ret;
  if(raw == -invalidPattern(13) - 1) {
    ret.doNotUse = true;
    return ret;
  }
  ret.c0 = raw * 0.0025 * multiplier;
  return ret;
}

static string viTrace(const char* block, int vi)
{
  return fmt::format("{} validity_interval={}s ({})\n", block, validityInterval(vi), vi);
}

static string clockTrace(const char* block, const ClockCorrection& cc)
{
  return fmt::format("{} {} d_clock={}m (multiplier={}){}\n", block, makeSatIDName(cc.id), fmtScaled(cc.c0, 7, 3),
                     cc.multiplier, cc.doNotUse ? " do not use" : "");
}

/*
   0  12 bits time of hour
   12  1 bit mask, orbit, clock full set, clock subset, code bias, phase bias present
   18  4 bits reserved
   22  5 bits mask ID
   27  5 bits IOD set ID
*/
HASMessage HASSession::decode(std::basic_string_view<uint8_t> payload, int bitlen)
{
  HASMessage msg;
  try {
    BitCursor bc(payload, 0, bitlen);
    if(bc.isNull()) {
      msg.status = DecodeStatus::MalformedHeader;
      msg.reason = fmt::format("HAS null data {} bits", bc.bitLength());
      d_stats.bnull += bc.bitLength();
      return msg;
    }
    if(!bc.has(32)) {
      msg.status = DecodeStatus::InsufficientData;
      return msg;
    }
    HASHeader& h = msg.header;
    h.toh = bc.getbitu(12);
    h.maskFlag = bc.getbitu(1);
    h.orbitFlag = bc.getbitu(1);
    h.clockFullFlag = bc.getbitu(1);
    h.clockSubsetFlag = bc.getbitu(1);
    h.codeBiasFlag = bc.getbitu(1);
    h.phaseBiasFlag = bc.getbitu(1);
    bc.skip(4);
    h.maskId = bc.getbitu(5);
    h.iodSet = bc.getbitu(5);
    d_header = h;
    if(h.toh >= 3600) {
      msg.status = DecodeStatus::MalformedHeader;
      msg.reason = fmt::format("HAS time of hour out of range: {}", h.toh);
      d_stats.bnull += bc.bitLength();
      return msg;
    }

    bool needsMask = h.orbitFlag || h.clockFullFlag || h.clockSubsetFlag || h.codeBiasFlag || h.phaseBiasFlag;
    if(!h.maskFlag && needsMask && (!d_mask || d_maskId != h.maskId)) {
      msg.status = DecodeStatus::SequencingError;
      msg.reason = fmt::format("HAS corrections for mask ID {} without that mask", h.maskId);
      return msg;
    }

    int other = bc.pos();
    if(h.maskFlag) {
      auto mask = buildMask(bc, MaskKind::HAS);
      if(!mask) {
        msg.status = DecodeStatus::InsufficientData;
        return msg;
      }
      if(d_statEnabled)
        msg.stats = d_stats.report();
      d_stats = BitStats();
      d_stats.nsat = mask->numSats();
      d_stats.nsig = mask->activeCells();
      d_mask = *mask;
      d_maskId = h.maskId;
      msg.mask = *mask;
      msg.trace += maskTrace(*mask, "MASK");
      other = bc.pos();
    }

    auto fail = [&msg]() {
      msg.status = DecodeStatus::InsufficientData;
      msg.trace.clear();
      return msg;
    };
    int start = bc.pos();
    if(h.orbitFlag && !(msg.orbit = parseOrbit(bc, msg.trace)))
      return fail();
    if(h.clockFullFlag && !(msg.clockFull = parseClockFull(bc, msg.trace)))
      return fail();
    if(h.clockSubsetFlag && !(msg.clockSubset = parseClockSubset(bc, msg.trace)))
      return fail();
    int sat = bc.pos() - start;
    start = bc.pos();
    if(h.codeBiasFlag && !(msg.codeBias = parseCodeBias(bc, msg.trace)))
      return fail();
    if(h.phaseBiasFlag && !(msg.phaseBias = parsePhaseBias(bc, msg.trace)))
      return fail();

    d_stats.bother += other;
    d_stats.bsat += sat;
    d_stats.bsig += bc.pos() - start;
    msg.bits = bc.pos();
    msg.summary = fmt::format("HAS toh={} mask_id={} iod_set={}{}{}{}{}{}{}", h.toh, h.maskId, h.iodSet,
                              h.maskFlag ? " MASK" : "", h.orbitFlag ? " ORBIT" : "",
                              h.clockFullFlag ? " CKFUL" : "", h.clockSubsetFlag ? " CKSUB" : "",
                              h.codeBiasFlag ? " CBIAS" : "", h.phaseBiasFlag ? " PBIAS" : "");
  }
  catch(InsufficientData& id) {
    msg.status = DecodeStatus::InsufficientData;
    msg.reason = fmt::format("needed {} bits at position {}, {} left", id.wanted, id.pos, id.available);
    msg.trace.clear();
  }
  catch(UnknownEnumeration& ue) {
    msg.status = DecodeStatus::UnknownEnumeration;
    msg.reason = ue.what();
    msg.trace.clear();
  }
  return msg;
}

std::optional<HASOrbit> HASSession::parseOrbit(BitCursor& bc, std::string& trace)
{
  HASOrbit ret;
  if(!bc.has(4))
    return std::optional<HASOrbit>();
  int vi = bc.getbitu(4);
  ret.validity = validityInterval(vi);
  trace += viTrace("ORBIT", vi);
  for(const auto& g : d_mask->gnss) {
    int bw = iodeBits(g.satsys);
    for(unsigned int s = 0; s < g.sats.size(); ++s) {
      if(!bc.has(bw + 13 + 12 + 12))
        return std::optional<HASOrbit>();
      OrbitCorrection oc;
      oc.id = g.satID(s);
      oc.iode = bc.getbitu(bw);
      oc.radial = getScaled(bc, 13, 0.0025);
      oc.along = getScaled(bc, 12, 0.008);
      oc.cross = getScaled(bc, 12, 0.008);
      trace += fmt::format("ORBIT {} IODE={:4d} d_radial={}m d_track={}m d_cross={}m\n", makeSatIDName(oc.id), oc.iode,
                           fmtScaled(oc.radial, 7, 4), fmtScaled(oc.along, 7, 4), fmtScaled(oc.cross, 7, 4));
      ret.sats.push_back(oc);
    }
  }
  return ret;
}

// one multiplier per GNSS of the mask up front, then a 13 bit clock for every satellite
std::optional<HASClock> HASSession::parseClockFull(BitCursor& bc, std::string& trace)
{
  HASClock ret;
  if(!bc.has(4 + 2 * d_mask->gnss.size()))
    return std::optional<HASClock>();
  int vi = bc.getbitu(4);
  ret.validity = validityInterval(vi);
  trace += viTrace("CKFUL", vi);
  vector<int> multipliers;
  for(unsigned int n = 0; n < d_mask->gnss.size(); ++n)
    multipliers.push_back(bc.getbitu(2) + 1);

  for(unsigned int i = 0; i < d_mask->gnss.size(); ++i) {
    const auto& g = d_mask->gnss[i];
    for(unsigned int s = 0; s < g.sats.size(); ++s) {
      if(!bc.has(13))
        return std::optional<HASClock>();
      ClockCorrection cc = hasClockValue(bc.getbits(13), multipliers[i]);
      cc.id = g.satID(s);
      trace += clockTrace("CKFUL", cc);
      ret.sats.push_back(cc);
    }
  }
  return ret;
}

/* Nsys GNSS, each with its id, a multiplier and a submask over the satellites
   the main mask has for that GNSS. Clocks only follow for the selected satellites. */
std::optional<HASClock> HASSession::parseClockSubset(BitCursor& bc, std::string& trace)
{
  HASClock ret;
  if(!bc.has(4 + 4))
    return std::optional<HASClock>();
  int vi = bc.getbitu(4);
  ret.validity = validityInterval(vi);
  int nsys = bc.getbitu(4);
  trace += fmt::format("CKSUB validity_interval={}s ({}), n_sub={}\n", ret.validity, vi, nsys);
  for(int n = 0; n < nsys; ++n) {
    if(!bc.has(4 + 2))
      return std::optional<HASClock>();
    int gnssid = bc.getbitu(4);
    int multiplier = bc.getbitu(2) + 1;
    char satsys = gnssIdToSatsys(gnssid);
    const MaskContext::GNSS* g = nullptr;
    for(const auto& cand : d_mask->gnss)
      if(cand.satsys == satsys)
        g = &cand;
    if(!g)
      throw UnknownEnumeration(fmt::format("clock subset for GNSS '{}' which is not in the mask", satsys), gnssid);
    if(!bc.has(g->sats.size()))
      return std::optional<HASClock>();
    vector<bool> submask;
    for(unsigned int s = 0; s < g->sats.size(); ++s)
      submask.push_back(bc.getbitu(1));
    for(unsigned int s = 0; s < g->sats.size(); ++s) {
      if(!submask[s])
        continue;
      if(!bc.has(13))
        return std::optional<HASClock>();
      ClockCorrection cc = hasClockValue(bc.getbits(13), multiplier);
      cc.id = g->satID(s);
      trace += clockTrace("CKSUB", cc);
      ret.sats.push_back(cc);
    }
  }
  return ret;
}

std::optional<HASCodeBias> HASSession::parseCodeBias(BitCursor& bc, std::string& trace)
{
  HASCodeBias ret;
  if(!bc.has(4))
    return std::optional<HASCodeBias>();
  int vi = bc.getbitu(4);
  ret.validity = validityInterval(vi);
  trace += viTrace("CBIAS", vi);
  if(!bc.has(11 * d_mask->activeCells()))
    return std::optional<HASCodeBias>();
  for(const auto& g : d_mask->gnss) {
    for(unsigned int s = 0; s < g.sats.size(); ++s) {
      for(unsigned int n = 0; n < g.signals.size(); ++n) {
        if(!g.cell(s, n))
          continue;
        CodeBias cb;
        cb.id = g.satID(s);
        cb.signal = g.signals[n];
        cb.bias = getScaled(bc, 11, 0.02);
        trace += fmt::format("CBIAS {} {:<13} code_bias={}m\n", makeSatIDName(cb.id), cb.signal, fmtScaled(cb.bias, 7, 3));
        ret.cells.push_back(cb);
      }
    }
  }
  return ret;
}

std::optional<HASPhaseBias> HASSession::parsePhaseBias(BitCursor& bc, std::string& trace)
{
  HASPhaseBias ret;
  if(!bc.has(4))
    return std::optional<HASPhaseBias>();
  int vi = bc.getbitu(4);
  ret.validity = validityInterval(vi);
  trace += viTrace("PBIAS", vi);
  for(const auto& g : d_mask->gnss) {
    for(unsigned int s = 0; s < g.sats.size(); ++s) {
      for(unsigned int n = 0; n < g.signals.size(); ++n) {
        if(!g.cell(s, n))
          continue;
        if(!bc.has(11 + 2))
          return std::optional<HASPhaseBias>();
        PhaseBias pb;
        pb.id = g.satID(s);
        pb.signal = g.signals[n];
        pb.bias = getScaled(bc, 11, 0.01);
        pb.discontinuity = bc.getbitu(2);
        trace += fmt::format("PBIAS {} {:<13} phase_bias={}cycle discont_indicator={}\n", makeSatIDName(pb.id), pb.signal,
                             fmtScaled(pb.bias, 7, 3), pb.discontinuity);
        ret.cells.push_back(pb);
      }
    }
  }
  return ret;
}
