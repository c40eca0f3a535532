#include "cssr.hh"
#include "fmt/format.h"
#include "fmt/printf.h"

using namespace std;

int MaskContext::GNSS::activeCells() const
{
  int ret=0;
  for(bool c : cellmask)
    if(c)
      ++ret;
  return ret;
}

int MaskContext::numSats() const
{
  int ret=0;
  for(const auto& g : gnss)
    ret += g.sats.size();
  return ret;
}

int MaskContext::activeCells() const
{
  int ret=0;
  for(const auto& g : gnss)
    ret += g.activeCells();
  return ret;
}

/* per GNSS: 4 bits id, 40 bits satellite mask, 16 bits signal mask, 1 bit cell mask flag,
   then the cell mask if the flag is set. HAS adds 3 bits of navigation message per GNSS
   and 6 reserved bits at the very end */
std::optional<MaskContext> buildMask(BitCursor& bc, MaskKind kind)
{
  MaskContext ret;
  if(!bc.has(4))
    return std::optional<MaskContext>();
  int ngnss = bc.getbitu(4);
  for(int n = 0 ; n < ngnss; ++n) {
    if(!bc.has(4 + 40 + 16 + 1))
      return std::optional<MaskContext>();
    MaskContext::GNSS g;
    int gnssid = bc.getbitu(4);
    uint64_t satmask = bc.getbitu64(40);
    unsigned int sigmask = bc.getbitu(16);
    bool cmavail = bc.getbitu(1);
    g.satsys = gnssIdToSatsys(gnssid);

    for(int i = 0; i < 40; ++i)
      if(satmask & (1ULL << (39 - i)))
        g.sats.push_back(i + 1);
    for(int i = 0; i < 16; ++i)
      if(sigmask & (1u << (15 - i)))
        g.signals.push_back(signalName(g.satsys, i));

    int ncell = g.sats.size() * g.signals.size();
    if(cmavail) {
      if(!bc.has(ncell))
        return std::optional<MaskContext>();
      for(int i = 0; i < ncell; ++i)
        g.cellmask.push_back(bc.getbitu(1));
    }
    else
      g.cellmask.assign(ncell, true);

    if(kind == MaskKind::HAS) {
      if(!bc.has(3))
        return std::optional<MaskContext>();
      g.navmsg = bc.getbitu(3);
    }
    ret.gnss.push_back(g);
  }
  if(kind == MaskKind::HAS) {
    if(!bc.has(6))
      return std::optional<MaskContext>();
    bc.skip(6);
  }
  return ret;
}

string maskTrace(const MaskContext& mask, const std::string& prefix)
{
  string ret;
  for(const auto& g : mask.gnss) {
    for(unsigned int s = 0; s < g.sats.size(); ++s) {
      ret += prefix + " " + makeSatIDName(g.satID(s));
      for(unsigned int n = 0; n < g.signals.size(); ++n)
        if(g.cell(s, n))
          ret += " " + g.signals[n];
      ret += "\n";
    }
    if(g.navmsg != 0)
      ret += fmt::format("Warning: HAS NM is not zero ({}) for {}\n", g.navmsg, g.satsys);
  }
  return ret;
}

std::optional<SatSubset> getSatSubset(BitCursor& bc, const MaskContext& mask)
{
  SatSubset ret;
  for(const auto& g : mask.gnss) {
    if(!bc.has(g.sats.size()))
      return std::optional<SatSubset>();
    vector<bool> sub;
    for(unsigned int n = 0; n < g.sats.size(); ++n)
      sub.push_back(bc.getbitu(1));
    ret.push_back(sub);
  }
  return ret;
}

SatSubset fullSatSubset(const MaskContext& mask)
{
  SatSubset ret;
  for(const auto& g : mask.gnss)
    ret.push_back(vector<bool>(g.sats.size(), true));
  return ret;
}

int iodeBits(char satsys)
{
  return satsys == 'E' ? 10 : 8;
}

string BitStats::report() const
{
  return fmt::format("stat n_sat {} n_sig {} bit_sat {} bit_sig {} bit_other {} bit_null {} bit_total {}",
                     nsat, nsig, bsat, bsig, bother, bnull, total());
}

/* The polynomial grows with the correction type: 0 is c00 only, 1 adds
   c01 & c10, 2 adds c11, 3 adds c02 & c20. Absent terms are not sent. */
std::optional<StecPolynomial> getStecPolynomial(BitCursor& bc, int type, bool withType)
{
  StecPolynomial ret;
  if(!bc.has(6 + (withType ? 2 : 0) + 14))
    return std::optional<StecPolynomial>();
  ret.quality = bc.getbitu(6);
  ret.type = withType ? bc.getbitu(2) : type;
  ret.c00 = getScaled(bc, 14, 0.05);
  if(ret.type >= 1) {
    if(!bc.has(12 + 12))
      return std::optional<StecPolynomial>();
    ret.c01 = getScaled(bc, 12, 0.02);
    ret.c10 = getScaled(bc, 12, 0.02);
  }
  if(ret.type >= 2) {
    if(!bc.has(10))
      return std::optional<StecPolynomial>();
    ret.c11 = getScaled(bc, 10, 0.02);
  }
  if(ret.type >= 3) {
    if(!bc.has(8 + 8))
      return std::optional<StecPolynomial>();
    ret.c02 = getScaled(bc, 8, 0.005);
    ret.c20 = getScaled(bc, 8, 0.005);
  }
  return ret;
}

string stecTrace(const StecPolynomial& poly)
{
  string ret = " c00="+fmtScaled(poly.c00, 6, 3)+"TECU";
  if(poly.type >= 1)
    ret += " c01="+fmtScaled(poly.c01, 6, 3)+"TECU/deg c10="+fmtScaled(poly.c10, 6, 3)+"TECU/deg";
  if(poly.type >= 2)
    ret += " c11="+fmtScaled(poly.c11, 6, 3)+"TECU/deg^2";
  if(poly.type >= 3)
    ret += " c02="+fmtScaled(poly.c02, 6, 3)+"TECU/deg^2 c20="+fmtScaled(poly.c20, 6, 3)+"TECU/deg^2";
  return ret;
}

/*
   0   12 bits message number, 4073
   12   4 bits subtype
   16  20 bits GPS epoch time (ST1) or 12 bits GNSS hourly epoch time (others)
        4 bits update interval
        1 bit multiple message indicator
        4 bits IOD SSR
   ST10 has nothing beyond the subtype.
*/
DecodeStatus CSSRSession::decodeHeader(BitCursor& bc, CSSRMessage& msg)
{
  if(bc.isNull()) {
    msg.reason = fmt::format("CSSR null data {} bits", bc.bitLength());
    d_stats.bnull += bc.bitLength();
    return DecodeStatus::MalformedHeader;
  }
  CSSRHeader& h = msg.header;
  if(!bc.has(12))
    return DecodeStatus::InsufficientData;
  h.msgnum = bc.getbitu(12);
  if(h.msgnum != c_msgnum) {
    msg.reason = fmt::format("CSSR msgnum should be {} ({}), {} bits", c_msgnum, h.msgnum, bc.bitLength());
    d_stats.bnull += bc.bitLength();
    return DecodeStatus::MalformedHeader;
  }
  if(!bc.has(4))
    return DecodeStatus::InsufficientData;
  h.subtype = bc.getbitu(4);
  if(h.subtype == 10)
    return DecodeStatus::Ok;
  if(h.subtype == 1) {
    if(!bc.has(20))
      return DecodeStatus::InsufficientData;
    h.epoch = bc.getbitu(20);
  }
  else {
    if(!bc.has(12))
      return DecodeStatus::InsufficientData;
    h.hepoch = bc.getbitu(12);
  }
  if(!bc.has(4 + 1 + 4))
    return DecodeStatus::InsufficientData;
  h.interval = bc.getbitu(4);
  h.mmi = bc.getbitu(1);
  h.iod = bc.getbitu(4);
  return DecodeStatus::Ok;
}

CSSRMessage CSSRSession::decode(std::basic_string_view<uint8_t> payload, int bitlen)
{
  CSSRMessage msg;
  try {
    BitCursor bc(payload, 0, bitlen);
    msg.status = decodeHeader(bc, msg);
    d_header = msg.header;
    if(msg.status != DecodeStatus::Ok)
      return msg;

    int subtype = msg.header.subtype;
    if(subtype < 1 || subtype > 12) {
      msg.status = DecodeStatus::UnknownEnumeration;
      msg.reason = fmt::format("unknown CSSR subtype: {}", subtype);
      return msg;
    }
    if(subtype != 1 && subtype != 10 && !d_mask) {
      msg.status = DecodeStatus::SequencingError;
      msg.reason = fmt::format("CSSR subtype {} before any mask message", subtype);
      return msg;
    }

    bool ok=false;
    auto store = [&msg, &ok](auto res) {
      if(res) {
        msg.body = *res;
        ok = true;
      }
    };
    switch(subtype) {
    case 1:  store(parseST1(bc, msg.trace)); break;
    case 2:  store(parseST2(bc, msg.trace)); break;
    case 3:  store(parseST3(bc, msg.trace)); break;
    case 4:  store(parseST4(bc, msg.trace)); break;
    case 5:  store(parseST5(bc, msg.trace)); break;
    case 6:  store(parseST6(bc, msg.trace)); break;
    case 7:  store(parseST7(bc, msg.trace)); break;
    case 8:  store(parseST8(bc, msg.trace)); break;
    case 9:  store(parseST9(bc, msg.trace)); break;
    case 10: store(parseST10(bc, msg.trace)); break;
    case 11: store(parseST11(bc, msg.trace)); break;
    case 12: store(parseST12(bc, msg.trace)); break;
    }
    if(!ok) {
      msg.status = DecodeStatus::InsufficientData;
      msg.trace.clear();
      return msg;
    }
    msg.bits = bc.pos();

    if(subtype == 1) {
      if(d_statEnabled)
        msg.stats = d_stats.report();
      d_stats = BitStats();
      d_stats.bother = bc.pos();
      d_stats.nsat = d_mask->numSats();
      d_stats.nsig = d_mask->activeCells();
      msg.summary = fmt::format("ST{:<2d} epoch={} iod={}", subtype, msg.header.epoch, msg.header.iod);
    }
    else if(subtype == 10)
      msg.summary = fmt::format("ST{:<2d}", subtype);
    else
      msg.summary = fmt::format("ST{:<2d} hepoch={} iod={}", subtype, msg.header.hepoch, msg.header.iod);
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

// the mask only replaces the stored one once it has been read completely
std::optional<CSSRMask> CSSRSession::parseST1(BitCursor& bc, std::string& trace)
{
  auto mask = buildMask(bc, MaskKind::CSSR);
  if(!mask)
    return std::optional<CSSRMask>();
  d_mask = *mask;
  trace += maskTrace(*mask, "ST1");
  return CSSRMask{*mask};
}

std::optional<CSSROrbit> CSSRSession::parseST2(BitCursor& bc, std::string& trace)
{
  int start = bc.pos();
  CSSROrbit ret;
  for(const auto& g : d_mask->gnss) {
    int bw = iodeBits(g.satsys);
    for(unsigned int s = 0; s < g.sats.size(); ++s) {
      if(!bc.has(bw + 15 + 13 + 13))
        return std::optional<CSSROrbit>();
      OrbitCorrection oc;
      oc.id = g.satID(s);
      oc.iode = bc.getbitu(bw);
      oc.radial = getScaled(bc, 15, 0.0016);
      oc.along = getScaled(bc, 13, 0.0064);
      oc.cross = getScaled(bc, 13, 0.0064);
      trace += fmt::format("ST2 {} IODE={:4d} d_radial={}m d_along={}m d_cross={}m\n", makeSatIDName(oc.id), oc.iode,
                           fmtScaled(oc.radial, 7, 4), fmtScaled(oc.along, 7, 4), fmtScaled(oc.cross, 7, 4));
      ret.sats.push_back(oc);
    }
  }
  d_stats.bother += start;
  d_stats.bsat += bc.pos() - start;
  return ret;
}

std::optional<CSSRClock> CSSRSession::parseST3(BitCursor& bc, std::string& trace)
{
  int start = bc.pos();
  CSSRClock ret;
  for(const auto& g : d_mask->gnss) {
    for(unsigned int s = 0; s < g.sats.size(); ++s) {
      if(!bc.has(15))
        return std::optional<CSSRClock>();
      ClockCorrection cc;
      cc.id = g.satID(s);
      cc.c0 = getScaled(bc, 15, 0.0016);
      trace += fmt::format("ST3 {} d_clock={}m\n", makeSatIDName(cc.id), fmtScaled(cc.c0, 7, 3));
      ret.sats.push_back(cc);
    }
  }
  d_stats.bother += start;
  d_stats.bsat += bc.pos() - start;
  return ret;
}

std::optional<CSSRCodeBias> CSSRSession::parseST4(BitCursor& bc, std::string& trace)
{
  if(!bc.has(11 * d_mask->activeCells()))
    return std::optional<CSSRCodeBias>();
  int start = bc.pos();
  CSSRCodeBias ret;
  for(const auto& g : d_mask->gnss) {
    for(unsigned int s = 0; s < g.sats.size(); ++s) {
      for(unsigned int n = 0; n < g.signals.size(); ++n) {
        if(!g.cell(s, n))
          continue;
        CodeBias cb;
        cb.id = g.satID(s);
        cb.signal = g.signals[n];
        cb.bias = getScaled(bc, 11, 0.02);
        trace += fmt::format("ST4 {} {:<13} code_bias={}m\n", makeSatIDName(cb.id), cb.signal, fmtScaled(cb.bias, 7, 3));
        ret.cells.push_back(cb);
      }
    }
  }
  d_stats.bother += start;
  d_stats.bsig += bc.pos() - start;
  return ret;
}

std::optional<CSSRPhaseBias> CSSRSession::parseST5(BitCursor& bc, std::string& trace)
{
  int start = bc.pos();
  CSSRPhaseBias ret;
  for(const auto& g : d_mask->gnss) {
    for(unsigned int s = 0; s < g.sats.size(); ++s) {
      for(unsigned int n = 0; n < g.signals.size(); ++n) {
        if(!g.cell(s, n))
          continue;
        if(!bc.has(15 + 2))
          return std::optional<CSSRPhaseBias>();
        PhaseBias pb;
        pb.id = g.satID(s);
        pb.signal = g.signals[n];
        pb.bias = getScaled(bc, 15, 0.001);
        pb.discontinuity = bc.getbitu(2);
        trace += fmt::format("ST5 {} {:<13} phase_bias={}m discont_indicator={}\n", makeSatIDName(pb.id), pb.signal,
                             fmtScaled(pb.bias, 7, 3), pb.discontinuity);
        ret.cells.push_back(pb);
      }
    }
  }
  d_stats.bother += start;
  d_stats.bsig += bc.pos() - start;
  return ret;
}

std::optional<CSSRNetworkBias> CSSRSession::parseST6(BitCursor& bc, std::string& trace)
{
  int start = bc.pos();
  CSSRNetworkBias ret;
  if(!bc.has(3))
    return std::optional<CSSRNetworkBias>();
  ret.code = bc.getbitu(1);
  ret.phase = bc.getbitu(1);
  ret.network = bc.getbitu(1);
  trace += fmt::format("ST6 code_bias={} phase_bias={} network_bias={}\n",
                       ret.code ? "on" : "off", ret.phase ? "on" : "off", ret.network ? "on" : "off");
  SatSubset subset;
  if(ret.network) {
    if(!bc.has(5))
      return std::optional<CSSRNetworkBias>();
    ret.nid = bc.getbitu(5);
    trace += fmt::format("ST6 NID={}\n", ret.nid);
    auto sub = getSatSubset(bc, *d_mask);
    if(!sub)
      return std::optional<CSSRNetworkBias>();
    subset = *sub;
  }
  else
    subset = fullSatSubset(*d_mask);

  for(unsigned int i = 0; i < d_mask->gnss.size(); ++i) {
    const auto& g = d_mask->gnss[i];
    for(unsigned int s = 0; s < g.sats.size(); ++s) {
      if(!subset[i][s])
        continue;
      for(unsigned int n = 0; n < g.signals.size(); ++n) {
        if(!g.cell(s, n))
          continue;
        NetworkBias nb;
        nb.id = g.satID(s);
        nb.signal = g.signals[n];
        trace += fmt::format("ST6 {} {:<13}", makeSatIDName(nb.id), nb.signal);
        if(ret.code) {
          if(!bc.has(11))
            return std::optional<CSSRNetworkBias>();
          nb.hasCode = true;
          nb.code = getScaled(bc, 11, 0.02);
          trace += " code_bias="+fmtScaled(nb.code, 7, 3)+"m";
        }
        if(ret.phase) {
          if(!bc.has(15 + 2))
            return std::optional<CSSRNetworkBias>();
          nb.hasPhase = true;
          nb.phase = getScaled(bc, 15, 0.001);
          nb.discontinuity = bc.getbitu(2);
          trace += " phase_bias="+fmtScaled(nb.phase, 7, 3)+"m discont_indi="+std::to_string(nb.discontinuity);
        }
        trace += "\n";
        ret.cells.push_back(nb);
      }
    }
  }
  d_stats.bother += start + 3;
  d_stats.bsig += bc.pos() - start - 3;
  return ret;
}

std::optional<CSSRUra> CSSRSession::parseST7(BitCursor& bc, std::string& trace)
{
  int start = bc.pos();
  CSSRUra ret;
  for(const auto& g : d_mask->gnss) {
    for(unsigned int s = 0; s < g.sats.size(); ++s) {
      if(!bc.has(6))
        return std::optional<CSSRUra>();
      UraCorrection uc;
      uc.id = g.satID(s);
      uc.ura = bc.getbitu(6);
      uc.metres = cssrUraMetres(uc.ura);
      trace += fmt::format("ST7 {} URA {} ({}m)\n", makeSatIDName(uc.id), uc.ura, fmtUra(uc.ura, 7, 4));
      ret.sats.push_back(uc);
    }
  }
  d_stats.bother += start;
  d_stats.bsat += bc.pos() - start;
  return ret;
}

std::optional<CSSRStec> CSSRSession::parseST8(BitCursor& bc, std::string& trace)
{
  int start = bc.pos();
  CSSRStec ret;
  if(!bc.has(2 + 5))
    return std::optional<CSSRStec>();
  ret.type = bc.getbitu(2);
  ret.nid = bc.getbitu(5);
  auto subset = getSatSubset(bc, *d_mask);
  if(!subset)
    return std::optional<CSSRStec>();
  for(unsigned int i = 0; i < d_mask->gnss.size(); ++i) {
    const auto& g = d_mask->gnss[i];
    for(unsigned int s = 0; s < g.sats.size(); ++s) {
      if(!(*subset)[i][s])
        continue;
      StecCorrection sc;
      sc.id = g.satID(s);
      auto poly = getStecPolynomial(bc, ret.type, false);
      if(!poly)
        return std::optional<CSSRStec>();
      sc.poly = *poly;
      trace += "ST8 "+makeSatIDName(sc.id)+stecTrace(sc.poly)+"\n";
      ret.sats.push_back(sc);
    }
  }
  d_stats.bother += start + 7;
  d_stats.bsat += bc.pos() - start - 7;
  return ret;
}

/* gridded troposphere with STEC residuals. The residuals are 16 bits if the range
   bit is set, 7 otherwise, 0.04 TECU either way */
std::optional<CSSRGridded> CSSRSession::parseST9(BitCursor& bc, std::string& trace)
{
  CSSRGridded ret;
  if(!bc.has(2 + 1 + 5))
    return std::optional<CSSRGridded>();
  ret.type = bc.getbitu(2);
  ret.range = bc.getbitu(1);
  int bw = ret.range ? 16 : 7;
  ret.nid = bc.getbitu(5);
  auto subset = getSatSubset(bc, *d_mask);
  if(!subset)
    return std::optional<CSSRGridded>();
  if(!bc.has(6 + 6))
    return std::optional<CSSRGridded>();
  ret.quality = bc.getbitu(6);
  int ngrid = bc.getbitu(6);
  trace += fmt::format("ST9 Trop correct_type={} NID={} quality={} ngrid={}\n", ret.type, ret.nid, ret.quality, ngrid);
  for(int n = 0; n < ngrid; ++n) {
    if(!bc.has(9 + 8))
      return std::optional<CSSRGridded>();
    TropoGrid tg;
    tg.hydrostatic = getScaled(bc, 9, 0.004);
    tg.wet = getScaled(bc, 8, 0.004);
    trace += fmt::format("ST9 Trop     grid {:2d}/{:2d} dry-delay={}m wet-delay={}m\n", n+1, ngrid,
                         fmtScaled(tg.hydrostatic, 6, 3), fmtScaled(tg.wet, 6, 3));
    for(unsigned int i = 0; i < d_mask->gnss.size(); ++i) {
      const auto& g = d_mask->gnss[i];
      for(unsigned int s = 0; s < g.sats.size(); ++s) {
        if(!(*subset)[i][s])
          continue;
        if(!bc.has(bw))
          return std::optional<CSSRGridded>();
        GridResidual gr;
        gr.id = g.satID(s);
        gr.residual = getScaled(bc, bw, 0.04);
        trace += fmt::format("ST9 STEC {} grid {:2d}/{:2d} residual={}TECU ({}bit)\n", makeSatIDName(gr.id), n+1, ngrid,
                             fmtScaled(gr.residual, 6, 3), bw);
        tg.stec.push_back(gr);
      }
    }
    ret.grids.push_back(tg);
  }
  d_stats.bother += bc.pos();
  return ret;
}

// service information, an opaque blob of 40, 80, 120 or 160 bits
std::optional<CSSRServiceInfo> CSSRSession::parseST10(BitCursor& bc, std::string& trace)
{
  CSSRServiceInfo ret;
  if(!bc.has(3 + 2))
    return std::optional<CSSRServiceInfo>();
  ret.counter = bc.getbitu(3);
  int dsize = (bc.getbitu(2) + 1) * 40;
  if(!bc.has(dsize))
    return std::optional<CSSRServiceInfo>();
  ret.data = bc.getBytes(dsize);
  trace += fmt::format("ST10 {}:{}\n", ret.counter, makeHexDump(ret.data));
  d_stats.bother += bc.pos();
  return ret;
}

std::optional<CSSROrbitClock> CSSRSession::parseST11(BitCursor& bc, std::string& trace)
{
  int start = bc.pos();
  CSSROrbitClock ret;
  if(!bc.has(3))
    return std::optional<CSSROrbitClock>();
  ret.orbit = bc.getbitu(1);
  ret.clock = bc.getbitu(1);
  ret.network = bc.getbitu(1);
  trace += fmt::format("ST11 Orb={} Clk={} Net={}\n", ret.orbit ? "on" : "off", ret.clock ? "on" : "off", ret.network ? "on" : "off");
  SatSubset subset;
  if(ret.network) {
    if(!bc.has(5))
      return std::optional<CSSROrbitClock>();
    ret.nid = bc.getbitu(5);
    trace += fmt::format("ST11 NID={}\n", ret.nid);
    auto sub = getSatSubset(bc, *d_mask);
    if(!sub)
      return std::optional<CSSROrbitClock>();
    subset = *sub;
  }
  else
    subset = fullSatSubset(*d_mask);

  for(unsigned int i = 0; i < d_mask->gnss.size(); ++i) {
    const auto& g = d_mask->gnss[i];
    for(unsigned int s = 0; s < g.sats.size(); ++s) {
      if(!subset[i][s])
        continue;
      OrbitClock oc;
      oc.id = g.satID(s);
      trace += "ST11 "+makeSatIDName(oc.id);
      if(ret.orbit) {
        int bw = iodeBits(g.satsys);
        if(!bc.has(bw + 15 + 13 + 13))
          return std::optional<CSSROrbitClock>();
        OrbitCorrection orb;
        orb.id = oc.id;
        orb.iode = bc.getbitu(bw);
        orb.radial = getScaled(bc, 15, 0.0016);
        orb.along = getScaled(bc, 13, 0.0064);
        orb.cross = getScaled(bc, 13, 0.0064);
        trace += fmt::format(" IODE={:4d} d_radial={}m d_along={}m d_cross={}m", orb.iode,
                             fmtScaled(orb.radial, 7, 4), fmtScaled(orb.along, 7, 4), fmtScaled(orb.cross, 7, 4));
        oc.orbit = orb;
      }
      if(ret.clock) {
        if(!bc.has(15))
          return std::optional<CSSROrbitClock>();
        ClockCorrection clk;
        clk.id = oc.id;
        clk.c0 = getScaled(bc, 15, 0.0016);
        trace += " c0="+fmtScaled(clk.c0, 7, 3)+"m";
        oc.clock = clk;
      }
      trace += "\n";
      ret.sats.push_back(oc);
    }
  }
  // the network id and satellite subset count as 'other'
  int other = 3 + (ret.network ? 5 : 0);
  d_stats.bother += start + other;
  d_stats.bsat += bc.pos() - start - other;
  return ret;
}

std::optional<CSSRNetwork> CSSRSession::parseST12(BitCursor& bc, std::string& trace)
{
  CSSRNetwork ret;
  if(!bc.has(2 + 2 + 5 + 6))
    return std::optional<CSSRNetwork>();
  ret.tropoAvail = bc.getbitu(2);
  ret.stecAvail = bc.getbitu(2);
  ret.nid = bc.getbitu(5);
  ret.ngrid = bc.getbitu(6);
  trace += fmt::format("ST12 tropo={} stec={} NID={} ngrid={}\n", ret.tropoAvail, ret.stecAvail, ret.nid, ret.ngrid);

  if(ret.tropoAvail & 2) {   // polynomial
    if(!bc.has(6 + 2 + 9))
      return std::optional<CSSRNetwork>();
    ret.tropoQuality = bc.getbitu(6);
    ret.tropoType = bc.getbitu(2);
    ret.t00 = getScaled(bc, 9, 0.004);
    trace += fmt::format("ST12 Trop quality={} correct_type(0-2)={} t00={}m", ret.tropoQuality, ret.tropoType, fmtScaled(ret.t00, 0, 3));
    if(ret.tropoType >= 1) {
      if(!bc.has(7 + 7))
        return std::optional<CSSRNetwork>();
      ret.t01 = getScaled(bc, 7, 0.002);
      ret.t10 = getScaled(bc, 7, 0.002);
      trace += " t01="+fmtScaled(ret.t01, 0, 3)+"m/deg t10="+fmtScaled(ret.t10, 0, 3)+"m/deg";
    }
    if(ret.tropoType >= 2) {
      if(!bc.has(7))
        return std::optional<CSSRNetwork>();
      ret.t11 = getScaled(bc, 7, 0.001);
      trace += " t11="+fmtScaled(ret.t11, 0, 3)+"m/deg^2";
    }
    trace += "\n";
  }
  if(ret.tropoAvail & 1) {   // residuals
    if(!bc.has(1 + 4))
      return std::optional<CSSRNetwork>();
    ret.tropoResidualBits = bc.getbitu(1) ? 8 : 6;
    ret.tropoOffset = bc.getbitu(4) * 0.02;
    trace += fmt::format("ST12 Trop offset={:.3f}m\n", ret.tropoOffset);
    if(!bc.has(ret.tropoResidualBits * ret.ngrid))
      return std::optional<CSSRNetwork>();
    for(int n = 0; n < ret.ngrid; ++n) {
      Scaled tr = getScaled(bc, ret.tropoResidualBits, 0.004);
      trace += fmt::format("ST12 Trop grid {:2d}/{:2d} residual={}m ({}bit)\n", n+1, ret.ngrid, fmtScaled(tr, 7, 3), ret.tropoResidualBits);
      ret.tropoResiduals.push_back(tr);
    }
  }

  int start = bc.pos();
  if(ret.stecAvail & 2) {
    auto subset = getSatSubset(bc, *d_mask);
    if(!subset)
      return std::optional<CSSRNetwork>();
    for(unsigned int i = 0; i < d_mask->gnss.size(); ++i) {
      const auto& g = d_mask->gnss[i];
      for(unsigned int s = 0; s < g.sats.size(); ++s) {
        if(!(*subset)[i][s])
          continue;
        StecCorrection sc;
        sc.id = g.satID(s);
        auto poly = getStecPolynomial(bc, 0, true);
        if(!poly)
          return std::optional<CSSRNetwork>();
        sc.poly = *poly;
        trace += fmt::format("ST12 STEC {} quality={:02x} type={}", makeSatIDName(sc.id), sc.poly.quality, sc.poly.type)
          + stecTrace(sc.poly) + "\n";

        if(!bc.has(2))
          return std::optional<CSSRNetwork>();
        static const int rbits[4]={4, 4, 5, 7};
        static const double rlsb[4]={0.04, 0.12, 0.16, 0.24};
        int srs = bc.getbitu(2);
        sc.residualBits = rbits[srs];
        for(int n = 0; n < ret.ngrid; ++n) {
          if(!bc.has(sc.residualBits))
            return std::optional<CSSRNetwork>();
          Scaled sr = getScaled(bc, sc.residualBits, rlsb[srs]);
          trace += fmt::format("ST12 STEC {} grid {:2d}/{:2d} residual={}TECU ({}bit)\n", makeSatIDName(sc.id), n+1, ret.ngrid,
                               fmtScaled(sr, 6, 3), sc.residualBits);
          sc.residuals.push_back(sr);
        }
        ret.stec.push_back(sc);
      }
    }
  }
  d_stats.bother += start;
  d_stats.bsat += bc.pos() - start;
  return ret;
}
