#include "protoconv.hh"
#include <arpa/inet.h>
#include <string.h>

using namespace std;

static string gnssName(const SatID& id)
{
  return string(1, id.gnss);
}

static void fillRecord(SsrMonMessage::Ephemeris* pe, const KeplerEphemeris& eph)
{
  pe->set_gnsssv(eph.sv);
  pe->set_wn(eph.wn);
  pe->set_iod(eph.getIOD());
  pe->set_t0e(eph.getT0e());
  pe->set_t0c(eph.getT0c());
  pe->set_sqrta(eph.getSqrtA());
  pe->set_e(eph.getE());
  pe->set_m0(eph.getM0());
  pe->set_deltan(eph.getDeltan());
  pe->set_omega0(eph.getOmega0());
  pe->set_i0(eph.getI0());
  pe->set_omega(eph.getOmega());
  pe->set_omegadot(eph.getOmegadot());
  pe->set_idot(eph.getIdot());
  pe->set_cuc(eph.getCuc());
  pe->set_cus(eph.getCus());
  pe->set_crc(eph.getCrc());
  pe->set_crs(eph.getCrs());
  pe->set_cic(eph.getCic());
  pe->set_cis(eph.getCis());
  pe->set_af0(eph.getAf0());
  pe->set_af1(eph.getAf1());
  pe->set_af2(eph.getAf2());
}

static void fillRecord(SsrMonMessage::Ephemeris* pe, const GlonassEphemeris& eph)
{
  pe->set_gnsssv(eph.sv);
  pe->set_iod(eph.getIOD());
  pe->set_x(eph.getX());
  pe->set_y(eph.getY());
  pe->set_z(eph.getZ());
  pe->set_dx(eph.getdX());
  pe->set_dy(eph.getdY());
  pe->set_dz(eph.getdZ());
  pe->set_taun(eph.getTaun());
  pe->set_gamman(eph.getGamman());
  pe->set_tbminutes(eph.getTbMinutes());
  pe->set_freqchannel((int)eph.freqChannel - 7);
}

void fillProto(SsrMonMessage::Ephemeris* pe, const EphemerisResult& er)
{
  pe->set_gnss(string(1, er.satsys));
  std::visit([pe](const auto& eph) { fillRecord(pe, eph); }, er.record);
  if(!er.accuracy.empty())
    pe->set_accuracy(er.accuracy);
  pe->set_healthy(!er.unhealthy());
  for(const auto& h : er.health)
    pe->add_health(h.text);
}

static void fillOrbit(SsrMonMessage::Corrections* pc, const OrbitCorrection& oc)
{
  auto po = pc->add_orbits();
  po->set_gnss(gnssName(oc.id));
  po->set_gnsssv(oc.id.sv);
  po->set_iode(oc.iode);
  if(oc.radial)
    po->set_radial(*oc.radial);
  if(oc.along)
    po->set_along(*oc.along);
  if(oc.cross)
    po->set_cross(*oc.cross);
}

static void fillClock(SsrMonMessage::Corrections* pc, const ClockCorrection& cc)
{
  auto po = pc->add_clocks();
  po->set_gnss(gnssName(cc.id));
  po->set_gnsssv(cc.id.sv);
  if(cc.c0)
    po->set_c0(*cc.c0);
  po->set_multiplier(cc.multiplier);
  po->set_donotuse(cc.doNotUse);
}

static void fillCodeBias(SsrMonMessage::Corrections* pc, const CodeBias& cb)
{
  auto po = pc->add_biases();
  po->set_gnss(gnssName(cb.id));
  po->set_gnsssv(cb.id.sv);
  po->set_signal(cb.signal);
  if(cb.bias)
    po->set_code(*cb.bias);
}

static void fillPhaseBias(SsrMonMessage::Corrections* pc, const PhaseBias& pb)
{
  auto po = pc->add_biases();
  po->set_gnss(gnssName(pb.id));
  po->set_gnsssv(pb.id.sv);
  po->set_signal(pb.signal);
  if(pb.bias)
    po->set_phase(*pb.bias);
  po->set_discontinuity(pb.discontinuity);
}

static void fillStec(SsrMonMessage::Corrections* pc, const StecCorrection& sc)
{
  auto po = pc->add_stecs();
  po->set_gnss(gnssName(sc.id));
  po->set_gnsssv(sc.id.sv);
  po->set_quality(sc.poly.quality);
  po->set_type(sc.poly.type);
  if(sc.poly.c00)
    po->set_c00(*sc.poly.c00);
  if(sc.poly.c01)
    po->set_c01(*sc.poly.c01);
  if(sc.poly.c10)
    po->set_c10(*sc.poly.c10);
  if(sc.poly.c11)
    po->set_c11(*sc.poly.c11);
  if(sc.poly.c02)
    po->set_c02(*sc.poly.c02);
  if(sc.poly.c20)
    po->set_c20(*sc.poly.c20);
  int n = 0;
  for(const auto& r : sc.residuals) {
    auto pr = po->add_residuals();
    pr->set_grid(++n);
    if(r)
      pr->set_value(*r);
  }
}

void fillProto(SsrMonMessage::Corrections* pc, const SSRMessage& sm)
{
  pc->set_epoch(sm.sow);
  pc->set_iod(sm.ssrIOD);
  for(const auto& ed : sm.d_ephs) {
    auto po = pc->add_orbits();
    po->set_gnss(gnssName(ed.id));
    po->set_gnsssv(ed.id.sv);
    po->set_iode(ed.iod);
    po->set_radial(ed.radial / 1000);
    po->set_along(ed.along / 1000);
    po->set_cross(ed.cross / 1000);
    po->set_dradial(ed.dradial / 1000);
    po->set_dalong(ed.dalong / 1000);
    po->set_dcross(ed.dcross / 1000);
  }
  for(const auto& cd : sm.d_clocks) {
    auto po = pc->add_clocks();
    po->set_gnss(gnssName(cd.id));
    po->set_gnsssv(cd.id.sv);
    po->set_c0(cd.dclock0);
    po->set_c1(cd.dclock1);
    po->set_c2(cd.dclock2);
  }
  for(const auto& hr : sm.d_hrclocks) {
    auto po = pc->add_clocks();
    po->set_gnss(gnssName(hr.id));
    po->set_gnsssv(hr.id.sv);
    po->set_c0(hr.dclock);
  }
  for(const auto& cb : sm.d_dcbs) {
    auto po = pc->add_biases();
    po->set_gnss(gnssName(cb.id));
    po->set_gnsssv(cb.id.sv);
    po->set_signal(std::to_string(cb.signal));
    po->set_code(cb.bias);
  }
  for(const auto& u : sm.d_uras) {
    auto po = pc->add_uras();
    po->set_gnss(gnssName(u.id));
    po->set_gnsssv(u.id.sv);
    po->set_ura(u.ura);
    if(auto m = cssrUraMetres(u.ura))
      po->set_meters(*m);
    po->set_unbounded(cssrUraUnbounded(u.ura));
  }
}

void fillProto(SsrMonMessage::Corrections* pc, const CSSRMessage& cm)
{
  pc->set_subtype(cm.header.subtype);
  pc->set_epoch(cm.header.subtype == 1 ? cm.header.epoch : cm.header.hepoch);
  pc->set_iod(cm.header.iod);

  if(auto p = std::get_if<CSSROrbit>(&cm.body)) {
    for(const auto& oc : p->sats)
      fillOrbit(pc, oc);
  }
  else if(auto p = std::get_if<CSSRClock>(&cm.body)) {
    for(const auto& cc : p->sats)
      fillClock(pc, cc);
  }
  else if(auto p = std::get_if<CSSRCodeBias>(&cm.body)) {
    for(const auto& cb : p->cells)
      fillCodeBias(pc, cb);
  }
  else if(auto p = std::get_if<CSSRPhaseBias>(&cm.body)) {
    for(const auto& pb : p->cells)
      fillPhaseBias(pc, pb);
  }
  else if(auto p = std::get_if<CSSRNetworkBias>(&cm.body)) {
    for(const auto& nb : p->cells) {
      auto po = pc->add_biases();
      po->set_gnss(gnssName(nb.id));
      po->set_gnsssv(nb.id.sv);
      po->set_signal(nb.signal);
      if(nb.hasCode && nb.code)
        po->set_code(*nb.code);
      if(nb.hasPhase) {
        if(nb.phase)
          po->set_phase(*nb.phase);
        po->set_discontinuity(nb.discontinuity);
      }
    }
  }
  else if(auto p = std::get_if<CSSRUra>(&cm.body)) {
    for(const auto& uc : p->sats) {
      auto po = pc->add_uras();
      po->set_gnss(gnssName(uc.id));
      po->set_gnsssv(uc.id.sv);
      po->set_ura(uc.ura);
      if(uc.metres)
        po->set_meters(*uc.metres);
      po->set_unbounded(cssrUraUnbounded(uc.ura));
    }
  }
  else if(auto p = std::get_if<CSSRStec>(&cm.body)) {
    pc->set_networkid(p->nid);
    for(const auto& sc : p->sats)
      fillStec(pc, sc);
  }
  else if(auto p = std::get_if<CSSRGridded>(&cm.body)) {
    pc->set_networkid(p->nid);
    int n = 0;
    for(const auto& tg : p->grids) {
      auto po = pc->add_tropos();
      po->set_grid(++n);
      if(tg.hydrostatic)
        po->set_hydrostatic(*tg.hydrostatic);
      if(tg.wet)
        po->set_wet(*tg.wet);
      for(const auto& gr : tg.stec) {
        auto ps = po->add_stec();
        ps->set_gnss(gnssName(gr.id));
        ps->set_gnsssv(gr.id.sv);
        if(gr.residual)
          ps->set_tecu(*gr.residual);
      }
    }
  }
  else if(auto p = std::get_if<CSSRServiceInfo>(&cm.body)) {
    pc->set_serviceinfo(string((const char*)p->data.c_str(), p->data.size()));
  }
  else if(auto p = std::get_if<CSSROrbitClock>(&cm.body)) {
    for(const auto& oc : p->sats) {
      if(oc.orbit)
        fillOrbit(pc, *oc.orbit);
      if(oc.clock)
        fillClock(pc, *oc.clock);
    }
  }
  else if(auto p = std::get_if<CSSRNetwork>(&cm.body)) {
    pc->set_networkid(p->nid);
    if(p->tropoAvail & 2) {
      auto pt = pc->mutable_tropopoly();
      pt->set_quality(p->tropoQuality);
      pt->set_type(p->tropoType);
      if(p->t00)
        pt->set_t00(*p->t00);
      if(p->t01)
        pt->set_t01(*p->t01);
      if(p->t10)
        pt->set_t10(*p->t10);
      if(p->t11)
        pt->set_t11(*p->t11);
    }
    if(p->tropoAvail & 1) {
      pc->set_tropooffset(p->tropoOffset);
      int n = 0;
      for(const auto& tr : p->tropoResiduals) {
        auto po = pc->add_tropos();
        po->set_grid(++n);
        if(tr)
          po->set_residual(*tr);
      }
    }
    for(const auto& sc : p->stec)
      fillStec(pc, sc);
  }
}

void fillProto(SsrMonMessage::Corrections* pc, const HASMessage& hm)
{
  pc->set_epoch(hm.header.toh);
  pc->set_iod(hm.header.iodSet);
  if(hm.orbit) {
    pc->set_validity(hm.orbit->validity);
    for(const auto& oc : hm.orbit->sats)
      fillOrbit(pc, oc);
  }
  if(hm.clockFull)
    for(const auto& cc : hm.clockFull->sats)
      fillClock(pc, cc);
  if(hm.clockSubset)
    for(const auto& cc : hm.clockSubset->sats)
      fillClock(pc, cc);
  if(hm.codeBias)
    for(const auto& cb : hm.codeBias->cells)
      fillCodeBias(pc, cb);
  if(hm.phaseBias)
    for(const auto& pb : hm.phaseBias->cells)
      fillPhaseBias(pc, pb);
}

bool makeProto(const RTCMDecode& rd, SsrMonMessage& smm)
{
  if(rd.status != DecodeStatus::Ok)
    return false;
  smm.set_msgnum(rd.msgnum);
  if(rd.eph) {
    smm.set_type(SsrMonMessage::EphemerisType);
    fillProto(smm.mutable_eph(), *rd.eph);
  }
  else if(rd.ssr) {
    smm.set_type(SsrMonMessage::SSRType);
    fillProto(smm.mutable_corr(), *rd.ssr);
  }
  else if(rd.cssr) {
    smm.set_type(SsrMonMessage::CSSRType);
    fillProto(smm.mutable_corr(), *rd.cssr);
  }
  else
    return false;
  return true;
}

bool makeProto(const HASMessage& hm, SsrMonMessage& smm)
{
  if(hm.status != DecodeStatus::Ok)
    return false;
  smm.set_type(SsrMonMessage::HASType);
  fillProto(smm.mutable_corr(), hm);
  return true;
}

std::string frameProto(const SsrMonMessage& smm)
{
  string out;
  smm.SerializeToString(& out);
  std::string buf="bert";
  uint16_t len = htons(out.size());
  buf.append((char*)(&len), 2);
  buf += out;
  return buf;
}

bool unframeProto(const std::string& in, SsrMonMessage& smm)
{
  if(in.size() < 6 || in.compare(0, 4, "bert"))
    return false;
  uint16_t len;
  memcpy(&len, in.c_str() + 4, 2);
  len = ntohs(len);
  if(in.size() < 6u + len)
    return false;
  return smm.ParseFromString(in.substr(6, len));
}
