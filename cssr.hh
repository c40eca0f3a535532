#pragma once
#include <stdint.h>
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <variant>
#include "cssrmon.hh"
#include "bitcursor.hh"
#include "fieldcodec.hh"

/* Compact SSR as sent on QZSS L6 (CLAS, MADOCA-PPP) in RTCM message 4073, IS-QZSS-L6-005.
   Subtype 1 is a mask that says which satellites and signals the following
   subtypes talk about. Every other subtype is decoded against the most recent mask,
   so they are meaningless without it. */

// which satellites and signals the corrections that follow refer to
struct MaskContext
{
  struct GNSS
  {
    char satsys;
    std::vector<int> sats;             // 1-based, ascending
    std::vector<std::string> signals;  // in signal mask bit order
    std::vector<bool> cellmask;        // sats.size() * signals.size(), satellite major
    int navmsg{0};                     // HAS only

    bool cell(unsigned int satpos, unsigned int sigpos) const
    {
      return cellmask.at(satpos * signals.size() + sigpos);
    }
    int activeCells() const;
    SatID satID(int satpos) const
    {
      SatID ret;
      ret.gnss = satsys;
      ret.sv = sats.at(satpos);
      return ret;
    }
  };

  std::vector<GNSS> gnss;

  int numSats() const;
  int activeCells() const;
};

enum class MaskKind
{
  CSSR,
  HAS
};

// empty if the payload ran out, throws UnknownEnumeration on an undefined GNSS id
std::optional<MaskContext> buildMask(BitCursor& bc, MaskKind kind);

// satellite subset masks as used by ST6, ST8, ST9, ST11 and ST12, one bit per mask satellite
typedef std::vector<std::vector<bool>> SatSubset;
std::optional<SatSubset> getSatSubset(BitCursor& bc, const MaskContext& mask);
SatSubset fullSatSubset(const MaskContext& mask);

struct OrbitCorrection
{
  SatID id;
  int iode{0};
  Scaled radial, along, cross;  // meters
};

struct ClockCorrection
{
  SatID id;
  Scaled c0;              // meters
  int multiplier{1};      // HAS only
  bool doNotUse{false};   // HAS only
};

struct CodeBias
{
  SatID id;
  std::string signal;
  Scaled bias;            // meters
};

struct PhaseBias
{
  SatID id;
  std::string signal;
  Scaled bias;            // meters for CSSR, cycles for HAS
  int discontinuity{0};
};

struct NetworkBias
{
  SatID id;
  std::string signal;
  bool hasCode{false}, hasPhase{false};
  Scaled code, phase;     // meters
  int discontinuity{0};
};

struct UraCorrection
{
  SatID id;
  int ura{0};
  Scaled metres;
};

struct StecPolynomial
{
  int quality{0};
  int type{0};            // 0: c00, 1: +c01 c10, 2: +c11, 3: +c02 c20
  Scaled c00, c01, c10, c11, c02, c20;  // TECU, TECU/deg, TECU/deg^2
};

struct StecCorrection
{
  SatID id;
  StecPolynomial poly;
  int residualBits{0};
  std::vector<Scaled> residuals;  // one per grid point, ST12 only
};

struct GridResidual
{
  SatID id;
  Scaled residual;        // TECU
};

struct TropoGrid
{
  Scaled hydrostatic, wet;  // meters
  std::vector<GridResidual> stec;
};

struct OrbitClock
{
  SatID id;
  std::optional<OrbitCorrection> orbit;
  std::optional<ClockCorrection> clock;
};

// one product type per subtype
struct CSSRMask      { MaskContext mask; };                                  // ST1
struct CSSROrbit     { std::vector<OrbitCorrection> sats; };                 // ST2
struct CSSRClock     { std::vector<ClockCorrection> sats; };                 // ST3
struct CSSRCodeBias  { std::vector<CodeBias> cells; };                       // ST4
struct CSSRPhaseBias { std::vector<PhaseBias> cells; };                      // ST5
struct CSSRNetworkBias                                                       // ST6
{
  bool code{false}, phase{false}, network{false};
  int nid{0};
  std::vector<NetworkBias> cells;
};
struct CSSRUra       { std::vector<UraCorrection> sats; };                   // ST7
struct CSSRStec                                                              // ST8
{
  int type{0};
  int nid{0};
  std::vector<StecCorrection> sats;
};
struct CSSRGridded                                                           // ST9
{
  int type{0};
  bool range{false};     // 16 bit residuals if set, 7 otherwise
  int nid{0};
  int quality{0};
  std::vector<TropoGrid> grids;
};
struct CSSRServiceInfo                                                       // ST10
{
  int counter{0};
  std::basic_string<uint8_t> data;
};
struct CSSROrbitClock                                                        // ST11
{
  bool orbit{false}, clock{false}, network{false};
  int nid{0};
  std::vector<OrbitClock> sats;
};
struct CSSRNetwork                                                           // ST12
{
  int tropoAvail{0}, stecAvail{0};
  int nid{0};
  int ngrid{0};
  int tropoQuality{0}, tropoType{0};
  Scaled t00, t01, t10, t11;        // m, m/deg, m/deg^2
  int tropoResidualBits{0};
  double tropoOffset{0};
  std::vector<Scaled> tropoResiduals;
  std::vector<StecCorrection> stec;
};

typedef std::variant<std::monostate, CSSRMask, CSSROrbit, CSSRClock, CSSRCodeBias, CSSRPhaseBias,
                     CSSRNetworkBias, CSSRUra, CSSRStec, CSSRGridded, CSSRServiceInfo,
                     CSSROrbitClock, CSSRNetwork> CSSRBody;

// where the bits of a stream go, only for diagnostics
struct BitStats
{
  int nsat{0}, nsig{0};
  int bsat{0}, bsig{0}, bother{0}, bnull{0};
  int total() const { return bsat + bsig + bother + bnull; }
  std::string report() const;
};

struct CSSRHeader
{
  int msgnum{0};
  int subtype{0};
  int epoch{-1};       // GPS seconds of week, ST1 only
  int hepoch{-1};      // seconds of the hour, other subtypes
  int interval{0};
  bool mmi{false};
  int iod{0};
};

struct CSSRMessage
{
  DecodeStatus status{DecodeStatus::Ok};
  std::string reason;
  CSSRHeader header;
  CSSRBody body;
  std::string summary;  // one line: subtype, epoch and iod
  std::string trace;    // one line per satellite or cell
  std::string stats;    // report of the previous mask period, if statistics are on
  int bits{0};          // consumed from the payload
};

/* One per CSSR stream. Only the mask lives on from message to message,
   the header is replaced by every message. */
class CSSRSession
{
public:
  explicit CSSRSession(bool stats=false) : d_statEnabled(stats) {}

  // bitlen < 0 means the whole payload
  CSSRMessage decode(std::basic_string_view<uint8_t> payload, int bitlen=-1);

  const std::optional<MaskContext>& getMask() const { return d_mask; }
  const CSSRHeader& getHeader() const { return d_header; }
  const BitStats& getStats() const { return d_stats; }

  static inline const int c_msgnum = 4073;
private:
  DecodeStatus decodeHeader(BitCursor& bc, CSSRMessage& msg);

  std::optional<CSSRMask> parseST1(BitCursor& bc, std::string& trace);
  std::optional<CSSROrbit> parseST2(BitCursor& bc, std::string& trace);
  std::optional<CSSRClock> parseST3(BitCursor& bc, std::string& trace);
  std::optional<CSSRCodeBias> parseST4(BitCursor& bc, std::string& trace);
  std::optional<CSSRPhaseBias> parseST5(BitCursor& bc, std::string& trace);
  std::optional<CSSRNetworkBias> parseST6(BitCursor& bc, std::string& trace);
  std::optional<CSSRUra> parseST7(BitCursor& bc, std::string& trace);
  std::optional<CSSRStec> parseST8(BitCursor& bc, std::string& trace);
  std::optional<CSSRGridded> parseST9(BitCursor& bc, std::string& trace);
  std::optional<CSSRServiceInfo> parseST10(BitCursor& bc, std::string& trace);
  std::optional<CSSROrbitClock> parseST11(BitCursor& bc, std::string& trace);
  std::optional<CSSRNetwork> parseST12(BitCursor& bc, std::string& trace);

  std::optional<MaskContext> d_mask;
  CSSRHeader d_header;
  BitStats d_stats;
  bool d_statEnabled;
};

// shared with HAS
std::string maskTrace(const MaskContext& mask, const std::string& prefix);
int iodeBits(char satsys);
std::optional<StecPolynomial> getStecPolynomial(BitCursor& bc, int type, bool withType);
std::string stecTrace(const StecPolynomial& poly);
