#pragma once
#include <string>
#include <vector>
#include "cssrmon.hh"
#include "bitcursor.hh"

// the six classic RTCM SSR message kinds, in message number order within a GNSS block
enum class SSRKind
{
  Orbit = 0,
  Clock = 1,
  CodeBias = 2,
  Combined = 3,
  URA = 4,
  HRClock = 5
};

/* Message number blocks: GPS 1057, GLONASS 1063, Galileo 1240, QZSS 1246, SBAS 1252, BeiDou 1258,
   each followed by the six kinds above. Returns false if type is not in any of them */
bool ssrMessageType(int type, char& satsys, SSRKind& kind);

struct SSRMessage
{
  // bc at the start of the payload, throws UnknownEnumeration on a non-SSR message number
  void parse(BitCursor& bc);
  int type{0};
  char satsys{'?'};
  SSRKind kind{SSRKind::Orbit};
  int sow{0};          // GLONASS: seconds of the day
  int udi{0};
  bool mmi{false};
  bool reference{false};  // orbit and combined only
  int ssrIOD{0}, ssrProvider{0}, ssrSolution{0};
  int numSats{0};
  struct EphemerisDelta
  {
    SatID id;
    double radial, along, cross;    // mm, as transmitted
    double dradial, dalong, dcross; // mm/s
    int iod;                        // IODE of the broadcast ephemeris it corrects
    int sow;                        // copied from the header epoch
    int udi;
  };
  struct ClockDelta
  {
    SatID id;
    double dclock0, dclock1, dclock2;  // m, m/s, m/s^2
    int sow;
    int udi;
    int iod{-1};                       // only known for combined messages
  };
  struct CodeBiasDelta
  {
    SatID id;
    int signal;     // signal and tracking mode indicator, per GNSS
    double bias;    // meters
  };
  struct UraEntry
  {
    SatID id;
    int ura;        // 3 bits class, 3 bits value
  };
  struct HRClockDelta
  {
    SatID id;
    double dclock;  // meters
  };

  std::vector<EphemerisDelta> d_ephs;
  std::vector<ClockDelta> d_clocks;
  std::vector<CodeBiasDelta> d_dcbs;
  std::vector<UraEntry> d_uras;
  std::vector<HRClockDelta> d_hrclocks;

  std::string summary() const;
  std::string trace() const;

private:
  void parseHeader(BitCursor& bc);
  SatID getSatID(BitCursor& bc) const;
  EphemerisDelta getEphemerisDelta(BitCursor& bc, const SatID& id) const;
  ClockDelta getClockDelta(BitCursor& bc, const SatID& id) const;
};
