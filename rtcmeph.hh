#pragma once
#include <stdint.h>
#include <string>
#include <vector>
#include <variant>
#include <math.h>
#include "ephemeris.hh"
#include "bitcursor.hh"

// RTCM 1019
struct GPSEphemeris : KeplerEphemeris
{
  uint8_t sva{0}, l2code{0};
  uint16_t iode{0}, iodc{0};
  int8_t tgd{0};
  uint8_t svh{0};
  bool l2p{false}, fitInterval{false};

  void parse(BitCursor& bc);
  int getIOD() const { return iode; }
  double getTgd() const { return ldexp(tgd, -31); } // seconds
};

// RTCM 1044, svid is the PRN minus 192
struct QZSSEphemeris : KeplerEphemeris
{
  uint16_t iode{0}, iodc{0};
  uint8_t l2code{0}, ura{0};
  int32_t i0dot{0};
  uint8_t svh{0};          // 6 bits, MSB is the L1 signal health
  int8_t tgd{0};
  bool fitInterval{false};

  void parse(BitCursor& bc);
  int getIOD() const { return iode; }
  double getTgd() const { return ldexp(tgd, -31); }

  // bit 0 is the MSB of the 6 bit field, as the QZSS IS counts them
  bool svhBit(int n) const { return (svh >> (5 - n)) & 1; }
};

// RTCM 1042
struct BeidouEphemeris : KeplerEphemeris
{
  uint8_t urai{0};
  uint8_t aode{0}, aodc{0};
  int16_t tgd1{0}, tgd2{0};  // 0.1 ns
  bool sath1{false};

  void parse(BitCursor& bc);
  int getIOD() const { return aode; }
  double getTgd1() const { return tgd1 * 1e-10; }
  double getTgd2() const { return tgd2 * 1e-10; }
};

// RTCM 1041
struct NavICEphemeris : KeplerEphemeris
{
  uint8_t ura{0};
  uint8_t iodec{0};
  int8_t tgd{0};
  bool l5flag{false}, sflag{false};

  void parse(BitCursor& bc);
  int getIOD() const { return iodec; }
  double getTgd() const { return ldexp(tgd, -31); }
};

enum class GalileoNav
{
  FNAV = 1045,
  INAV = 1046
};

// RTCM 1045 (F/NAV) and 1046 (I/NAV)
struct GalileoEphemeris : KeplerEphemeris
{
  GalileoNav navtype{GalileoNav::INAV};
  uint16_t iodnav{0};
  uint8_t sisa{0};
  int16_t BGDE1E5a{0}, BGDE1E5b{0};   // E1E5b only on I/NAV
  // F/NAV: E5a signal health and data validity
  uint8_t e5ahs{0};
  bool e5advs{false};
  // I/NAV: E5b and E1b
  uint8_t e5bhs{0}, e1bhs{0};
  bool e5bdvs{false}, e1bdvs{false};

  void parse(BitCursor& bc, GalileoNav nav);
  int getIOD() const { return iodnav; }
  double getBGDE1E5a() const { return ldexp(BGDE1E5a, -32); }
  double getBGDE1E5b() const { return ldexp(BGDE1E5b, -32); }
};

// RTCM 1020, a state vector instead of Kepler elements. Sign-magnitude throughout
struct GlonassEphemeris
{
  uint32_t sv{0};
  uint8_t freqChannel{0};     // DF040, channel number + 7
  bool almHealth{false}, almHealthAvailable{false};
  uint8_t P1{0};
  uint8_t hour{0}, minute{0}, seconds{0};
  bool Bn{false}, P2{false};
  uint8_t Tb{0};              // 15 minute intervals since start of Moscow day
  int32_t dx{0}, x{0}, ddx{0};  // 2^-20 km/s, 2^-11 km, 2^-30 km/s^2
  int32_t dy{0}, y{0}, ddy{0};
  int32_t dz{0}, z{0}, ddz{0};
  bool P3{false};
  int32_t gamman{0};          // 2^-40
  uint8_t P{0};
  bool ln3{false};
  int32_t taun{0};            // 2^-30 s
  int32_t deltaTaun{0};       // 2^-30 s
  uint8_t En{0};
  bool P4{false};
  uint8_t FT{0};
  uint16_t NT{0};
  uint8_t M{0};
  bool additional{false};
  uint16_t NA{0};
  int32_t tauc{0};            // 2^-31 s
  uint8_t n4{0};
  int32_t taugps{0};          // 2^-30 s
  bool ln5{false};

  void parse(BitCursor& bc);
  int getIOD() const { return Tb; }

  double getX() const { return ldexp(x*1000.0, -11); } // meters
  double getY() const { return ldexp(y*1000.0, -11); }
  double getZ() const { return ldexp(z*1000.0, -11); }

  double getdX() const { return ldexp(dx*1000.0, -20); } // m/s
  double getdY() const { return ldexp(dy*1000.0, -20); }
  double getdZ() const { return ldexp(dz*1000.0, -20); }

  double getddX() const { return ldexp(ddx*1000.0, -30); } // m/s^2
  double getddY() const { return ldexp(ddy*1000.0, -30); }
  double getddZ() const { return ldexp(ddz*1000.0, -30); }

  double getGamman() const { return ldexp(gamman, -40); }
  double getTaun() const { return ldexp(taun, -30); }
  double getDeltaTaun() const { return ldexp(deltaTaun, -30); }
  double getTauc() const { return ldexp(tauc, -31); }
  double getTauGPS() const { return ldexp(taugps, -30); }
  int getTbMinutes() const { return 15 * Tb; }
};

typedef std::variant<GPSEphemeris, GlonassEphemeris, GalileoEphemeris, QZSSEphemeris, BeidouEphemeris, NavICEphemeris> EphemerisRecord;

// decoded separately from the numbers, the display decides how loud to be about it
struct HealthNote
{
  std::string text;
  bool unhealthy;
};

struct EphemerisResult
{
  char satsys;
  EphemerisRecord record;
  std::vector<HealthNote> health;
  std::string accuracy;   // URA, SISA or FT as text
  std::string trace;

  bool unhealthy() const
  {
    for(const auto& h : health)
      if(h.unhealthy)
        return true;
    return false;
  }
};

// bc sits right after the 12 bit message number
EphemerisResult decodeEphemeris(BitCursor& bc, char satsys, GalileoNav navtype=GalileoNav::INAV);

std::vector<HealthNote> getHealth(const GPSEphemeris& eph);
std::vector<HealthNote> getHealth(const QZSSEphemeris& eph);
std::vector<HealthNote> getHealth(const BeidouEphemeris& eph);
std::vector<HealthNote> getHealth(const NavICEphemeris& eph);
std::vector<HealthNote> getHealth(const GalileoEphemeris& eph);
std::vector<HealthNote> getHealth(const GlonassEphemeris& eph);
