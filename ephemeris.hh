#pragma once
#include <stdint.h>
#include <math.h>

/* GPS, QZSS, BeiDou, NavIC and Galileo all broadcast the same Keplerian parameter set,
   only widths and positions differ. The raw integers are kept as transmitted,
   the getters apply the scale factors, which are the literal RTCM table:

   M0, Omega0, i0, omega      2^-31 semi-circles
   idot, deltan, Omegadot     2^-43 semi-circles/s
   e                          2^-33
   sqrtA                      2^-19 m^0.5
   Cuc, Cus, Cic, Cis         2^-29 rad
   Crc, Crs                   2^-5 m
   t0e, t0c                   60 s
   af0, af1, af2              2^-34 s, 2^-46 s/s, 2^-59 s/s^2
*/
struct KeplerEphemeris
{
  virtual ~KeplerEphemeris() = default;

  uint32_t sv{0};
  uint32_t wn{0};
  uint32_t t0e{0}, t0c{0};
  uint32_t e{0}, sqrtA{0};
  int32_t m0{0}, omega0{0}, i0{0}, omega{0}, idot{0}, omegadot{0}, deltan{0};
  int32_t cuc{0}, cus{0}, crc{0}, crs{0}, cic{0}, cis{0};
  int32_t af0{0}, af1{0}, af2{0};

  uint32_t getT0e() const { return 60 * t0e; }
  uint32_t getT0c() const { return 60 * t0c; }
  double getSqrtA() const { return ldexp(sqrtA,     -19);   }
  double getE()     const { return ldexp(e,         -33);   }
  double getCuc()   const { return ldexp(cuc,       -29);   } // radians
  double getCus()   const { return ldexp(cus,       -29);   } // radians
  double getCrc()   const { return ldexp(crc,        -5);   } // meters
  double getCrs()   const { return ldexp(crs,        -5);   } // meters
  double getM0()    const { return ldexp(m0 * M_PI, -31);   } // radians
  double getDeltan()const { return ldexp(deltan *M_PI, -43); } //radians/s
  double getI0()        const { return ldexp(i0 * M_PI,       -31);   } // radians
  double getCic()       const { return ldexp(cic,             -29);   } // radians
  double getCis()       const { return ldexp(cis,             -29);   } // radians
  double getOmegadot()  const { return ldexp(omegadot * M_PI, -43);   } // radians/s
  double getOmega0()    const { return ldexp(omega0 * M_PI,   -31);   } // radians
  double getIdot()      const { return ldexp(idot * M_PI,     -43);   } // radians/s
  double getOmega()     const { return ldexp(omega * M_PI,    -31);   } // radians

  double getAf0() const { return ldexp(af0, -34); } // seconds
  double getAf1() const { return ldexp(af1, -46); } // s/s
  double getAf2() const { return ldexp(af2, -59); } // s/s^2

  virtual int getIOD() const = 0;
};
