#pragma once
#include <stdint.h>
#include <string>
#include <optional>
#include <vector>
#include "bitcursor.hh"

// a scaled quantity, empty if the transmitter sent the 'invalid' pattern
typedef std::optional<double> Scaled;

char gnssIdToSatsys(int gnssid);
int satsysToGnssId(char satsys);
std::string signalName(char satsys, int index);

// the sentinel of an n-bit two's complement field is always its most negative value
inline int invalidPattern(int bits)
{
  return -(1 << (bits - 1));
}

inline Scaled scaled(int raw, int bits, double lsb)
{
  if(raw == invalidPattern(bits))
    return Scaled();
  return raw * lsb;
}

// reads a bits wide signed field and scales it
inline Scaled getScaled(BitCursor& bc, int bits, double lsb)
{
  return scaled(bc.getbits(bits), bits, lsb);
}

int validityInterval(int index);

Scaled cssrUraMetres(int ura);
// URA 63 only says 'worse than the largest class', cssrUraMetres gives the lower bound
inline bool cssrUraUnbounded(int ura)
{
  return ura == 63;
}
std::string fmtUra(int ura, int width, int precision);

std::string fmtScaled(const Scaled& val, int width, int precision);

// broadcast accuracy indices as text
std::string humanUra(uint8_t ura);     // GPS, QZSS, BeiDou, NavIC
std::string humanSisa(uint8_t sisa);   // Galileo
std::string humanFt(uint8_t ft);       // GLONASS
