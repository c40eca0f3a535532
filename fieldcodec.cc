#include "fieldcodec.hh"
#include "cssrmon.hh"
#include <math.h>
#include <stdexcept>
#include "fmt/format.h"

using namespace std;

char gnssIdToSatsys(int gnssid)
{
  static const char satsys[]={'G', 'R', 'E', 'C', 'J', 'S'};
  if(gnssid < 0 || gnssid >= (int)sizeof(satsys))
    throw UnknownEnumeration("undefined GNSS id", gnssid);
  return satsys[gnssid];
}

int satsysToGnssId(char satsys)
{
  static const string order="GRECJS";
  auto pos = order.find(satsys);
  if(pos == string::npos)
    throw UnknownEnumeration("undefined satellite system", satsys);
  return pos;
}

// signal mask bit to signal name, IS-QZSS-L6 table 4.2.2-5 and HAS SIS ICD table 20
string signalName(char satsys, int index)
{
  static const char* gps[16]={"L1 C/A", "L1 P", "L1 Z-tracking", "L1C(D)", "L1C(P)",
    "L1C(D+P)", "L2 CM", "L2 CL", "L2 CM+CL", "L2 P", "L2 Z-tracking",
    "L5 I", "L5 Q", "L5 I+Q", "", ""};
  static const char* glonass[16]={"G1 C/A", "G1 P", "G2 C/A", "G2 P", "G1a(D)", "G1a(P)",
    "G1a(D+P)", "G2a(D)", "G2a(P)", "G2a(D+P)", "G3 I", "G3 Q",
    "G3 I+Q", "", "", ""};
  static const char* galileo[16]={"E1 B", "E1 C", "E1 B+C", "E5a I", "E5a Q", "E5a I+Q",
    "E5b I", "E5b Q", "E5b I+Q", "E5 I", "E5 Q", "E5 I+Q",
    "E6 B", "E6 C", "E6 B+C", ""};
  static const char* beidou[16]={"B1 I", "B1 Q", "B1 I+Q", "B3 I", "B3 Q", "B3 I+Q",
    "B2 I", "B2 Q", "B2 I+Q", "", "", "", "", "", "", ""};
  static const char* qzss[16]={"L1 C/A", "L1 L1C(D)", "L1 L1C(P)", "L1 L1C(D+P)",
    "L2 L2C(M)", "L2 L2C(L)", "L2 L2C(M+L)", "L5 I", "L5 Q",
    "L5 I+Q", "", "", "", "", "", ""};
  static const char* sbas[16]={"L1 C/A", "L5 I", "L5 Q", "L5 I+Q", "", "", "", "", "", "",
    "", "", "", "", "", ""};

  const char** table;
  switch(satsys) {
  case 'G': table = gps;     break;
  case 'R': table = glonass; break;
  case 'E': table = galileo; break;
  case 'C': table = beidou;  break;
  case 'J': table = qzss;    break;
  case 'S': table = sbas;    break;
  default:
    throw UnknownEnumeration(fmt::format("no signal names for satellite system '{}'", satsys), satsys);
  }
  if(index < 0 || index >= 16)
    throw UnknownEnumeration(fmt::format("signal mask index for satellite system '{}'", satsys), index);
  return table[index];
}

// HAS validity interval in seconds, index 15 means 'not applicable' and gives 0
int validityInterval(int index)
{
  static const int vi[16]={5, 10, 15, 20, 30, 60, 90, 120, 180, 240, 300, 600, 900, 1800, 3600, 0};
  if(index < 0 || index >= 16)
    throw std::out_of_range("validity interval index "+std::to_string(index));
  return vi[index];
}

/* SSR URA, 3 bits class and 3 bits value: (3^class * (1 + value/4) - 1) mm.
   0 means undefined, 63 means more than 5466.5 mm and returns that bound */
Scaled cssrUraMetres(int ura)
{
  if(ura <= 0)
    return Scaled();
  if(cssrUraUnbounded(ura))
    return 5.4665;
  int uraClass = (ura >> 3) & 7;
  int uraValue = ura & 7;
  return (pow(3.0, uraClass) * (1.0 + uraValue / 4.0) - 1.0) / 1000.0;
}

string fmtScaled(const Scaled& val, int width, int precision)
{
  if(!val)
    return fmt::format("{:>{}}", "N/A", width);
  return fmt::format("{:{}.{}f}", *val, width, precision);
}

string fmtUra(int ura, int width, int precision)
{
  if(cssrUraUnbounded(ura))
    return fmt::format("{:>{}}", ">" + fmtScaled(cssrUraMetres(ura), 0, precision), width);
  return fmtScaled(cssrUraMetres(ura), width, precision);
}

string humanUra(uint8_t ura)
{
  if(ura < 6)
    return fmt::format("{} cm", (int)(100*pow(2.0, 1.0+1.0*ura/2.0)));
  else if(ura < 15)
    return fmt::format("{} m", (int)(pow(2, ura-2)));
  return "NO URA AVAILABLE";
}

string humanSisa(uint8_t sisa)
{
  unsigned int sval = sisa;
  if(sisa < 50)
    return std::to_string(sval)+" cm";
  if(sisa < 75)
    return std::to_string(50 + 2* (sval-50))+" cm";
  if(sisa < 100)
    return std::to_string(100 + 4*(sval-75))+" cm";
  if(sisa < 125)
    return std::to_string(200 + 16*(sval-100))+" cm";
  if(sisa < 255)
    return "SPARE";
  return "NO SISA AVAILABLE";
}

string humanFt(uint8_t ft)
{
  static const char* ret[]={"100 cm", "200 cm", "250 cm", "400 cm", "500 cm", "7 m", "10 m", "12 m", "14 m", "16 m", "32 m", "64 m", "128 m", "256 m", "512 m", "NONE"};
  if(ft < 16)
    return ret[ft];
  return "???";
}
