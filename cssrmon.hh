#pragma once
#include <stdint.h>
#include <string>
#include <string_view>
#include <tuple>
#include <stdexcept>
extern const char* g_gitHash;

/* Outcome of decoding one payload. InsufficientData means 'deliver more bytes and try
   again from the start', everything else is final for that message. */
enum class DecodeStatus
{
  Ok,
  InsufficientData,
  SequencingError,    // correction message before any mask
  UnknownEnumeration, // undefined GNSS id, navigation message type or subtype
  MalformedHeader,    // wrong message number or zero padding, counted as null data
  Unsupported         // message number we have no decoder for
};

std::string humanStatus(DecodeStatus status);

// raised from deep inside a decoder, converted to DecodeStatus::UnknownEnumeration by the session
struct UnknownEnumeration : public std::runtime_error
{
  UnknownEnumeration(const std::string& what, int raw_) : std::runtime_error(what+" ("+std::to_string(raw_)+")"), raw(raw_) {}
  int raw;
};

struct SatID
{
  char gnss{'?'};  // G, R, E, C, J, S or I
  uint32_t sv{0};
  bool operator<(const SatID& rhs) const
  {
    return std::tie(gnss, sv) < std::tie(rhs.gnss, rhs.sv);
  }
  bool operator==(const SatID& rhs) const
  {
    return gnss == rhs.gnss && sv == rhs.sv;
  }
};

std::string makeSatIDName(const SatID& satid);

struct EofException{};
size_t writen2(int fd, const void *buf, size_t count);

std::string makeHexDump(const std::string& str);
std::string makeHexDump(std::basic_string_view<uint8_t> str);
