#include "cssrmon.hh"
#include <string.h>
#include <errno.h>
#include <unistd.h>
#include "fmt/format.h"
#include "fmt/printf.h"

using namespace std;

string humanStatus(DecodeStatus status)
{
  switch(status) {
  case DecodeStatus::Ok:
    return "ok";
  case DecodeStatus::InsufficientData:
    return "insufficient data";
  case DecodeStatus::SequencingError:
    return "no mask received yet";
  case DecodeStatus::UnknownEnumeration:
    return "unknown enumeration";
  case DecodeStatus::MalformedHeader:
    return "malformed header";
  case DecodeStatus::Unsupported:
    return "unsupported message";
  }
  return "???";
}

string makeSatIDName(const SatID& satid)
{
  return fmt::sprintf("%c%02d", satid.gnss, satid.sv);
}

string makeHexDump(const string& str)
{
  return makeHexDump(std::basic_string_view<uint8_t>((const uint8_t*)str.c_str(), str.size()));
}

string makeHexDump(std::basic_string_view<uint8_t> str)
{
  string ret;
  ret.reserve((int)(str.size()*2.2));

  for(auto c : str)
    ret += fmt::format("{:02x}", c);
  return ret;
}

size_t writen2(int fd, const void *buf, size_t count)
{
  const char *ptr = (char*)buf;
  const char *eptr = ptr + count;

  ssize_t res;
  while(ptr != eptr) {
    res = ::write(fd, ptr, eptr - ptr);
    if(res < 0) {
      throw runtime_error("failed in writen2: "+string(strerror(errno)));
    }
    else if (res == 0)
      throw EofException();

    ptr += (size_t) res;
  }

  return count;
}
