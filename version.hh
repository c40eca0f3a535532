#pragma once
#include <iostream>

inline void showVersion(const char *pname, const char *hash) {
  std::cout <<"cssrmon tools (" <<pname <<") " <<hash <<std::endl;
  std::cout <<"built date " <<__DATE__ <<std::endl;
  std::cout <<"Decodes RTCM3 ephemeris, SSR, Compact SSR and Galileo HAS messages" <<std::endl;
  std::cout <<"License GPLv3: GNU GPL version 3  https://gnu.org/licenses/gpl.html" <<std::endl;
}
