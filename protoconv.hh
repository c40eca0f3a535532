#pragma once
#include <string>
#include "ssrmon.pb.h"
#include "rtcm.hh"
#include "has.hh"

void fillProto(SsrMonMessage::Ephemeris* pe, const EphemerisResult& er);
void fillProto(SsrMonMessage::Corrections* pc, const SSRMessage& sm);
void fillProto(SsrMonMessage::Corrections* pc, const CSSRMessage& cm);
void fillProto(SsrMonMessage::Corrections* pc, const HASMessage& hm);

// type, msgnum and payload from a dispatched RTCM message. False if there is nothing to send
bool makeProto(const RTCMDecode& rd, SsrMonMessage& smm);
// HAS arrives outside RTCM, so there is no message number
bool makeProto(const HASMessage& hm, SsrMonMessage& smm);

// "bert" + 16 bit big endian length + serialized message, as the rest of the tools expect
std::string frameProto(const SsrMonMessage& smm);
bool unframeProto(const std::string& in, SsrMonMessage& smm);
