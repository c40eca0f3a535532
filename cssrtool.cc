#include "rtcm.hh"
#include "protoconv.hh"
#include <iostream>
#include <time.h>
#include "CLI/CLI.hpp"
#include "fmt/format.h"
#include "fmt/printf.h"
#include "version.hh"

using namespace std;

static char program[]="cssrtool";
uint32_t g_srcid{0};

/* Reads RTCM3 from stdin. Text mode prints one summary line per message, --trace 1 adds
   per satellite detail, --trace 2 null data, unsupported messages and payload hex dumps.
   With --proto the decoded records go to stdout as framed protobuf instead. */
int main(int argc, char** argv)
try
{
  GOOGLE_PROTOBUF_VERIFY_VERSION;

  bool doVERSION{false}, doStat{false}, doProto{false};
  int traceLevel{0};
  CLI::App app(program);
  app.add_option("--trace,-t", traceLevel, "trace level: 1=subtype detail, 2=also null data and hex dumps");
  app.add_flag("--stat,-s", doStat, "report bit statistics of the CSSR stream at every mask and at the end");
  app.add_flag("--proto", doProto, "emit decoded records as protobuf to stdout");
  app.add_option("--station", g_srcid, "Station id to put in protobuf output");
  app.add_flag("--version", doVERSION, "show program version and copyright");
  try {
    app.parse(argc, argv);
  } catch(const CLI::Error &e) {
    return app.exit(e);
  }

  if(doVERSION) {
    showVersion(program, g_gitHash);
    exit(0);
  }

  RTCMReader rr(0);
  RTCMDispatcher disp(doStat);
  RTCMFrame rf;
  int count=0, failed=0;
  while(rr.get(rf)) {
    ++count;
    RTCMDecode rd = disp.decode(rf.bytes());
    if(traceLevel >= 2)
      cerr<<"RTCM "<<rd.msgnum<<" "<<rf.payload.size()<<" bytes: "<<makeHexDump(rf.payload)<<endl;

    if(rd.status == DecodeStatus::MalformedHeader || rd.status == DecodeStatus::Unsupported) {
      if(traceLevel >= 2)
        cerr<<rd.reason<<endl;
      continue;
    }
    if(rd.status != DecodeStatus::Ok) {
      ++failed;
      cerr<<"RTCM "<<rd.msgnum<<": "<<humanStatus(rd.status)<<": "<<rd.reason<<endl;
      continue;
    }

    if(doProto) {
      SsrMonMessage smm;
      if(!makeProto(rd, smm))
        continue;
      struct timespec ts;
      clock_gettime(CLOCK_REALTIME, & ts);
      smm.set_localutcseconds(ts.tv_sec);
      smm.set_localutcnanoseconds(ts.tv_nsec);
      smm.set_sourceid(g_srcid);
      string buf = frameProto(smm);
      writen2(1, buf.c_str(), buf.size());
      continue;
    }

    if(!rd.stats.empty())
      cout<<rd.stats<<"\n";
    cout<<rd.summary<<"\n";
    if(traceLevel >= 1)
      cout<<rd.trace;
    else if(rd.eph && rd.eph->unhealthy())
      cerr<<"unhealthy: "<<rd.eph->trace<<endl;
  }
  cout.flush();
  if(doStat && !doProto)
    cout<<disp.cssr().getStats().report()<<endl;
  cerr<<fmt::format("{}: {} frames, {} could not be decoded, {} CRC errors, {} bytes skipped", program, count, failed, rr.d_crcErrors, rr.d_skipped)<<endl;
}
catch(EofException& ee)
{}
catch(std::exception& e)
{
  cerr<<"Exiting because of fatal error "<<e.what()<<endl;
  return EXIT_FAILURE;
}
