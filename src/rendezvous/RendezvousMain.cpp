#include <cxxopts.hpp>

#include "BridgeEndpoint.hpp"
#include "LogHandler.hpp"
#include "PseudoTerminalConsole.hpp"
#include "RendezvousServer.hpp"
#include "SimpleIni.h"
#include "TmuxMultiplexer.hpp"

using namespace rv;

namespace {
void runListener(const string& bindIp, int port, const string& keysDir,
                 const string& stateDir, const DialPolicy& dialPolicy,
                 const char* argv0) {
  StateDirectory stateDirectory(stateDir);
  stateDirectory.createIfRequired();

  shared_ptr<SslSocketHandler> sslSocketHandler;
  try {
    sslSocketHandler.reset(new SslSocketHandler(keysDir + "/server.pem",
                                                keysDir + "/server.key"));
  } catch (const std::runtime_error& re) {
    STFATAL << "Could not load the TLS key pair from " << keysDir << ": "
            << re.what();
  }
  shared_ptr<PipeSocketHandler> pipeSocketHandler(new PipeSocketHandler());
  shared_ptr<Multiplexer> multiplexer(
      new TmuxMultiplexer(shared_ptr<SubprocessUtils>(new SubprocessUtils())));
  shared_ptr<SessionRouter> router(new SessionRouter(
      multiplexer, shared_ptr<SessionCache>(new SessionCache()), stateDir,
      SessionRouter::getSelfExecutable(argv0)));

  SocketEndpoint serverEndpoint;
  serverEndpoint.set_name(bindIp);
  serverEndpoint.set_port(port);

  shared_ptr<RendezvousServer> server;
  try {
    server.reset(new RendezvousServer(sslSocketHandler, serverEndpoint,
                                      pipeSocketHandler, router, dialPolicy));
  } catch (const std::runtime_error& re) {
    STFATAL << "Could not listen on " << serverEndpoint << ": " << re.what();
  }
  CLOG(INFO, "stdout") << "Listening on " << serverEndpoint << endl;
  server->run();
}

void runBridge(const string& rendezvousPath, bool raw) {
  shared_ptr<PipeSocketHandler> pipeSocketHandler(new PipeSocketHandler());
  SocketEndpoint endpoint;
  endpoint.set_name(rendezvousPath);
  shared_ptr<BridgeEndpoint> bridge;
  try {
    bridge.reset(new BridgeEndpoint(
        pipeSocketHandler, endpoint,
        shared_ptr<Console>(new PseudoTerminalConsole(raw))));
  } catch (const std::runtime_error& re) {
    STFATAL << "Could not listen on " << rendezvousPath << ": " << re.what();
  }
  bridge->run();
}
}  // namespace

int main(int argc, char** argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  rv::HandleTerminate();

  // Override easylogging handler for sigint
  ::signal(SIGINT, rv::InterruptSignalHandler);
  // Broken connections are reported through write() errors
  ::signal(SIGPIPE, SIG_IGN);

  cxxopts::Options options("rvserver",
                           "Catches TLS callbacks and hands each one to a tmux "
                           "window");
  try {
    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("i,host", "Interface address on which to bind",
         cxxopts::value<string>()->default_value("127.0.0.1"))  //
        ("p,port", "Port on which to bind",
         cxxopts::value<int>()->default_value("8443"))  //
        ("k,keys", "Path to folder with server.{pem,key}",
         cxxopts::value<string>()->default_value("./certs"))  //
        ("s,socket", "Domain socket from which the program reads",
         cxxopts::value<string>()->default_value(""))  //
        ("statedir", "Directory holding the rendezvous sockets",
         cxxopts::value<string>()->default_value(".state"))  //
        ("cfgfile", "Location of the config file",
         cxxopts::value<string>()->default_value(""))  //
        ("logdir", "Directory for log files",
         cxxopts::value<string>()->default_value(GetTempDirectory() +
                                                 "rvserver"))  //
        ("logtostdout", "Log to stdout")                       //
        ("raw", "Put the terminal in raw mode while bridging")  //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ;

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "rvserver version " << RV_VERSION << endl;
      exit(0);
    }

    string bindIp = result["host"].as<string>();
    int port = result["port"].as<int>();
    string keysDir = result["keys"].as<string>();
    string stateDir = result["statedir"].as<string>();
    int verboseLevel = result["verbose"].as<int>();
    bool silent = false;
    DialPolicy dialPolicy;
    // default max log file size is 20MB
    string maxlogsize = "20971520";

    if (!result["cfgfile"].as<string>().empty()) {
      // Load the config file
      CSimpleIniA ini(true, false, false);
      string cfgfilename = result["cfgfile"].as<string>();
      SI_Error rc = ini.LoadFile(cfgfilename.c_str());
      if (rc != 0) {
        STFATAL << "Invalid config file: " << cfgfilename;
      }
      // Command line options take precedence over the config file
      if (!result.count("host")) {
        bindIp = ini.GetValue("Networking", "bind_ip", bindIp.c_str());
      }
      if (!result.count("port")) {
        port = int(ini.GetLongValue("Networking", "port", port));
      }
      if (!result.count("keys")) {
        keysDir = ini.GetValue("TLS", "keys", keysDir.c_str());
      }
      if (!result.count("statedir")) {
        stateDir = ini.GetValue("Handoff", "state_dir", stateDir.c_str());
      }
      dialPolicy.attempts = int(
          ini.GetLongValue("Handoff", "dial_attempts", dialPolicy.attempts));
      dialPolicy.initialIntervalMs = int(ini.GetLongValue(
          "Handoff", "dial_interval_ms", dialPolicy.initialIntervalMs));
      if (!result.count("verbose")) {
        verboseLevel = int(ini.GetLongValue("Debug", "verbose", verboseLevel));
      }
      silent = ini.GetLongValue("Debug", "silent", 0) != 0;
      const char* logsize = ini.GetValue("Debug", "logsize", NULL);
      if (logsize && atoi(logsize) != 0) {
        // make sure maxlogsize is a string of int value
        maxlogsize = to_string(atoi(logsize));
      }
    }

    if (port <= 0 || port > 65535) {
      CLOG(INFO, "stdout") << "Invalid port: " << port << endl;
      exit(1);
    }
    if (dialPolicy.attempts < 1 || dialPolicy.initialIntervalMs < 1) {
      CLOG(INFO, "stdout") << "Invalid dial policy in config file" << endl;
      exit(1);
    }

    string rendezvousPath = result["socket"].as<string>();
    bool bridgeRole = !rendezvousPath.empty();

    // The bridge owns the pane's terminal, so it only ever logs to a file.
    LogHandler::setupLogFiles(&defaultConf, result["logdir"].as<string>(),
                              bridgeRole ? "rvbridge" : "rvserver",
                              !bridgeRole && result.count("logtostdout"),
                              bridgeRole, true, maxlogsize);
    LogHandler::setupVerbosity(&defaultConf, verboseLevel, silent);
    // Reconfigure default logger to apply settings above
    el::Loggers::reconfigureLogger("default", defaultConf);
    el::Helpers::setThreadName(bridgeRole ? "bridge-main" : "rvserver-main");
    // Install log rotation callback
    el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);

    if (sodium_init() == -1) {
      STFATAL << "libsodium init failed";
    }
    GOOGLE_PROTOBUF_VERIFY_VERSION;

    if (bridgeRole) {
      runBridge(rendezvousPath, result.count("raw") > 0);
    } else {
      runListener(bindIp, port, keysDir, stateDir, dialPolicy, argv[0]);
    }
  } catch (cxxopts::OptionException& oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  }

  // Uninstall log rotation callback
  el::Helpers::uninstallPreRollOutCallback();
  return 0;
}
