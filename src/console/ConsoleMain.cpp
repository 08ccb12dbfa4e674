#include <cxxopts.hpp>

#include "ConsoleBackend.hpp"
#include "ConsoleConfig.hpp"
#include "ConsoleDescriptors.hpp"
#include "ConsoleSelector.hpp"
#include "Headers.hpp"
#include "LogHandler.hpp"
#include "PipeSocketHandler.hpp"
#include "SubprocessUtils.hpp"
#include "TcpSocketHandler.hpp"

using namespace vc;

void handleParseException(std::exception& e, cxxopts::Options& options) {
  CLOG(INFO, "stdout") << "Exception: " << e.what() << "\n" << endl;
  CLOG(INFO, "stdout") << options.help({}) << endl;
  exit(1);
}

// Descriptors given as flags go after the ones read from JSON.
void addFlagDescriptors(const cxxopts::ParseResult& result,
                        ConsoleList* consoles) {
  if (result.count("name")) {
    consoles->set_name(result["name"].as<string>());
  }
  if (result.count("domid")) {
    consoles->add_domids(result["domid"].as<int64_t>());
  }
  if (result.count("text-path")) {
    auto* descriptor = consoles->add_consoles();
    descriptor->set_protocol(TEXT);
    descriptor->set_path(result["text-path"].as<string>());
  }
  if (result.count("text-port")) {
    auto* descriptor = consoles->add_consoles();
    descriptor->set_protocol(TEXT);
    descriptor->set_port(result["text-port"].as<int>());
  }
  if (result.count("graphical-path")) {
    auto* descriptor = consoles->add_consoles();
    descriptor->set_protocol(GRAPHICAL);
    descriptor->set_path(result["graphical-path"].as<string>());
  }
  if (result.count("graphical-port")) {
    auto* descriptor = consoles->add_consoles();
    descriptor->set_protocol(GRAPHICAL);
    descriptor->set_port(result["graphical-port"].as<int>());
  }
}

int main(int argc, char** argv) {
  string tmpDir = GetTempDirectory();

  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();
  LogHandler::setupStderrLogger();

  vc::HandleTerminate();

  // Override easylogging handler for sigint
  ::signal(SIGINT, vc::InterruptSignalHandler);

  cxxopts::Options options("vmconsole",
                           "Attach the local terminal to a VM console");
  try {
    options.positional_help("[connect|list]");

    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("command", "connect (default) or list",
         cxxopts::value<std::string>()->default_value("connect"))  //
        ("d,descriptors",
         "JSON file describing the VM consoles ('-' reads stdin)",
         cxxopts::value<std::string>())  //
        ("name", "VM name", cxxopts::value<std::string>())  //
        ("domid", "Domain id passed to the fallback console",
         cxxopts::value<int64_t>())  //
        ("text-path", "Unix socket of a text console",
         cxxopts::value<std::string>())  //
        ("text-port", "Local TCP port of a text console",
         cxxopts::value<int>())  //
        ("graphical-path", "Unix socket of a graphical (RFB) console",
         cxxopts::value<std::string>())  //
        ("graphical-port", "Local TCP port of a graphical (RFB) console",
         cxxopts::value<int>())  //
        ("retry-ceiling", "Give up reconnecting once the delay exceeds this",
         cxxopts::value<int>())  //
        ("viewer", "Graphical viewer binary", cxxopts::value<std::string>())  //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>())  //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>())  //
        ("l,logdir", "Base directory for log files.",
         cxxopts::value<std::string>()->default_value(tmpDir))  //
        ("logtostdout", "Write log to stdout")                  //
        ("silent", "Disable logging");

    options.parse_positional({"command"});
    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }

    if (result.count("version")) {
      CLOG(INFO, "stdout") << "vmconsole version " << VC_VERSION << endl;
      exit(0);
    }

    ConsoleConfig config;
    string cfgfilename = result.count("cfgfile")
                             ? result["cfgfile"].as<string>()
                             : findDefaultConfigFile();
    if (!cfgfilename.empty()) {
      loadConsoleConfig(cfgfilename, &config);
    }

    if (result.count("verbose")) {
      config.verbose = result["verbose"].as<int>();
    }
    if (result.count("silent")) {
      config.silent = true;
    }
    if (result.count("retry-ceiling")) {
      int ceiling = result["retry-ceiling"].as<int>();
      if (ceiling < 0) {
        CLOG(INFO, "stdout") << "Retry ceiling must not be negative" << endl;
        exit(1);
      }
      config.tunnel.retryCeiling = std::chrono::milliseconds(ceiling);
    }
    if (result.count("viewer")) {
      config.viewerBinary = result["viewer"].as<string>();
    }

    el::Loggers::setVerboseLevel(config.verbose);
    if (config.silent) {
      defaultConf.setGlobally(el::ConfigurationType::Enabled, "false");
    }

    LogHandler::setupLogFiles(&defaultConf, result["logdir"].as<string>(),
                              "vmconsole", result.count("logtostdout"), false,
                              config.maxLogSize);

    el::Loggers::reconfigureLogger("default", defaultConf);
    // set thread name
    el::Helpers::setThreadName("console-main");

    // Install log rotation callback
    el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);

    GOOGLE_PROTOBUF_VERIFY_VERSION;

    ConsoleList consoles;
    if (result.count("descriptors")) {
      consoles = loadConsoleList(result["descriptors"].as<string>());
    }
    addFlagDescriptors(result, &consoles);
    VLOG(1) << "Consoles: " << consoleListToJson(consoles).dump();

    string command = result["command"].as<string>();
    if (command == "list") {
      LOG(INFO) << "Listing consoles: " << consoleListToJson(consoles).dump();
      CLOG(INFO, "stdout") << formatConsoleTable(consoles);
      exit(0);
    }
    if (command != "connect") {
      CLOG(INFO, "stdout") << "Unknown command: " << command << endl;
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(1);
    }

    shared_ptr<SocketHandler> pipeSocketHandler(new PipeSocketHandler());
    shared_ptr<SocketHandler> tcpSocketHandler(new TcpSocketHandler());
    shared_ptr<SubprocessUtils> subprocessUtils(new SubprocessUtils());
    shared_ptr<ConsoleBackend> backend(new LocalConsoleBackend(
        pipeSocketHandler, tcpSocketHandler, subprocessUtils, config));

    int status = ConsoleSelector(backend).attach(consoles);
    LOG(INFO) << "Console session finished with status " << status;

    // Uninstall log rotation callback
    el::Helpers::uninstallPreRollOutCallback();
    exit(status);
  } catch (cxxopts::exceptions::exception& oe) {
    handleParseException(oe, options);
  } catch (const ConfigException& ce) {
    CLOG(ERROR, "stderr") << ce.what() << endl;
    exit(1);
  } catch (const DescriptorParseException& de) {
    CLOG(ERROR, "stderr") << de.what() << endl;
    exit(1);
  }
  return 0;
}
