#include "ConsoleSelector.hpp"

#include "ConsoleDescriptors.hpp"

namespace vc {
ConsoleSelector::ConsoleSelector(shared_ptr<ConsoleBackend> _backend)
    : backend(_backend) {}

vector<ConsoleDescriptor> ConsoleSelector::orderByPreference(
    const ConsoleList& consoles) {
  vector<ConsoleDescriptor> ordered(consoles.consoles().begin(),
                                    consoles.consoles().end());
  std::stable_sort(ordered.begin(), ordered.end(),
                   [](const ConsoleDescriptor& a, const ConsoleDescriptor& b) {
                     return a.protocol() == TEXT && b.protocol() != TEXT;
                   });
  return ordered;
}

int ConsoleSelector::attach(const ConsoleList& consoles) {
  for (const auto& descriptor : orderByPreference(consoles)) {
    if (!hasUsableEndpoint(descriptor)) {
      LOG(WARNING) << "Skipping console without an endpoint: "
                   << describeConsole(descriptor);
      continue;
    }
    try {
      LOG(INFO) << "Opening " << describeConsole(descriptor);
      open(descriptor);
      return 0;
    } catch (const std::runtime_error& re) {
      LOG(WARNING) << "Failed to open " << describeConsole(descriptor) << ": "
                   << re.what();
      CLOG(ERROR, "stderr") << "Cannot open " << describeConsole(descriptor)
                            << ": " << re.what() << endl;
    }
  }
  return runFallback(consoles);
}

void ConsoleSelector::open(const ConsoleDescriptor& descriptor) {
  if (descriptor.protocol() == TEXT) {
    if (!descriptor.path().empty()) {
      backend->runTextTunnel(SocketEndpoint(descriptor.path()));
    } else {
      backend->runTextTunnel(SocketEndpoint("127.0.0.1", descriptor.port()));
    }
    return;
  }

  if (!descriptor.path().empty()) {
    int port = backend->startBridge(descriptor.path());
    try {
      backend->launchViewer(port);
    } catch (const std::exception&) {
      backend->stopBridge();
      throw;
    }
    backend->stopBridge();
  } else {
    backend->launchViewer(descriptor.port());
  }
}

int ConsoleSelector::runFallback(const ConsoleList& consoles) {
  string fallback = backend->findFallbackConsole();
  if (fallback.empty() || consoles.domids_size() == 0) {
    LOG(ERROR) << "No console could be opened and no fallback is available";
    CLOG(ERROR, "stderr") << "Failed to find a text console." << endl;
    return 1;
  }
  int64_t domid = consoles.domids(0);
  LOG(INFO) << "Running fallback console " << fallback << " for domain "
            << domid;
  return backend->runFallbackConsole(fallback, domid);
}
}  // namespace vc
