#pragma once
#include "collectors/INetSource.hpp"
#include "collectors/InterfaceCollector.hpp"
#include "collectors/NetCollector.hpp"
#include "collectors/SocketCollector.hpp"

namespace nettui::collectors {

// Linux backend: /proc/net socket tables, /proc/<pid>/comm, getifaddrs and /proc/net/dev.
class ProcfsNetSource : public INetSource {
public:
  bool connections(std::vector<model::RawConnection>& out) override { return sockets_.sample(out); }
  std::optional<std::string> process_name(int32_t pid) override;
  bool interfaces(std::vector<model::RawInterface>& out) override { return ifaces_.sample(out); }
  bool io_counters(std::vector<model::RawIoCounter>& out) override { return counters_.sample(out); }
  const char* name() const override { return "procfs"; }

private:
  SocketCollector sockets_{};
  InterfaceCollector ifaces_{};
  NetCollector counters_{};
};

} // namespace nettui::collectors
