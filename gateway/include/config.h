#ifndef MSGATE_GATEWAY_CONFIG_H
#define MSGATE_GATEWAY_CONFIG_H

#include <cstdint>
#include <string>

namespace msgate::gateway {

struct StorageSection {
  std::string mount_point;
  std::string key_path{"keys"};
  std::string volume_dir{"/dev/lvmvolumes"};
  std::string mapping_name{"msgate"};
  // Skips volume unlock/lock; mount_point is used as a plain directory.
  bool test_mode{false};
};

struct GatewaySection {
  std::uint32_t history_limit{10u * 1024u};
  std::uint32_t notify_seconds{30};
  std::string contact_ext{"textsecure"};
  bool debug_log{false};
};

struct ListenerSection {
  std::uint32_t restart_initial_ms{1000};
  std::uint32_t restart_max_ms{60000};
};

struct TransportSection {
  // Empty selects <mount_point>/textsecure/spool.
  std::string spool_dir;
  std::uint32_t poll_interval_ms{500};
};

struct GatewayConfig {
  StorageSection storage;
  GatewaySection gateway;
  ListenerSection listener;
  TransportSection transport;
};

bool LoadConfig(const std::string& path, GatewayConfig& out_config,
                std::string& error);

}  // namespace msgate::gateway

#endif  // MSGATE_GATEWAY_CONFIG_H
