#include <string>

#include "config.h"
#include "test_support.h"

using msgate::gateway::GatewayConfig;
using msgate::gateway::LoadConfig;
using msgate::gateway::test::Check;
using msgate::gateway::test::TempDir;
using msgate::gateway::test::WriteFile;

int main() {
  const auto dir = TempDir("msgate_config_test");

  {
    const auto path = dir / "full.ini";
    WriteFile(path,
              "# gateway\n"
              "[storage]\n"
              "mount_point = /mnt/secure  # volume mount\n"
              "key_path = keys\n"
              "volume_dir=/dev/lvmvolumes\n"
              "mapping_name=msgate\n"
              "test_mode=on\n"
              "[gateway]\n"
              "history_limit=2048\n"
              "notify_seconds=5\n"
              "contact_ext=signal\n"
              "debug_log=1\n"
              "[listener]\n"
              "restart_initial_ms=200\n"
              "restart_max_ms=800\n"
              "[transport]\n"
              "spool_dir=/var/spool/msgate\n"
              "poll_interval_ms=250\n");
    GatewayConfig cfg;
    std::string err;
    if (!Check(LoadConfig(path.string(), cfg, err))) {
      return 1;
    }
    if (!Check(cfg.storage.mount_point == "/mnt/secure" &&
               cfg.storage.key_path == "keys" &&
               cfg.storage.volume_dir == "/dev/lvmvolumes" &&
               cfg.storage.mapping_name == "msgate" &&
               cfg.storage.test_mode)) {
      return 1;
    }
    if (!Check(cfg.gateway.history_limit == 2048 &&
               cfg.gateway.notify_seconds == 5 &&
               cfg.gateway.contact_ext == "signal" && cfg.gateway.debug_log)) {
      return 1;
    }
    if (!Check(cfg.listener.restart_initial_ms == 200 &&
               cfg.listener.restart_max_ms == 800)) {
      return 1;
    }
    if (!Check(cfg.transport.spool_dir == "/var/spool/msgate" &&
               cfg.transport.poll_interval_ms == 250)) {
      return 1;
    }
  }

  {
    const auto path = dir / "defaults.ini";
    WriteFile(path, "[storage]\nmount_point=/mnt/secure\n");
    GatewayConfig cfg;
    std::string err;
    if (!Check(LoadConfig(path.string(), cfg, err))) {
      return 1;
    }
    if (!Check(cfg.gateway.history_limit == 10u * 1024u &&
               cfg.gateway.notify_seconds == 30 &&
               cfg.gateway.contact_ext == "textsecure" &&
               !cfg.storage.test_mode && cfg.storage.key_path == "keys" &&
               cfg.listener.restart_initial_ms == 1000 &&
               cfg.listener.restart_max_ms == 60000 &&
               cfg.transport.spool_dir.empty())) {
      return 1;
    }
  }

  {
    const auto path = dir / "no_mount.ini";
    WriteFile(path, "[gateway]\nhistory_limit=100\n");
    GatewayConfig cfg;
    std::string err;
    if (!Check(!LoadConfig(path.string(), cfg, err) &&
               err == "storage mount_point missing")) {
      return 1;
    }
  }

  {
    const auto path = dir / "bad_value.ini";
    WriteFile(path,
              "[storage]\nmount_point=/mnt/secure\n"
              "[gateway]\nhistory_limit=lots\n");
    GatewayConfig cfg;
    std::string err;
    if (!Check(!LoadConfig(path.string(), cfg, err) &&
               err == "invalid value for history_limit on line 4")) {
      return 1;
    }
  }

  {
    const auto path = dir / "bad_line.ini";
    WriteFile(path, "[storage]\nmount_point\n");
    GatewayConfig cfg;
    std::string err;
    if (!Check(!LoadConfig(path.string(), cfg, err) &&
               err == "invalid line 2")) {
      return 1;
    }
  }

  {
    const auto path = dir / "bad_backoff.ini";
    WriteFile(path,
              "[storage]\nmount_point=/mnt/secure\n"
              "[listener]\nrestart_initial_ms=500\nrestart_max_ms=100\n");
    GatewayConfig cfg;
    std::string err;
    if (!Check(!LoadConfig(path.string(), cfg, err))) {
      return 1;
    }
  }

  {
    const auto path = dir / "bad_ext.ini";
    WriteFile(path,
              "[storage]\nmount_point=/mnt/secure\n"
              "[gateway]\ncontact_ext=../x\n");
    GatewayConfig cfg;
    std::string err;
    if (!Check(!LoadConfig(path.string(), cfg, err))) {
      return 1;
    }
  }

  {
    GatewayConfig cfg;
    std::string err;
    if (!Check(!LoadConfig((dir / "missing.ini").string(), cfg, err))) {
      return 1;
    }
  }

  return 0;
}
